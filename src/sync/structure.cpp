#include "dsync/sync/structure.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace dsync::sync {
namespace {

struct Pending {
    std::string id;
    std::string name;
    std::size_t depth;
    bool folder;
    std::uint64_t size;
};

} // namespace

dsync::Result<void, remote::RemoteError> print_structure(RemoteOperations& ops,
                                                         const std::string& root_id,
                                                         const LineSink& sink) {
    auto root = ops.list_all(root_id);
    if (root.is_error()) {
        return dsync::Err(root.error());
    }

    std::vector<Pending> stack;
    auto push_children = [&stack](const std::vector<remote::RemoteNode>& items, std::size_t depth) {
        for (auto it = items.rbegin(); it != items.rend(); ++it) {
            stack.push_back(Pending{it->id, it->name, depth, it->is_folder(), it->size});
        }
    };
    push_children(root.value(), 0);

    while (!stack.empty()) {
        const Pending item = std::move(stack.back());
        stack.pop_back();

        const std::string indent(item.depth * 2, ' ');
        if (!item.folder) {
            sink(indent + item.name + " (" + std::to_string(item.size) + " bytes)");
            continue;
        }

        sink(indent + item.name + "/");
        auto children = ops.list_all(item.id);
        if (children.is_error()) {
            spdlog::error("Error listing folder '{}': {}", item.name, children.error().describe());
            sink(indent + "  [unreadable: " + children.error().describe() + "]");
            continue;
        }
        push_children(children.value(), item.depth + 1);
    }
    return dsync::Ok();
}

} // namespace dsync::sync
