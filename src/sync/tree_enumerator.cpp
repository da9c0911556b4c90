#include "dsync/sync/tree_enumerator.hpp"

#include "dsync/cache/keys.hpp"
#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace dsync::sync {
namespace {

struct PendingFolder {
    std::string folder_id;
    std::string path; ///< "" for the root
};

} // namespace

TreeEnumerator::TreeEnumerator(RemoteOperations& ops, events::EventBus& bus, EnumeratorOptions options)
    : ops_(ops), bus_(bus), options_(options) {}

RemoteResult<SnapshotPtr> TreeEnumerator::enumerate(const std::string& root_id) {
    const auto key = cache::keys::tree(root_id);
    if (options_.use_cache) {
        if (auto cached = ops_.cache().get_as<SnapshotPtr>(key)) {
            spdlog::debug("Serving snapshot of {} from cache ({} files, {} folders)",
                          root_id, (*cached)->files.size(), (*cached)->folders.size());
            return dsync::Ok(*cached);
        }
    }

    std::size_t total = 0;
    if (options_.count_total) {
        auto counted = ops_.count_items(root_id);
        if (counted.is_ok()) {
            total = counted.value();
        } else {
            spdlog::warn("Could not count items below {}: {}", root_id, counted.error().describe());
        }
    }

    auto snapshot = std::make_shared<TreeSnapshot>();
    snapshot->root_id = root_id;

    std::size_t processed = 0;
    std::vector<PendingFolder> stack{{root_id, ""}};

    while (!stack.empty()) {
        PendingFolder current = std::move(stack.back());
        stack.pop_back();

        std::vector<PendingFolder> subfolders;
        std::optional<std::string> token;
        bool first_page = true;
        do {
            auto page = ops_.list_page(current.folder_id, token);
            if (page.is_error()) {
                if (current.path.empty() && first_page) {
                    spdlog::error("Cannot list root folder {}: {}", root_id, page.error().describe());
                    return dsync::Err(page.error());
                }
                spdlog::error("Error listing folder '{}' ({}): {}", current.path, current.folder_id, page.error().describe());
                snapshot->complete = false;
                snapshot->failed_folders.push_back(current.path);
                bus_.emit(events::SubtreeSkippedEvent{root_id, current.path, page.error().describe()});
                break;
            }
            first_page = false;

            for (const auto& item : page.value().items) {
                ++processed;
                const auto item_path = join_path(current.path, item.name);
                if (item.name.find('/') != std::string::npos) {
                    // Not representable as a relative path; the run must not pass over it quietly
                    spdlog::error("Cannot map '{}' ({}): name contains '/'", item_path, item.id);
                    snapshot->complete = false;
                    snapshot->failed_folders.push_back(item_path);
                    bus_.emit(events::SubtreeSkippedEvent{root_id, item_path, "name contains '/'"});
                    continue;
                }
                if (item.is_folder()) {
                    snapshot->folders[item_path] = item.id;
                    subfolders.push_back({item.id, item_path});
                } else {
                    snapshot->files[item_path] = FileEntry{item.id, item.size, item.content_hash, item.mime_type};
                }
            }

            bus_.emit(events::EnumerationPageEvent{root_id, current.folder_id, page.value().items.size(),
                                                   processed, total > 0 ? std::max(total, processed) : 0});
            token = page.value().next_page_token;
        } while (token);

        // Reverse so the first listed subfolder is visited next (pre-order)
        for (auto it = subfolders.rbegin(); it != subfolders.rend(); ++it) {
            stack.push_back(std::move(*it));
        }
    }

    spdlog::info("Enumerated {}: {} files, {} folders{}", root_id, snapshot->files.size(),
                 snapshot->folders.size(), snapshot->complete ? "" : " (incomplete)");

    SnapshotPtr result = snapshot;
    if (options_.use_cache && result->complete) {
        ops_.cache().set(key, result);
    }
    return dsync::Ok(result);
}

void TreeEnumerator::invalidate(const std::string& root_id) {
    // Mutations only drop the direct parent's count, so the root's recursive count goes too
    ops_.cache().remove(cache::keys::tree(root_id));
    ops_.cache().remove(cache::keys::item_count(root_id));
}

} // namespace dsync::sync
