#include "dsync/sync/remote_ops.hpp"

#include "dsync/cache/keys.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

using dsync::remote::ListPage;
using dsync::remote::NodeKind;
using dsync::remote::RemoteError;
using dsync::remote::RemoteNode;

namespace dsync::sync {

RemoteOperations::RemoteOperations(remote::RemoteService& service,
                                   governor::RateGovernor& governor,
                                   cache::ResponseCache& cache)
    : service_(service), governor_(governor), cache_(cache) {}

RemoteResult<RemoteNode> RemoteOperations::verify_folder_exists(const std::string& folder_id) {
    auto result = governor_.execute_with_retry("get_metadata", [&] { return service_.get_metadata(folder_id); });
    if (result.is_error()) {
        return result;
    }
    if (!result.value().is_folder()) {
        return dsync::Err(RemoteError::permanent(400, "notAFolder", "Item is not a folder: " + folder_id));
    }
    return result;
}

RemoteResult<RemoteNode> RemoteOperations::item_details(const std::string& item_id) {
    const auto key = cache::keys::details(item_id);
    if (auto cached = cache_.get_as<RemoteNode>(key)) {
        return dsync::Ok(std::move(*cached));
    }

    auto result = governor_.execute_with_retry("get_metadata", [&] { return service_.get_metadata(item_id); });
    if (result.is_ok()) {
        cache_.set(key, result.value());
    }
    return result;
}

RemoteResult<ListPage> RemoteOperations::list_page(const std::string& folder_id,
                                                   const std::optional<std::string>& page_token) {
    return governor_.execute_with_retry("list_children", [&] { return service_.list_children(folder_id, page_token); });
}

RemoteResult<std::vector<RemoteNode>> RemoteOperations::list_all(const std::string& folder_id) {
    const auto key = cache::keys::folder_contents(folder_id);
    if (auto cached = cache_.get_as<std::vector<RemoteNode>>(key)) {
        return dsync::Ok(std::move(*cached));
    }

    std::vector<RemoteNode> contents;
    std::optional<std::string> token;
    do {
        auto page = list_page(folder_id, token);
        if (page.is_error()) {
            return dsync::Err(page.error());
        }
        auto& items = page.value().items;
        contents.insert(contents.end(), std::make_move_iterator(items.begin()), std::make_move_iterator(items.end()));
        token = page.value().next_page_token;
    } while (token);

    cache_.set(key, contents);
    return dsync::Ok(std::move(contents));
}

RemoteResult<std::size_t> RemoteOperations::count_items(const std::string& folder_id) {
    const auto key = cache::keys::item_count(folder_id);
    if (auto cached = cache_.get_as<std::size_t>(key)) {
        return dsync::Ok(*cached);
    }

    std::size_t total = 0;
    std::vector<std::string> pending{folder_id};
    while (!pending.empty()) {
        const auto current = std::move(pending.back());
        pending.pop_back();

        std::optional<std::string> token;
        do {
            auto page = list_page(current, token);
            if (page.is_error()) {
                return dsync::Err(page.error());
            }
            for (const auto& item : page.value().items) {
                ++total;
                if (item.is_folder()) {
                    pending.push_back(item.id);
                }
            }
            token = page.value().next_page_token;
        } while (token);
    }

    cache_.set(key, total);
    return dsync::Ok(total);
}

RemoteResult<std::optional<RemoteNode>> RemoteOperations::find_folder(const std::string& parent_id,
                                                                      const std::string& name) {
    return find_child(parent_id, name, NodeKind::Folder, cache::keys::folder_by_name(parent_id, name));
}

RemoteResult<std::optional<RemoteNode>> RemoteOperations::find_file(const std::string& parent_id,
                                                                    const std::string& name) {
    return find_child(parent_id, name, NodeKind::File, cache::keys::file_in_folder(parent_id, name));
}

RemoteResult<FolderOutcome> RemoteOperations::ensure_folder(const std::string& name, const std::string& parent_id) {
    auto existing = find_folder(parent_id, name);
    if (existing.is_error()) {
        return dsync::Err(existing.error());
    }
    if (existing.value()) {
        spdlog::debug("Folder '{}' already exists (ID: {})", name, existing.value()->id);
        return dsync::Ok(FolderOutcome{existing.value()->id, false});
    }

    auto created = governor_.execute_with_retry("create_folder", [&] { return service_.create_folder(name, parent_id); });
    if (created.is_error()) {
        return dsync::Err(created.error());
    }
    const auto new_id = created.value();

    auto verified = verify_folder_exists(new_id);
    if (verified.is_error()) {
        return dsync::Err(RemoteError::permanent(verified.error().status, "verifyFailed",
                                                 "Created folder '" + name + "' is not readable: " + verified.error().describe()));
    }

    cache_.remove(cache::keys::folder_contents(parent_id));
    cache_.remove(cache::keys::item_count(parent_id));
    cache_.set(cache::keys::folder_by_name(parent_id, name), verified.value());
    return dsync::Ok(FolderOutcome{new_id, true});
}

RemoteResult<CopyOutcome> RemoteOperations::copy_file(const std::string& source_id,
                                                      const std::string& dest_parent_id,
                                                      const std::string& dest_name) {
    auto source = item_details(source_id);
    if (source.is_error()) {
        return dsync::Err(source.error());
    }

    auto existing = find_file(dest_parent_id, dest_name);
    if (existing.is_error()) {
        return dsync::Err(existing.error());
    }
    if (existing.value() && files_match(source.value(), *existing.value())) {
        return dsync::Ok(CopyOutcome{existing.value()->id, true});
    }

    auto copied = governor_.execute_with_retry("copy_file", [&] {
        return service_.copy_file(source_id, dest_parent_id, dest_name);
    });
    if (copied.is_error()) {
        return dsync::Err(copied.error());
    }

    cache_.remove(cache::keys::file_in_folder(dest_parent_id, dest_name));
    cache_.remove(cache::keys::folder_contents(dest_parent_id));
    cache_.remove(cache::keys::item_count(dest_parent_id));
    return dsync::Ok(CopyOutcome{copied.value(), false});
}

bool RemoteOperations::files_match(const RemoteNode& source, const RemoteNode& dest) {
    if (source.content_hash && dest.content_hash
        && *source.content_hash == *dest.content_hash
        && source.size == dest.size) {
        return true;
    }

    if (source.is_native_document() && dest.is_native_document()) {
        return source.mime_type == dest.mime_type;
    }
    return false;
}

RemoteResult<std::optional<RemoteNode>> RemoteOperations::find_child(const std::string& parent_id,
                                                                     const std::string& name,
                                                                     NodeKind kind,
                                                                     const std::string& cache_key) {
    if (auto cached = cache_.get_as<RemoteNode>(cache_key)) {
        return dsync::Ok(std::optional<RemoteNode>(std::move(*cached)));
    }

    auto found = governor_.execute_with_retry("find_by_name", [&] {
        return service_.find_by_name(parent_id, name, kind);
    });
    if (found.is_error()) {
        if (found.error().is_not_found()) {
            return dsync::Ok(std::optional<RemoteNode>{});
        }
        return dsync::Err(found.error());
    }

    cache_.set(cache_key, found.value());
    return dsync::Ok(std::optional<RemoteNode>(std::move(found.value())));
}

} // namespace dsync::sync
