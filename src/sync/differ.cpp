#include "dsync/sync/differ.hpp"

namespace dsync::sync {

DiffPlan Differ::diff(const TreeSnapshot& source, const TreeSnapshot& dest) {
    DiffPlan plan;
    for (const auto& [path, entry] : source.files) {
        auto it = dest.files.find(path);
        if (it == dest.files.end() || !same_content(entry, it->second)) {
            plan.push_back(CopyAction{entry.id, path});
        }
    }
    return plan;
}

std::vector<std::string> Differ::missing_folders(const TreeSnapshot& source, const TreeSnapshot& dest) {
    // FolderMap iterates by depth, so the result is already parents-first
    std::vector<std::string> missing;
    for (const auto& [path, id] : source.folders) {
        if (dest.folders.find(path) == dest.folders.end()) {
            missing.push_back(path);
        }
    }
    return missing;
}

bool Differ::same_content(const FileEntry& source, const FileEntry& dest) {
    if (source.size != dest.size) {
        return false;
    }
    if (source.content_hash && dest.content_hash) {
        return *source.content_hash == *dest.content_hash;
    }
    return true;
}

} // namespace dsync::sync
