#include "dsync/sync/types.hpp"

#include <algorithm>

namespace dsync::sync {

bool PathDepthLess::operator()(const std::string& lhs, const std::string& rhs) const {
    const auto lhs_depth = path_depth(lhs);
    const auto rhs_depth = path_depth(rhs);
    if (lhs_depth != rhs_depth) {
        return lhs_depth < rhs_depth;
    }
    return lhs < rhs;
}

const char* to_string(RunState state) {
    switch (state) {
        case RunState::Init: return "Init";
        case RunState::Preflight: return "Preflight";
        case RunState::EnumerateSource: return "EnumerateSource";
        case RunState::EnumerateDest: return "EnumerateDest";
        case RunState::Diff: return "Diff";
        case RunState::CreateFolders: return "CreateFolders";
        case RunState::CopyFiles: return "CopyFiles";
        case RunState::Validate: return "Validate";
        case RunState::Done: return "Done";
        case RunState::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(DiscrepancyKind kind) {
    switch (kind) {
        case DiscrepancyKind::MissingFile: return "missing_file";
        case DiscrepancyKind::SizeMismatch: return "size_mismatch";
        case DiscrepancyKind::HashMismatch: return "hash_mismatch";
        case DiscrepancyKind::MissingFolder: return "missing_folder";
        case DiscrepancyKind::ExtraFolder: return "extra_folder";
    }
    return "unknown";
}

std::size_t path_depth(const std::string& path) {
    return static_cast<std::size_t>(std::count(path.begin(), path.end(), '/'));
}

std::string parent_path(const std::string& path) {
    const auto pos = path.rfind('/');
    return pos == std::string::npos ? std::string{} : path.substr(0, pos);
}

std::string leaf_name(const std::string& path) {
    const auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    if (path.empty()) {
        return parts;
    }
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto pos = path.find('/', start);
        if (pos == std::string::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join_path(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace dsync::sync
