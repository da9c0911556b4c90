#pragma once

#include <string>

// Deterministic cache keys: operation name plus arguments. Ids never contain
// '/', so it separates a parent id from a child name unambiguously.
namespace dsync::cache::keys {

inline std::string tree(const std::string& root_id) {
    return "tree_" + root_id;
}

inline std::string details(const std::string& item_id) {
    return "details_" + item_id;
}

inline std::string folder_contents(const std::string& folder_id) {
    return "folder_contents_" + folder_id;
}

inline std::string item_count(const std::string& folder_id) {
    return "item_count_" + folder_id;
}

inline std::string folder_by_name(const std::string& parent_id, const std::string& name) {
    return "folder_by_name_" + parent_id + "/" + name;
}

inline std::string file_in_folder(const std::string& parent_id, const std::string& name) {
    return "file_in_folder_" + parent_id + "/" + name;
}

} // namespace dsync::cache::keys
