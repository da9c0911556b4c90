#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dsync::sync {

/**
 * @brief Orders relative paths by depth first, then byte-wise
 *
 * Iterating a map keyed with this comparator visits every parent folder
 * before any of its descendants.
 */
struct PathDepthLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/**
 * @brief File metadata captured during enumeration
 */
struct FileEntry {
    std::string id;
    std::uint64_t size = 0;
    std::optional<std::string> content_hash; ///< Absent for native documents / unknown checksum
    std::string mime_type;
};

using FileMap = std::map<std::string, FileEntry, PathDepthLess>;     ///< relative path -> file
using FolderMap = std::map<std::string, std::string, PathDepthLess>; ///< relative path -> folder id

/**
 * @brief Immutable enumeration result for one root
 *
 * Paths are relative to the root ("a/b.txt"), '/'-joined and case sensitive.
 * Every file path has all of its ancestor folders in `folders` (the root
 * itself is implicit). A subtree whose listing failed is absent; such folders
 * are recorded in `failed_folders` and `complete` is false.
 */
struct TreeSnapshot {
    std::string root_id;
    FileMap files;
    FolderMap folders;
    bool complete = true;
    std::vector<std::string> failed_folders; ///< Relative paths ("" is the root)
};

/**
 * @brief One planned copy: source file id and its path relative to the roots
 */
struct CopyAction {
    std::string source_id;
    std::string relative_path;

    bool operator==(const CopyAction& other) const {
        return source_id == other.source_id && relative_path == other.relative_path;
    }
};

using DiffPlan = std::vector<CopyAction>;

enum class RunState {
    Init,
    Preflight,
    EnumerateSource,
    EnumerateDest,
    Diff,
    CreateFolders,
    CopyFiles,
    Validate,
    Done,
    Failed
};

const char* to_string(RunState state);

enum class DiscrepancyKind {
    MissingFile,
    SizeMismatch,
    HashMismatch,
    MissingFolder,
    ExtraFolder
};

const char* to_string(DiscrepancyKind kind);

/**
 * @brief A reported difference between two trees; never an exception
 */
struct Discrepancy {
    DiscrepancyKind kind = DiscrepancyKind::MissingFile;
    std::string path;
    std::uint64_t source_size = 0;
    std::uint64_t dest_size = 0;
    std::string detail;
};

// Path helpers ---------------------------------------------------------------

/// Number of '/' separators: "a" -> 0, "a/b" -> 1
std::size_t path_depth(const std::string& path);

/// "a/b/c" -> "a/b", "a" -> ""
std::string parent_path(const std::string& path);

/// "a/b/c" -> "c"
std::string leaf_name(const std::string& path);

/// "a/b/c" -> {"a", "b", "c"}
std::vector<std::string> split_path(const std::string& path);

/// join_path("", "x") -> "x", join_path("a", "x") -> "a/x"
std::string join_path(const std::string& parent, const std::string& name);

} // namespace dsync::sync
