#pragma once

#include "dsync/sync/types.hpp"

#include <string>
#include <vector>

namespace dsync::sync {

/**
 * @brief Computes what the destination lacks relative to the source
 *
 * A source file is planned for copy when it is absent from the destination,
 * when the sizes differ (even if a hash is unknown on either side), or when
 * both sides carry a content hash and the hashes differ. Destination-only
 * items are never planned: the diff only ever adds.
 */
class Differ {
public:
    /// Files to copy, in source snapshot order (shallow paths first)
    static DiffPlan diff(const TreeSnapshot& source, const TreeSnapshot& dest);

    /// Folder paths present in source but not in dest, shallowest first
    static std::vector<std::string> missing_folders(const TreeSnapshot& source, const TreeSnapshot& dest);

    /// True when `dest` needs no copy to match `source`
    static bool same_content(const FileEntry& source, const FileEntry& dest);
};

} // namespace dsync::sync
