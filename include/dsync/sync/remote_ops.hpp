#pragma once

#include "dsync/cache/response_cache.hpp"
#include "dsync/governor/rate_governor.hpp"
#include "dsync/remote/service.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dsync::sync {

template<typename T>
using RemoteResult = remote::RemoteResult<T>;

struct FolderOutcome {
    std::string id;
    bool created = false; ///< false when a same-named folder already existed
};

struct CopyOutcome {
    std::string id;       ///< New file id, or the id of the identical file already present
    bool skipped = false; ///< true when an identical file was already at the destination
};

/**
 * @brief Remote calls as the sync components use them
 *
 * Every call passes through the shared RateGovernor. Lookups go through the
 * ResponseCache first, and mutations remove the cache keys they make stale.
 */
class RemoteOperations {
public:
    RemoteOperations(remote::RemoteService& service,
                     governor::RateGovernor& governor,
                     cache::ResponseCache& cache);

    /// Uncached existence check; succeeds only for an accessible folder
    RemoteResult<remote::RemoteNode> verify_folder_exists(const std::string& folder_id);

    /// Metadata of a single item (cached)
    RemoteResult<remote::RemoteNode> item_details(const std::string& item_id);

    /// One listing page, governed but never cached
    RemoteResult<remote::ListPage> list_page(const std::string& folder_id,
                                             const std::optional<std::string>& page_token);

    /// All direct children across every page (cached)
    RemoteResult<std::vector<remote::RemoteNode>> list_all(const std::string& folder_id);

    /// Recursive number of items below folder_id (cached); used as a progress total
    RemoteResult<std::size_t> count_items(const std::string& folder_id);

    /// Same-named child folder, nullopt when absent (positive hits cached)
    RemoteResult<std::optional<remote::RemoteNode>> find_folder(const std::string& parent_id,
                                                                const std::string& name);

    /// Same-named child file, nullopt when absent (positive hits cached)
    RemoteResult<std::optional<remote::RemoteNode>> find_file(const std::string& parent_id,
                                                              const std::string& name);

    /**
     * @brief Idempotent folder creation
     *
     * Reuses an existing same-named folder under parent_id; otherwise creates
     * one, confirms it is readable and invalidates the parent's listing.
     */
    RemoteResult<FolderOutcome> ensure_folder(const std::string& name, const std::string& parent_id);

    /**
     * @brief Idempotent file copy
     *
     * Skips the copy when dest_parent_id already holds an identical
     * same-named file (see files_match()).
     */
    RemoteResult<CopyOutcome> copy_file(const std::string& source_id,
                                        const std::string& dest_parent_id,
                                        const std::string& dest_name);

    /**
     * @brief Equality used for idempotent skips
     *
     * Equal size and equal non-null content hash; or, for native documents
     * without a byte checksum, the same native document type on both sides.
     */
    static bool files_match(const remote::RemoteNode& source, const remote::RemoteNode& dest);

    governor::RateGovernor& governor() noexcept { return governor_; }
    cache::ResponseCache& cache() noexcept { return cache_; }

private:
    RemoteResult<std::optional<remote::RemoteNode>> find_child(const std::string& parent_id,
                                                               const std::string& name,
                                                               remote::NodeKind kind,
                                                               const std::string& cache_key);

    remote::RemoteService& service_;
    governor::RateGovernor& governor_;
    cache::ResponseCache& cache_;
};

} // namespace dsync::sync
