#pragma once

#include "dsync/core/result.hpp"
#include "dsync/remote/types.hpp"

#include <optional>
#include <string>

namespace dsync::remote {

template<typename T>
using RemoteResult = dsync::Result<T, RemoteError>;

/**
 * @brief Capability contract required from a remote file store
 *
 * Every call must be safe to retry and must classify its failures as
 * Retriable or Permanent. Implementations do not rate limit, retry or
 * cache: that is the job of the governor and cache wrapping them.
 */
class RemoteService {
public:
    virtual ~RemoteService() = default;

    /// Metadata for a single item; NotFound is a Permanent error with reason "notFound"
    virtual RemoteResult<RemoteNode> get_metadata(const std::string& id) = 0;

    /// One page of the direct (non-trashed) children of parent_id
    virtual RemoteResult<ListPage> list_children(const std::string& parent_id,
                                                 const std::optional<std::string>& page_token) = 0;

    /// First child of parent_id named `name` (optionally restricted to `kind`), or NotFound
    virtual RemoteResult<RemoteNode> find_by_name(const std::string& parent_id,
                                                  const std::string& name,
                                                  std::optional<NodeKind> kind) = 0;

    /// Creates a folder and returns its id
    virtual RemoteResult<std::string> create_folder(const std::string& name,
                                                    const std::string& parent_id) = 0;

    /// Server-side copy of a file's content; returns the id of the new file
    virtual RemoteResult<std::string> copy_file(const std::string& source_id,
                                                const std::string& dest_parent_id,
                                                const std::string& dest_name) = 0;
};

} // namespace dsync::remote
