#pragma once

#include "dsync/sync/remote_ops.hpp"

#include <functional>
#include <string>

namespace dsync::sync {

using LineSink = std::function<void(const std::string&)>;

/**
 * @brief Writes the tree below root_id as indented lines
 *
 * Two spaces per level; folders end with '/', files show their size.
 * Children are listed in the order the service returns them. An unreadable
 * subfolder is printed as a marker line and skipped; only a failure to list
 * the root is returned as an error.
 */
dsync::Result<void, remote::RemoteError> print_structure(RemoteOperations& ops,
                                                         const std::string& root_id,
                                                         const LineSink& sink);

} // namespace dsync::sync
