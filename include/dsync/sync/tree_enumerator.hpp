#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/sync/remote_ops.hpp"
#include "dsync/sync/types.hpp"

#include <memory>
#include <string>

namespace dsync::sync {

using SnapshotPtr = std::shared_ptr<const TreeSnapshot>;

struct EnumeratorOptions {
    bool count_total = true; ///< Pre-count items so page events carry a percentage
    bool use_cache = true;   ///< Serve and store whole snapshots in the response cache
};

/**
 * @brief Lists a remote tree into a flat TreeSnapshot
 *
 * Walks the tree with an explicit stack of (folder id, relative path), so
 * depth is bounded only by memory. Each folder is listed page by page until
 * the service stops returning a page token.
 *
 * A listing error on the root's first page fails the whole enumeration. A
 * listing error anywhere else is logged and leaves that subtree out of the
 * snapshot (complete == false); retrying transient errors is the governor's
 * job, not the enumerator's. An item whose name contains '/' cannot be
 * keyed by path; it is left out the same way and marks the snapshot
 * incomplete. Only complete snapshots are cached.
 */
class TreeEnumerator {
public:
    TreeEnumerator(RemoteOperations& ops, events::EventBus& bus, EnumeratorOptions options = {});

    RemoteResult<SnapshotPtr> enumerate(const std::string& root_id);

    /// Drops the cached snapshot and item count of root_id so the next enumerate() re-lists and re-counts it
    void invalidate(const std::string& root_id);

private:
    RemoteOperations& ops_;
    events::EventBus& bus_;
    EnumeratorOptions options_;
};

} // namespace dsync::sync
