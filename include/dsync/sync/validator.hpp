#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/sync/remote_ops.hpp"
#include "dsync/sync/tree_enumerator.hpp"
#include "dsync/sync/types.hpp"

#include <string>
#include <vector>

namespace dsync::sync {

struct ValidationReport {
    bool passed = false;
    std::vector<Discrepancy> discrepancies;
    SnapshotPtr source;
    SnapshotPtr dest;

    /// Files that are absent or differ, in source order; the repair pass copies these
    [[nodiscard]] DiffPlan repair_plan() const;
};

/**
 * @brief Post-copy check that every source file reached the destination
 *
 * Read-only. Each validate() drops both cached snapshots and lists the two
 * trees again, so the verdict always reflects the remote state at call time.
 * A report passes only when both listings were complete and no discrepancy
 * was found.
 */
class Validator {
public:
    Validator(RemoteOperations& ops, events::EventBus& bus);

    RemoteResult<ValidationReport> validate(const std::string& source_root, const std::string& dest_root);

    /// Paths present in the source tree but not in the destination tree
    RemoteResult<std::vector<std::string>> missing_files(const std::string& source_root, const std::string& dest_root);

    /// Missing files, size and hash mismatches, missing folders
    static std::vector<Discrepancy> compare(const TreeSnapshot& source, const TreeSnapshot& dest);

private:
    RemoteOperations& ops_;
    events::EventBus& bus_;
    TreeEnumerator enumerator_;
};

} // namespace dsync::sync
