#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/sync/remote_ops.hpp"
#include "dsync/sync/run.hpp"
#include "dsync/sync/tree_enumerator.hpp"
#include "dsync/sync/types.hpp"
#include "dsync/sync/validator.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dsync::sync {

struct SyncOptions {
    std::string source_root;
    std::string dest_root;
    std::size_t batch_size = 100;  ///< Copies between progress checkpoints
    bool final_validation = true;
    bool auto_fix_missing = true;  ///< One repair pass after a failed validation
    bool dry_run = false;          ///< Stop after Diff, mutate nothing
};

struct SyncResult {
    bool success = false;
    RunState final_state = RunState::Init;
    std::vector<RunState> states;
    std::string error;

    DiffPlan plan;
    std::vector<std::string> missing_folders;
    bool source_complete = true;
    bool dest_complete = true;

    std::size_t successful_copies = 0;
    std::size_t skipped_copies = 0;
    std::size_t failed_copies = 0;
    std::size_t created_folders = 0;
    std::size_t skipped_folders = 0;
    std::size_t failed_folders = 0;
    std::vector<std::string> failed_paths;

    bool validated = false;
    bool validation_passed = false;
    bool repaired = false;
    std::vector<Discrepancy> discrepancies;
};

/**
 * @brief Relative path -> folder id of the destination tree, shared by the
 * folder and copy passes
 *
 * Starts from the destination snapshot and grows as folders are created, so
 * a child always sees the id its parent was just given.
 */
class DestinationFolders {
public:
    DestinationFolders(std::string root_id, const FolderMap& existing);

    /// Id for a relative path; "" resolves to the root
    std::optional<std::string> get(const std::string& path) const;
    void set(const std::string& path, const std::string& id);
    bool contains(const std::string& path) const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::string root_id_;
    FolderMap folders_;
};

/**
 * @brief Drives one source -> destination synchronization
 *
 * Runs the SyncRun state machine: preflight both roots, enumerate both
 * trees, diff, create missing folders shallowest first, copy planned files,
 * then optionally validate. Per-item failures are counted and the pass goes
 * on; preflight and root enumeration failures end the run in Failed.
 *
 * The destination only ever gains items: nothing is deleted or overwritten
 * in place.
 */
class SyncEngine {
public:
    SyncEngine(RemoteOperations& ops, events::EventBus& bus);

    SyncResult run(const SyncOptions& options);

private:
    void create_folders(const std::vector<std::string>& paths, DestinationFolders& folders, SyncResult& result);
    void copy_files(const DiffPlan& plan, const TreeSnapshot& source, DestinationFolders& folders,
                    const SyncOptions& options, SyncResult& result);
    RemoteResult<std::string> resolve_parent(const std::string& parent_path, DestinationFolders& folders,
                                             SyncResult& result);
    std::optional<ValidationReport> validate(const SyncOptions& options, SyncResult& result);
    void finish(SyncRun& run, SyncResult& result);

    RemoteOperations& ops_;
    events::EventBus& bus_;
    TreeEnumerator enumerator_;
    Validator validator_;
};

} // namespace dsync::sync
