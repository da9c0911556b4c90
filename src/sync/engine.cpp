#include "dsync/sync/engine.hpp"

#include "dsync/events/events.hpp"
#include "dsync/sync/differ.hpp"

#include <spdlog/spdlog.h>

namespace dsync::sync {
namespace {

bool enter(SyncRun& run, RunState state, SyncResult& result) {
    auto moved = run.transition_to(state);
    if (moved.is_error()) {
        spdlog::error("{}", moved.error());
        result.error = moved.error();
        return false;
    }
    return true;
}

} // namespace

DestinationFolders::DestinationFolders(std::string root_id, const FolderMap& existing)
    : root_id_(std::move(root_id)), folders_(existing) {}

std::optional<std::string> DestinationFolders::get(const std::string& path) const {
    if (path.empty()) {
        return root_id_;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = folders_.find(path);
    if (it == folders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DestinationFolders::set(const std::string& path, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    folders_[path] = id;
}

bool DestinationFolders::contains(const std::string& path) const {
    if (path.empty()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return folders_.count(path) > 0;
}

std::size_t DestinationFolders::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return folders_.size();
}

SyncEngine::SyncEngine(RemoteOperations& ops, events::EventBus& bus)
    : ops_(ops), bus_(bus), enumerator_(ops, bus), validator_(ops, bus) {}

SyncResult SyncEngine::run(const SyncOptions& options) {
    SyncRun run(bus_);
    SyncResult result;

    auto abort = [&](const std::string& message) {
        result.error = message;
        auto failed = run.mark_failed(message);
        if (failed.is_error()) {
            spdlog::error("{}", failed.error());
        }
        finish(run, result);
        return result;
    };

    // Preflight: both roots must be readable folders before anything is touched
    if (!enter(run, RunState::Preflight, result)) {
        return abort(result.error);
    }
    for (const auto& root : {options.source_root, options.dest_root}) {
        auto checked = ops_.verify_folder_exists(root);
        if (checked.is_error()) {
            return abort("Cannot access folder " + root + ": " + checked.error().describe());
        }
    }

    if (!enter(run, RunState::EnumerateSource, result)) {
        return abort(result.error);
    }
    auto source = enumerator_.enumerate(options.source_root);
    if (source.is_error()) {
        return abort("Source enumeration failed: " + source.error().describe());
    }
    result.source_complete = source.value()->complete;

    if (!enter(run, RunState::EnumerateDest, result)) {
        return abort(result.error);
    }
    auto dest = enumerator_.enumerate(options.dest_root);
    if (dest.is_error()) {
        return abort("Destination enumeration failed: " + dest.error().describe());
    }
    result.dest_complete = dest.value()->complete;

    const auto& source_tree = *source.value();
    const auto& dest_tree = *dest.value();
    bus_.emit(events::CountsDiscoveredEvent{source_tree.files.size(), source_tree.folders.size()});

    if (!enter(run, RunState::Diff, result)) {
        return abort(result.error);
    }
    result.plan = Differ::diff(source_tree, dest_tree);
    result.missing_folders = Differ::missing_folders(source_tree, dest_tree);
    spdlog::info("Plan: {} folders to create, {} files to copy", result.missing_folders.size(), result.plan.size());

    if (options.dry_run) {
        for (const auto& path : result.missing_folders) {
            spdlog::info("[dry-run] would create folder {}", path);
        }
        for (const auto& action : result.plan) {
            spdlog::info("[dry-run] would copy {} ({})", action.relative_path, action.source_id);
        }
        finish(run, result);
        return result;
    }

    DestinationFolders folders(options.dest_root, dest_tree.folders);

    if (!enter(run, RunState::CreateFolders, result)) {
        return abort(result.error);
    }
    create_folders(result.missing_folders, folders, result);

    if (!enter(run, RunState::CopyFiles, result)) {
        return abort(result.error);
    }
    copy_files(result.plan, source_tree, folders, options, result);
    enumerator_.invalidate(options.dest_root);

    if (options.final_validation) {
        if (!enter(run, RunState::Validate, result)) {
            return abort(result.error);
        }
        auto report = validate(options, result);

        if (report && !report->passed && options.auto_fix_missing && report->source) {
            spdlog::info("Attempting to fix {} discrepancies", report->discrepancies.size());
            result.repaired = true;

            std::vector<std::string> repair_folders;
            for (const auto& d : report->discrepancies) {
                if (d.kind == DiscrepancyKind::MissingFolder) {
                    repair_folders.push_back(d.path);
                }
            }
            DestinationFolders repair_map(options.dest_root, report->dest->folders);

            if (!enter(run, RunState::CreateFolders, result)) {
                return abort(result.error);
            }
            create_folders(repair_folders, repair_map, result);

            if (!enter(run, RunState::CopyFiles, result)) {
                return abort(result.error);
            }
            copy_files(report->repair_plan(), *report->source, repair_map, options, result);
            enumerator_.invalidate(options.dest_root);

            if (!enter(run, RunState::Validate, result)) {
                return abort(result.error);
            }
            validate(options, result);
        }
    }

    finish(run, result);
    return result;
}

void SyncEngine::create_folders(const std::vector<std::string>& paths, DestinationFolders& folders, SyncResult& result) {
    for (const auto& path : paths) {
        if (folders.contains(path)) {
            continue;
        }

        const auto parent = parent_path(path);
        const auto parent_id = folders.get(parent);
        if (!parent_id) {
            spdlog::warn("Parent folder '{}' of '{}' is missing; skipping", parent, path);
            result.skipped_folders++;
            bus_.emit(events::FolderSkippedEvent{path, "parent folder missing"});
            continue;
        }

        auto outcome = ops_.ensure_folder(leaf_name(path), *parent_id);
        if (outcome.is_error()) {
            result.failed_folders++;
            bus_.emit(events::FolderCreateFailedEvent{path, outcome.error().describe()});
            continue;
        }

        folders.set(path, outcome.value().id);
        if (outcome.value().created) {
            result.created_folders++;
            bus_.emit(events::FolderCreatedEvent{path, outcome.value().id});
        } else {
            result.skipped_folders++;
            bus_.emit(events::FolderSkippedEvent{path, "already exists"});
        }
    }
}

RemoteResult<std::string> SyncEngine::resolve_parent(const std::string& parent, DestinationFolders& folders,
                                                     SyncResult& result) {
    if (auto known = folders.get(parent)) {
        return dsync::Ok(*known);
    }

    // Fallback: create whatever part of the chain the folder pass did not
    std::string current_path;
    std::string current_id = *folders.get("");
    for (const auto& segment : split_path(parent)) {
        current_path = join_path(current_path, segment);
        if (auto known = folders.get(current_path)) {
            current_id = *known;
            continue;
        }
        auto outcome = ops_.ensure_folder(segment, current_id);
        if (outcome.is_error()) {
            return dsync::Err(outcome.error());
        }
        current_id = outcome.value().id;
        folders.set(current_path, current_id);
        if (outcome.value().created) {
            result.created_folders++;
            bus_.emit(events::FolderCreatedEvent{current_path, current_id});
        }
    }
    return dsync::Ok(current_id);
}

void SyncEngine::copy_files(const DiffPlan& plan, const TreeSnapshot& source, DestinationFolders& folders,
                            const SyncOptions& options, SyncResult& result) {
    const std::size_t batch = options.batch_size > 0 ? options.batch_size : 1;
    std::size_t processed = 0;
    std::size_t succeeded = 0;

    for (const auto& action : plan) {
        const auto parent = resolve_parent(parent_path(action.relative_path), folders, result);
        if (parent.is_error()) {
            result.failed_copies++;
            result.failed_paths.push_back(action.relative_path);
            bus_.emit(events::FileCopyFailedEvent{action.relative_path,
                                                  "cannot resolve destination folder: " + parent.error().describe()});
        } else {
            auto copied = ops_.copy_file(action.source_id, parent.value(), leaf_name(action.relative_path));
            if (copied.is_error()) {
                result.failed_copies++;
                result.failed_paths.push_back(action.relative_path);
                bus_.emit(events::FileCopyFailedEvent{action.relative_path, copied.error().describe()});
            } else if (copied.value().skipped) {
                result.skipped_copies++;
                succeeded++;
                bus_.emit(events::FileCopySkippedEvent{action.relative_path, "identical file exists"});
            } else {
                result.successful_copies++;
                succeeded++;
                auto entry = source.files.find(action.relative_path);
                const std::uint64_t size = entry != source.files.end() ? entry->second.size : 0;
                bus_.emit(events::FileCopiedEvent{action.relative_path, action.source_id, copied.value().id, size});
            }
        }

        processed++;
        if (processed % batch == 0 || processed == plan.size()) {
            spdlog::info("Progress: {}/{} files processed ({:.1f}%), success rate {:.1f}%",
                         processed, plan.size(),
                         static_cast<double>(processed) / static_cast<double>(plan.size()) * 100.0,
                         static_cast<double>(succeeded) / static_cast<double>(processed) * 100.0);
        }
    }
}

std::optional<ValidationReport> SyncEngine::validate(const SyncOptions& options, SyncResult& result) {
    result.validated = true;
    auto report = validator_.validate(options.source_root, options.dest_root);
    if (report.is_error()) {
        spdlog::error("Validation could not run: {}", report.error().describe());
        result.validation_passed = false;
        return std::nullopt;
    }
    result.validation_passed = report.value().passed;
    result.discrepancies = report.value().discrepancies;
    return std::move(report.value());
}

void SyncEngine::finish(SyncRun& run, SyncResult& result) {
    if (run.state() != RunState::Failed) {
        std::string reason;
        if (!result.source_complete) {
            reason = "source tree could not be listed completely";
        } else if (result.failed_copies > 0) {
            reason = std::to_string(result.failed_copies) + " file copies failed";
        } else if (result.validated && !result.validation_passed && result.discrepancies.empty()) {
            reason = "validation did not complete";
        } else if (result.validated && !result.validation_passed) {
            reason = "validation found " + std::to_string(result.discrepancies.size()) + " discrepancies";
        }

        if (reason.empty()) {
            auto done = run.transition_to(RunState::Done);
            if (done.is_error()) {
                reason = done.error();
            }
        }
        if (!reason.empty()) {
            result.error = reason;
            auto failed = run.mark_failed(reason);
            if (failed.is_error()) {
                spdlog::error("{}", failed.error());
            }
        }
    }

    result.success = run.state() == RunState::Done;
    result.final_state = run.state();
    result.states = run.history();
    bus_.emit(events::SyncFinishedEvent{result.success, result.failed_copies, result.discrepancies.size(), run.elapsed()});
}

} // namespace dsync::sync
