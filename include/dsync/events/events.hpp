/**
 * @file events.hpp
 * @brief Notifications published by the sync pipeline
 *
 * WHY THIS FILE EXISTS:
 * Defines every event the core emits. The progress counters and the log
 * output are both derived from these, so a counter can only change through
 * an event (one notification point per transition).
 *
 * NAMING CONVENTION:
 * Events are past-tense: FolderCreatedEvent, FileCopyFailedEvent
 */

#pragma once

#include "dsync/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace dsync::events {

// ════════════════════════════════════════════════════════
// Run lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted on every state machine transition of a sync run
 *
 * WHO EMITS: sync::SyncRun
 * WHO SUBSCRIBES: LoggerComponent
 */
struct StateChangedEvent {
    sync::RunState from;
    sync::RunState to;
    std::string detail; ///< Failure reason when `to` is Failed
    std::chrono::system_clock::time_point timestamp;

    StateChangedEvent(sync::RunState f, sync::RunState t, std::string d = {})
        : from(f),
          to(t),
          detail(std::move(d)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Emitted once both trees are enumerated
 *
 * WHO EMITS: SyncEngine
 * WHO SUBSCRIBES: ProgressComponent (sets the totals)
 */
struct CountsDiscoveredEvent {
    std::size_t total_files;
    std::size_t total_folders;

    CountsDiscoveredEvent(std::size_t files, std::size_t folders)
        : total_files(files), total_folders(folders) {}
};

struct SyncFinishedEvent {
    bool success;
    std::size_t failed_copies;
    std::size_t discrepancies;
    std::chrono::milliseconds duration;

    SyncFinishedEvent(bool ok, std::size_t failed, std::size_t found, std::chrono::milliseconds d)
        : success(ok), failed_copies(failed), discrepancies(found), duration(d) {}
};

// ════════════════════════════════════════════════════════
// Enumeration
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after each listing page is processed
 *
 * percent is processed/total*100, or 0 when the total is unknown.
 */
struct EnumerationPageEvent {
    std::string root_id;
    std::string folder_id;
    std::size_t page_items;
    std::size_t processed;
    std::size_t total;
    double percent;

    EnumerationPageEvent(std::string root, std::string folder, std::size_t items,
                         std::size_t done, std::size_t all)
        : root_id(std::move(root)),
          folder_id(std::move(folder)),
          page_items(items),
          processed(done),
          total(all),
          percent(all > 0 ? static_cast<double>(done) / static_cast<double>(all) * 100.0 : 0.0)
    {}
};

/**
 * @brief Emitted when a folder listing failed and its subtree was left out
 */
struct SubtreeSkippedEvent {
    std::string root_id;
    std::string folder_path;
    std::string error;

    SubtreeSkippedEvent(std::string root, std::string path, std::string err)
        : root_id(std::move(root)), folder_path(std::move(path)), error(std::move(err)) {}
};

// ════════════════════════════════════════════════════════
// Folder pass
// ════════════════════════════════════════════════════════

struct FolderCreatedEvent {
    std::string path;
    std::string folder_id;

    FolderCreatedEvent(std::string p, std::string id)
        : path(std::move(p)), folder_id(std::move(id)) {}
};

/**
 * @brief A folder needed no creation (already present) or could not be placed
 */
struct FolderSkippedEvent {
    std::string path;
    std::string reason;

    FolderSkippedEvent(std::string p, std::string r)
        : path(std::move(p)), reason(std::move(r)) {}
};

struct FolderCreateFailedEvent {
    std::string path;
    std::string error;

    FolderCreateFailedEvent(std::string p, std::string e)
        : path(std::move(p)), error(std::move(e)) {}
};

// ════════════════════════════════════════════════════════
// Copy pass
// ════════════════════════════════════════════════════════

struct FileCopiedEvent {
    std::string path;
    std::string source_id;
    std::string new_id;
    std::uint64_t size;

    FileCopiedEvent(std::string p, std::string src, std::string id, std::uint64_t s)
        : path(std::move(p)), source_id(std::move(src)), new_id(std::move(id)), size(s) {}
};

/**
 * @brief An identical file already existed at the destination
 */
struct FileCopySkippedEvent {
    std::string path;
    std::string reason;

    FileCopySkippedEvent(std::string p, std::string r)
        : path(std::move(p)), reason(std::move(r)) {}
};

struct FileCopyFailedEvent {
    std::string path;
    std::string error;

    FileCopyFailedEvent(std::string p, std::string e)
        : path(std::move(p)), error(std::move(e)) {}
};

// ════════════════════════════════════════════════════════
// Validation
// ════════════════════════════════════════════════════════

struct ValidationFinishedEvent {
    bool passed;
    std::size_t discrepancies;

    ValidationFinishedEvent(bool ok, std::size_t found)
        : passed(ok), discrepancies(found) {}
};

} // namespace dsync::events
