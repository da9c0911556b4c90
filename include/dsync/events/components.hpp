/**
 * @file components.hpp
 * @brief Event subscribers: structured logging and progress counters
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * ProgressComponent progress(bus);
 * // run the engine, then:
 * progress.print_summary();
 */

#pragma once

#include "dsync/events/event_bus.hpp"
#include "dsync/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <vector>

namespace dsync::events {

/**
 * @brief Logger component - writes every pipeline event through spdlog
 *
 * Per-page and per-skip events are logged at debug level; everything that
 * changes the destination or signals a problem is info or above.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<StateChangedEvent>([](const StateChangedEvent& e) {
            if (e.to == sync::RunState::Failed) {
                spdlog::error("[StateChanged] from={} to={} reason={}", sync::to_string(e.from), sync::to_string(e.to), e.detail);
            } else {
                spdlog::info("[StateChanged] from={} to={}", sync::to_string(e.from), sync::to_string(e.to));
            }
        }));

        subscriptions_.push_back(bus.subscribe<CountsDiscoveredEvent>([](const CountsDiscoveredEvent& e) {
            spdlog::info("[CountsDiscovered] files={} folders={}", e.total_files, e.total_folders);
        }));

        subscriptions_.push_back(bus.subscribe<EnumerationPageEvent>([](const EnumerationPageEvent& e) {
            spdlog::debug("[EnumerationPage] root={} folder={} items={} processed={}/{} ({:.1f}%)",
                          e.root_id, e.folder_id, e.page_items, e.processed, e.total, e.percent);
        }));

        subscriptions_.push_back(bus.subscribe<SubtreeSkippedEvent>([](const SubtreeSkippedEvent& e) {
            spdlog::error("[SubtreeSkipped] root={} path='{}' error={}", e.root_id, e.folder_path, e.error);
        }));

        subscriptions_.push_back(bus.subscribe<FolderCreatedEvent>([](const FolderCreatedEvent& e) {
            spdlog::info("[FolderCreated] path={} id={}", e.path, e.folder_id);
        }));

        subscriptions_.push_back(bus.subscribe<FolderSkippedEvent>([](const FolderSkippedEvent& e) {
            spdlog::debug("[FolderSkipped] path={} reason={}", e.path, e.reason);
        }));

        subscriptions_.push_back(bus.subscribe<FolderCreateFailedEvent>([](const FolderCreateFailedEvent& e) {
            spdlog::error("[FolderCreateFailed] path={} error={}", e.path, e.error);
        }));

        subscriptions_.push_back(bus.subscribe<FileCopiedEvent>([](const FileCopiedEvent& e) {
            spdlog::info("[FileCopied] path={} source={} new_id={} bytes={}", e.path, e.source_id, e.new_id, e.size);
        }));

        subscriptions_.push_back(bus.subscribe<FileCopySkippedEvent>([](const FileCopySkippedEvent& e) {
            spdlog::debug("[FileCopySkipped] path={} reason={}", e.path, e.reason);
        }));

        subscriptions_.push_back(bus.subscribe<FileCopyFailedEvent>([](const FileCopyFailedEvent& e) {
            spdlog::error("[FileCopyFailed] path={} error={}", e.path, e.error);
        }));

        subscriptions_.push_back(bus.subscribe<ValidationFinishedEvent>([](const ValidationFinishedEvent& e) {
            if (e.passed) {
                spdlog::info("[ValidationFinished] passed");
            } else {
                spdlog::error("[ValidationFinished] failed discrepancies={}", e.discrepancies);
            }
        }));

        subscriptions_.push_back(bus.subscribe<SyncFinishedEvent>([](const SyncFinishedEvent& e) {
            spdlog::info("[SyncFinished] success={} failed_copies={} discrepancies={} duration={}ms",
                         e.success, e.failed_copies, e.discrepancies, e.duration.count());
        }));
    }

private:
    std::vector<Subscription> subscriptions_;
};

/**
 * @brief Plain snapshot of the progress counters
 */
struct ProgressCounters {
    std::uint64_t total_files = 0;
    std::uint64_t total_folders = 0;
    std::uint64_t processed_files = 0;
    std::uint64_t successful_copies = 0;
    std::uint64_t failed_copies = 0;
    std::uint64_t skipped_copies = 0;
    std::uint64_t created_folders = 0;
    std::uint64_t skipped_folders = 0;
};

/**
 * @brief Progress component - the only writer of the progress counters
 *
 * WHAT IT DOES:
 * Each counter moves in response to exactly one event type, so whatever
 * renders progress (console, UI) reads consistent numbers through counters().
 */
class ProgressComponent {
public:
    explicit ProgressComponent(EventBus& bus) {
        subscriptions_.push_back(bus.subscribe<CountsDiscoveredEvent>([this](const CountsDiscoveredEvent& e) {
            total_files_ = e.total_files;
            total_folders_ = e.total_folders;
        }));

        subscriptions_.push_back(bus.subscribe<FileCopiedEvent>([this](const FileCopiedEvent&) {
            ++successful_copies_;
            ++processed_files_;
        }));

        subscriptions_.push_back(bus.subscribe<FileCopyFailedEvent>([this](const FileCopyFailedEvent&) {
            ++failed_copies_;
            ++processed_files_;
        }));

        subscriptions_.push_back(bus.subscribe<FileCopySkippedEvent>([this](const FileCopySkippedEvent&) {
            ++skipped_copies_;
            ++processed_files_;
        }));

        subscriptions_.push_back(bus.subscribe<FolderCreatedEvent>([this](const FolderCreatedEvent&) {
            ++created_folders_;
        }));

        subscriptions_.push_back(bus.subscribe<FolderSkippedEvent>([this](const FolderSkippedEvent&) {
            ++skipped_folders_;
        }));
    }

    ProgressCounters counters() const {
        ProgressCounters c;
        c.total_files = total_files_.load();
        c.total_folders = total_folders_.load();
        c.processed_files = processed_files_.load();
        c.successful_copies = successful_copies_.load();
        c.failed_copies = failed_copies_.load();
        c.skipped_copies = skipped_copies_.load();
        c.created_folders = created_folders_.load();
        c.skipped_folders = skipped_folders_.load();
        return c;
    }

    /// Weighted progress: files count for 80%, folders for 20%; 0 when totals are unknown
    double percent() const {
        const auto c = counters();
        if (c.total_files == 0) {
            return 0.0;
        }
        const double file_progress = static_cast<double>(c.processed_files) / static_cast<double>(c.total_files) * 100.0;
        double folder_progress = 0.0;
        if (c.total_folders > 0) {
            folder_progress = static_cast<double>(c.created_folders + c.skipped_folders)
                              / static_cast<double>(c.total_folders) * 100.0;
        }
        return file_progress * 0.8 + folder_progress * 0.2;
    }

    void print_summary() const {
        const auto c = counters();
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Sync Statistics:");
        spdlog::info("  Total folders:     {}", c.total_folders);
        spdlog::info("  Total files:       {}", c.total_files);
        spdlog::info("  Successful copies: {}", c.successful_copies);
        spdlog::info("  Failed copies:     {}", c.failed_copies);
        spdlog::info("  Skipped copies:    {}", c.skipped_copies);
        spdlog::info("  Created folders:   {}", c.created_folders);
        spdlog::info("  Skipped folders:   {}", c.skipped_folders);
        spdlog::info("═══════════════════════════════════════");
    }

private:
    std::atomic<std::uint64_t> total_files_{0};
    std::atomic<std::uint64_t> total_folders_{0};
    std::atomic<std::uint64_t> processed_files_{0};
    std::atomic<std::uint64_t> successful_copies_{0};
    std::atomic<std::uint64_t> failed_copies_{0};
    std::atomic<std::uint64_t> skipped_copies_{0};
    std::atomic<std::uint64_t> created_folders_{0};
    std::atomic<std::uint64_t> skipped_folders_{0};

    std::vector<Subscription> subscriptions_;
};

} // namespace dsync::events
