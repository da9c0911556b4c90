#pragma once

#include "dsync/core/result.hpp"
#include "dsync/events/event_bus.hpp"
#include "dsync/sync/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dsync::sync {

/**
 * @brief State machine of one sync invocation
 *
 * Init → Preflight → EnumerateSource → EnumerateDest → Diff → CreateFolders
 * → CopyFiles → Validate → Done. Diff may go straight to Done (dry run),
 * CopyFiles may skip Validate, and Validate may loop back to CreateFolders
 * once for a repair pass. Failed is reachable from every non-terminal state.
 * Each transition is published as a StateChangedEvent.
 */
class SyncRun {
public:
    explicit SyncRun(const events::EventBus& bus);

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const std::vector<RunState>& history() const noexcept { return history_; }
    [[nodiscard]] bool finished() const noexcept { return state_ == RunState::Done || state_ == RunState::Failed; }

    dsync::Result<void> transition_to(RunState next_state);
    dsync::Result<void> mark_failed(std::string error_message);

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(RunState target) const noexcept;

    const events::EventBus& bus_;
    RunState state_ = RunState::Init;
    std::string last_error_;
    std::vector<RunState> history_{RunState::Init};
    std::chrono::steady_clock::time_point started_at_{std::chrono::steady_clock::now()};
};

} // namespace dsync::sync
