#include "dsync/sync/run.hpp"

#include "dsync/events/events.hpp"

#include <algorithm>
#include <unordered_map>

namespace dsync::sync {
namespace {

bool is_progressive(RunState current, RunState target) {
    static const std::unordered_map<RunState, std::vector<RunState>> transitions {
        {RunState::Init, {RunState::Preflight}},
        {RunState::Preflight, {RunState::EnumerateSource}},
        {RunState::EnumerateSource, {RunState::EnumerateDest}},
        {RunState::EnumerateDest, {RunState::Diff}},
        {RunState::Diff, {RunState::CreateFolders, RunState::Done}},
        {RunState::CreateFolders, {RunState::CopyFiles}},
        {RunState::CopyFiles, {RunState::Validate, RunState::Done}},
        {RunState::Validate, {RunState::CreateFolders, RunState::Done}},
    };

    if (target == RunState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

SyncRun::SyncRun(const events::EventBus& bus) : bus_(bus) {}

dsync::Result<void> SyncRun::transition_to(RunState next_state) {
    if (state_ == next_state) {
        return dsync::Ok();
    }

    if (!can_transition(next_state)) {
        return dsync::Err(std::string("Illegal run state transition: ") + to_string(state_) + " -> " + to_string(next_state));
    }

    const auto previous = state_;
    state_ = next_state;
    history_.push_back(next_state);
    if (next_state != RunState::Failed) {
        last_error_.clear();
    }
    bus_.emit(events::StateChangedEvent{previous, next_state, last_error_});
    return dsync::Ok();
}

dsync::Result<void> SyncRun::mark_failed(std::string error_message) {
    if (finished()) {
        return dsync::Err(std::string("Run already finished in state ") + to_string(state_));
    }
    last_error_ = std::move(error_message);
    return transition_to(RunState::Failed);
}

std::chrono::milliseconds SyncRun::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at_);
}

bool SyncRun::can_transition(RunState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (finished()) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace dsync::sync
