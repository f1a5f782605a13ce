#include "chsync/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace chsync::sync {
namespace {

bool is_progressive(RunState current, RunState target) {
    static const std::unordered_map<RunState, std::vector<RunState>> transitions {
        {RunState::Idle, {RunState::Validating}},
        {RunState::Validating, {RunState::Scanning}},
        {RunState::Scanning, {RunState::Diffing, RunState::Deleting}},
        {RunState::Diffing, {RunState::Deleting}},
        {RunState::Deleting, {RunState::Transferring}},
        {RunState::Transferring, {RunState::Persisting}},
        {RunState::Persisting, {RunState::Done}},
    };

    if (target == RunState::Failed || target == RunState::Cancelled) {
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

UploadSession::UploadSession(UploadMode mode)
    : mode_(mode) {
    last_transition_ = std::chrono::steady_clock::now();
}

bool UploadSession::is_terminal() const noexcept {
    return state_ == RunState::Done || state_ == RunState::Failed || state_ == RunState::Cancelled;
}

chsync::Result<void> UploadSession::transition_to(RunState next_state) {
    if (state_ == next_state) {
        return chsync::Ok();
    }

    if (!can_transition(next_state)) {
        return chsync::Err<void>(std::string("Illegal run state transition: ") + to_string(state_) + " -> " +
                                 to_string(next_state));
    }

    if (state_ == RunState::Idle) {
        started_at_ = std::chrono::steady_clock::now();
    }
    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state != RunState::Failed) {
        last_error_.clear();
    }
    return chsync::Ok();
}

chsync::Result<void> UploadSession::mark_failed(std::string error_message) {
    auto result = transition_to(RunState::Failed);
    if (result.is_ok()) {
        last_error_ = std::move(error_message);
    }
    return result;
}

chsync::Result<void> UploadSession::mark_cancelled() {
    return transition_to(RunState::Cancelled);
}

bool UploadSession::can_transition(RunState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    if (target == RunState::Diffing && mode_ != UploadMode::Update) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace chsync::sync
