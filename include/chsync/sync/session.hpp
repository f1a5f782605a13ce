#pragma once

#include "chsync/core/result.hpp"
#include "chsync/sync/types.hpp"

#include <chrono>
#include <string>

namespace chsync::sync {

/**
 * @brief Tracks the state of one upload run and rejects illegal transitions
 *
 * Diffing is only legal in update mode. Done, Cancelled and Failed are
 * terminal.
 */
class UploadSession {
public:
    explicit UploadSession(UploadMode mode);

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] UploadMode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] bool is_terminal() const noexcept;

    chsync::Result<void> transition_to(RunState next_state);
    chsync::Result<void> mark_failed(std::string error_message);
    chsync::Result<void> mark_cancelled();

    [[nodiscard]] std::chrono::steady_clock::time_point started_at() const noexcept { return started_at_; }

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(RunState target) const noexcept;

    UploadMode mode_;
    RunState state_ = RunState::Idle;
    std::string last_error_;
    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace chsync::sync
