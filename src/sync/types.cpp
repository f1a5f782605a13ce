#include "chsync/sync/types.hpp"

namespace chsync::sync {

const char* to_string(RunState state) noexcept {
    switch (state) {
        case RunState::Idle: return "idle";
        case RunState::Validating: return "validating";
        case RunState::Scanning: return "scanning";
        case RunState::Diffing: return "diffing";
        case RunState::Deleting: return "deleting";
        case RunState::Transferring: return "transferring";
        case RunState::Persisting: return "persisting";
        case RunState::Done: return "done";
        case RunState::Cancelled: return "cancelled";
        case RunState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(RunOutcome outcome) noexcept {
    switch (outcome) {
        case RunOutcome::Succeeded: return "succeeded";
        case RunOutcome::Failed: return "failed";
        case RunOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace chsync::sync
