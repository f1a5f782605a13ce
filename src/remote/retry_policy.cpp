#include "chsync/remote/retry_policy.hpp"

#include <thread>

namespace chsync::remote {

bool SteadySleeper::sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) {
    constexpr std::chrono::milliseconds kSlice{100};
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!token.is_cancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kSlice));
    }
    return false;
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int retry_index) const {
    auto delay = options_.base_delay;
    for (int i = 0; i < retry_index && delay < options_.max_delay; ++i) {
        delay *= 2;
    }
    return std::min(delay, options_.max_delay);
}

} // namespace chsync::remote
