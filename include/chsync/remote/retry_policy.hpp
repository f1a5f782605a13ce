#pragma once

/**
 * @file retry_policy.hpp
 * @brief Bounded exponential backoff around a single remote call
 *
 * EXAMPLE:
 * RetryPolicy policy(settings.retry, sleeper, token);
 * auto me = policy.run("getMe", [&] { return fetch_identity(); });
 *
 * The wrapped callable returns RemoteResult<T>. Classification lives in the
 * RemoteError it returns:
 * - Permanent, NotFound, PayloadTooLarge, Format: returned at once
 * - Transient: retried after base_delay * 2^n (capped at max_delay)
 * - RateLimited: retried after exactly retry_after
 * Every call counts against max_attempts, rate-limited ones included. A
 * cancelled token ends the loop with ErrorKind::Cancelled.
 */

#include "chsync/core/cancellation.hpp"
#include "chsync/core/config.hpp"
#include "chsync/remote/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string>

namespace chsync::remote {

/**
 * @brief Waits between attempts; replaced in tests to avoid real sleeping
 */
class Sleeper {
public:
    virtual ~Sleeper() = default;

    /// Returns false when the token was cancelled before the wait elapsed
    virtual bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) = 0;
};

/**
 * @brief Real sleeper; wakes up periodically to check the token
 */
class SteadySleeper final : public Sleeper {
public:
    bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) override;
};

class RetryPolicy {
public:
    RetryPolicy(RetryOptions options, Sleeper& sleeper, CancellationToken token)
        : options_(options), sleeper_(sleeper), token_(std::move(token)) {}

    /// Delay before retry number retry_index (0-based)
    std::chrono::milliseconds backoff_delay(int retry_index) const;

    const RetryOptions& options() const noexcept { return options_; }

    Sleeper& sleeper() noexcept { return sleeper_; }

    const CancellationToken& token() const noexcept { return token_; }

    template<typename Fn>
    auto run(const std::string& operation, Fn&& fn) -> decltype(fn()) {
        using ResultType = decltype(fn());
        const int max_attempts = std::max(1, options_.max_attempts);

        for (int attempt = 0;; ++attempt) {
            if (token_.is_cancelled()) {
                return ResultType(ErrValue<RemoteError>(RemoteError::cancelled()));
            }

            auto result = fn();
            if (result.is_ok() || !result.error().is_retryable() || attempt + 1 >= max_attempts) {
                if (result.is_error() && result.error().is_retryable()) {
                    spdlog::warn("[Retry] {} giving up after {} attempts: {}",
                                 operation, attempt + 1, result.error().message);
                }
                return result;
            }

            const auto& error = result.error();
            std::chrono::milliseconds delay = backoff_delay(attempt);
            if (error.kind == ErrorKind::RateLimited && error.retry_after.count() > 0) {
                delay = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::min(error.retry_after, kMaxRateLimitWait));
            }

            spdlog::warn("[Retry] {} attempt={}/{} kind={} wait_ms={} error={}",
                         operation, attempt + 1, max_attempts, to_string(error.kind),
                         delay.count(), error.message);

            if (!sleeper_.sleep_for(delay, token_)) {
                return ResultType(ErrValue<RemoteError>(RemoteError::cancelled()));
            }
        }
    }

private:
    RetryOptions options_;
    Sleeper& sleeper_;
    CancellationToken token_;
};

} // namespace chsync::remote
