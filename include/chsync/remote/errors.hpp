#pragma once

#include "chsync/core/result.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace chsync::remote {

/**
 * @brief How the caller should react to a failed remote call
 *
 * Only Transient and RateLimited are worth retrying. NotFound is a normal
 * answer for lookups (first ever upload), PayloadTooLarge means the input
 * must shrink, Cancelled means the run was stopped while waiting.
 */
enum class ErrorKind {
    Permanent,
    Transient,
    RateLimited,
    NotFound,
    PayloadTooLarge,
    Format,
    Cancelled
};

const char* to_string(ErrorKind kind) noexcept;

/// Upper bound on any server-requested wait
constexpr std::chrono::seconds kMaxRateLimitWait{24 * 60 * 60};

struct RemoteError {
    ErrorKind kind = ErrorKind::Permanent;
    std::string message;                    ///< Safe to show to the user
    int http_status = 0;                    ///< 0 when no response was received
    std::chrono::seconds retry_after{0};    ///< Server-requested wait, RateLimited only
    std::vector<std::string> details;       ///< Itemized validation messages from the server

    bool is_retryable() const noexcept {
        return kind == ErrorKind::Transient || kind == ErrorKind::RateLimited;
    }

    /// message followed by details, one per line
    std::string describe() const;

    static RemoteError permanent(std::string message, int status = 0) {
        return RemoteError{ErrorKind::Permanent, std::move(message), status, std::chrono::seconds{0}, {}};
    }

    static RemoteError transient(std::string message, int status = 0) {
        return RemoteError{ErrorKind::Transient, std::move(message), status, std::chrono::seconds{0}, {}};
    }

    /// wait is clamped to [0, kMaxRateLimitWait]
    static RemoteError rate_limited(std::string message, std::chrono::seconds wait, int status = 429) {
        wait = std::clamp(wait, std::chrono::seconds{0}, kMaxRateLimitWait);
        return RemoteError{ErrorKind::RateLimited, std::move(message), status, wait, {}};
    }

    static RemoteError not_found(std::string message, int status = 404) {
        return RemoteError{ErrorKind::NotFound, std::move(message), status, std::chrono::seconds{0}, {}};
    }

    static RemoteError format(std::string message, int status = 0) {
        return RemoteError{ErrorKind::Format, std::move(message), status, std::chrono::seconds{0}, {}};
    }

    static RemoteError cancelled() {
        return RemoteError{ErrorKind::Cancelled, "Cancelled", 0, std::chrono::seconds{0}, {}};
    }
};

template<typename T>
using RemoteResult = Result<T, RemoteError>;

/**
 * @brief Replace every occurrence of secret in text with a fixed mask
 *
 * Also masks the percent-encoded form, since the secret may have travelled
 * through a URL.
 */
std::string redact_secret(const std::string& text, const std::string& secret);

} // namespace chsync::remote
