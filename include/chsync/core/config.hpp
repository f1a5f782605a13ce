#pragma once

/**
 * @file config.hpp
 * @brief Runtime settings for the uploader
 *
 * WHY THIS FILE EXISTS:
 * Every limit the uploader enforces (object size ceiling, index payload
 * ceiling, tree depth, retry budget, timeouts) and every endpoint it talks to
 * lives in one Settings value. Components receive the pieces they need at
 * construction time instead of reading globals.
 *
 * LOAD ORDER (later wins):
 * 1. Built-in defaults (the member initializers below)
 * 2. JSON config file (Settings::load_file)
 * 3. Environment variables (Settings::apply_environment)
 * 4. Command-line flags (applied by the CLI)
 */

#include "chsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace chsync {

/**
 * @brief Bounded exponential backoff parameters
 *
 * Delay before retry n (0-based) is base_delay * 2^n, capped at max_delay.
 */
struct RetryOptions {
    int max_attempts = 5;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{300000};
};

struct Settings {
    // Endpoints
    std::string index_server_url = "http://localhost:3000";
    std::string index_api_prefix = "/api";
    std::string transfer_api_url = "https://api.telegram.org";

    // Credential (normally supplied by environment or CLI, never by file)
    std::string credential;

    // Timeouts
    std::chrono::seconds api_timeout{30};
    std::chrono::seconds health_timeout{5};
    std::chrono::seconds transfer_timeout_min{60};
    std::chrono::seconds transfer_timeout_max{3600};
    std::uint64_t assumed_throughput_bytes_per_sec = 256 * 1024;

    // Retry
    RetryOptions retry;
    int per_file_attempts = 3;
    std::chrono::seconds per_file_backoff{5};

    // Limits
    std::uint64_t max_object_size = 2ULL * 1024 * 1024 * 1024;
    std::size_t max_payload_bytes = 10 * 1024 * 1024;
    std::size_t max_tree_depth = 50;
    std::size_t min_object_id_length = 10;

    /**
     * @brief Load settings from a JSON file on top of the defaults
     *
     * Keys are snake_case member names; durations are whole seconds except
     * retry_base_delay_ms / retry_max_delay_ms. Unknown keys are ignored,
     * keys with the wrong JSON type are rejected.
     */
    static Result<Settings> load_file(const std::filesystem::path& path);

    /**
     * @brief Override fields from CHSYNC_* environment variables
     */
    void apply_environment();

    /**
     * @brief Reject inconsistent or unusable settings
     */
    Result<void> validate() const;
};

/// True for tokens shaped like "123456789:<35 url-safe chars>"
bool is_valid_credential(const std::string& credential);

/// True for "@channelname" (5-32 word chars) or "-100<10+ digits>"
bool is_valid_destination_id(const std::string& destination_id);

} // namespace chsync
