#include "chsync/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <regex>

namespace chsync {
namespace {

using json = nlohmann::json;

bool has_http_scheme(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

// Reads `key` into `out` when present; returns an error message on type mismatch.
template<typename T>
std::string read_key(const json& doc, const char* key, T& out) {
    const auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return {};
    }
    try {
        out = it->template get<T>();
    } catch (const json::exception&) {
        return std::string("Invalid type for config key '") + key + "'";
    }
    return {};
}

std::string read_seconds(const json& doc, const char* key, std::chrono::seconds& out) {
    std::int64_t raw = out.count();
    auto error = read_key(doc, key, raw);
    if (error.empty()) {
        out = std::chrono::seconds{raw};
    }
    return error;
}

std::string read_millis(const json& doc, const char* key, std::chrono::milliseconds& out) {
    std::int64_t raw = out.count();
    auto error = read_key(doc, key, raw);
    if (error.empty()) {
        out = std::chrono::milliseconds{raw};
    }
    return error;
}

} // namespace

Result<Settings> Settings::load_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Settings>(std::string("Cannot open config file: ") + path.string());
    }

    json doc;
    try {
        input >> doc;
    } catch (const json::parse_error& e) {
        return Err<Settings>(std::string("Config file is not valid JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        return Err<Settings>(std::string("Config file must contain a JSON object"));
    }

    Settings settings;
    const std::string errors[] = {
        read_key(doc, "index_server_url", settings.index_server_url),
        read_key(doc, "index_api_prefix", settings.index_api_prefix),
        read_key(doc, "transfer_api_url", settings.transfer_api_url),
        read_seconds(doc, "api_timeout", settings.api_timeout),
        read_seconds(doc, "health_timeout", settings.health_timeout),
        read_seconds(doc, "transfer_timeout_min", settings.transfer_timeout_min),
        read_seconds(doc, "transfer_timeout_max", settings.transfer_timeout_max),
        read_key(doc, "assumed_throughput_bytes_per_sec", settings.assumed_throughput_bytes_per_sec),
        read_key(doc, "retry_max_attempts", settings.retry.max_attempts),
        read_millis(doc, "retry_base_delay_ms", settings.retry.base_delay),
        read_millis(doc, "retry_max_delay_ms", settings.retry.max_delay),
        read_key(doc, "per_file_attempts", settings.per_file_attempts),
        read_seconds(doc, "per_file_backoff", settings.per_file_backoff),
        read_key(doc, "max_object_size", settings.max_object_size),
        read_key(doc, "max_payload_bytes", settings.max_payload_bytes),
        read_key(doc, "max_tree_depth", settings.max_tree_depth),
        read_key(doc, "min_object_id_length", settings.min_object_id_length),
    };

    for (const auto& error : errors) {
        if (!error.empty()) {
            return Err<Settings>(error);
        }
    }

    if (doc.contains("credential")) {
        spdlog::warn("[Config] ignoring 'credential' in config file; use CHSYNC_BOT_TOKEN or --token");
    }

    settings.index_server_url = trim_trailing_slash(settings.index_server_url);
    settings.transfer_api_url = trim_trailing_slash(settings.transfer_api_url);
    return Ok(std::move(settings));
}

void Settings::apply_environment() {
    if (const char* value = std::getenv("CHSYNC_SERVER_URL"); value && *value) {
        index_server_url = trim_trailing_slash(value);
    }
    if (const char* value = std::getenv("CHSYNC_TRANSFER_API_URL"); value && *value) {
        transfer_api_url = trim_trailing_slash(value);
    }
    if (const char* value = std::getenv("CHSYNC_BOT_TOKEN"); value && *value) {
        credential = value;
    }
}

Result<void> Settings::validate() const {
    if (!has_http_scheme(index_server_url)) {
        return Err<void>(std::string("index_server_url must start with http:// or https://"));
    }
    if (!has_http_scheme(transfer_api_url)) {
        return Err<void>(std::string("transfer_api_url must start with http:// or https://"));
    }
    if (!index_api_prefix.empty() && index_api_prefix.front() != '/') {
        return Err<void>(std::string("index_api_prefix must be empty or start with '/'"));
    }
    if (api_timeout.count() <= 0 || health_timeout.count() <= 0) {
        return Err<void>(std::string("API timeouts must be positive"));
    }
    if (transfer_timeout_min.count() <= 0 || transfer_timeout_max < transfer_timeout_min) {
        return Err<void>(std::string("transfer timeout bounds are inverted or non-positive"));
    }
    if (assumed_throughput_bytes_per_sec == 0) {
        return Err<void>(std::string("assumed_throughput_bytes_per_sec must be positive"));
    }
    if (retry.max_attempts < 1 || per_file_attempts < 1) {
        return Err<void>(std::string("retry attempt counts must be at least 1"));
    }
    if (retry.base_delay.count() < 0 || retry.max_delay < retry.base_delay) {
        return Err<void>(std::string("retry delays are inverted or negative"));
    }
    if (max_object_size == 0 || max_payload_bytes == 0 || max_tree_depth == 0) {
        return Err<void>(std::string("size and depth limits must be positive"));
    }
    if (min_object_id_length == 0) {
        return Err<void>(std::string("min_object_id_length must be positive"));
    }
    return Ok();
}

bool is_valid_credential(const std::string& credential) {
    static const std::regex pattern(R"(^\d{8,10}:[A-Za-z0-9_-]{35}$)");
    return std::regex_match(credential, pattern);
}

bool is_valid_destination_id(const std::string& destination_id) {
    static const std::regex pattern(R"(^(@[a-zA-Z0-9_]{5,32}|-100\d{10,})$)");
    return std::regex_match(destination_id, pattern);
}

} // namespace chsync
