#include "chsync/remote/index_client.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace chsync::remote {
namespace {

using nlohmann::json;

constexpr std::chrono::seconds kDefaultRateLimitWait{30};

std::string text_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

std::chrono::seconds seconds_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return std::chrono::seconds{0};
    }
    const auto seconds = it->get<double>();
    if (!(seconds > 0.0)) {
        return std::chrono::seconds{0};
    }
    if (seconds >= static_cast<double>(kMaxRateLimitWait.count())) {
        return kMaxRateLimitWait;
    }
    return std::chrono::seconds(static_cast<std::int64_t>(seconds));
}

std::chrono::seconds rate_limit_wait(const network::HttpResponse& response, const json* body) {
    const auto header = response.get_header("Retry-After");
    if (!header.empty() && header.size() < 10 &&
        std::all_of(header.begin(), header.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::chrono::seconds(std::stoll(header));
    }
    if (body != nullptr && body->is_object()) {
        auto wait = seconds_field(*body, "retryAfter");
        if (wait.count() > 0) {
            return wait;
        }
        const auto parameters = body->find("parameters");
        if (parameters != body->end() && parameters->is_object()) {
            wait = seconds_field(*parameters, "retry_after");
            if (wait.count() > 0) {
                return wait;
            }
        }
    }
    return kDefaultRateLimitWait;
}

std::vector<std::string> collect_details(const json& body) {
    std::vector<std::string> details;
    const auto it = body.find("details");
    if (it == body.end() || !it->is_array()) {
        return details;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            details.push_back(item.get<std::string>());
        } else if (item.is_object() && item.contains("msg")) {
            details.push_back(text_field(item, "msg"));
        } else {
            details.push_back(item.dump());
        }
    }
    return details;
}

} // namespace

IndexClient::IndexClient(network::HttpTransport& transport, RetryPolicy& retry, const Settings& settings)
    : transport_(transport)
    , retry_(retry)
    , codec_(tree::CodecOptions{settings.max_tree_depth, settings.min_object_id_length})
    , server_url_(settings.index_server_url)
    , api_prefix_(settings.index_api_prefix)
    , api_timeout_(settings.api_timeout)
    , health_timeout_(settings.health_timeout)
    , max_payload_bytes_(settings.max_payload_bytes) {}

std::string IndexClient::api_url(const std::string& path) const {
    return server_url_ + api_prefix_ + path;
}

RemoteResult<json> IndexClient::interpret(const Result<network::HttpResponse, network::TransportError>& response,
                                          const std::string& secret) const {
    using network::TransportError;

    if (response.is_error()) {
        const auto& error = response.error();
        spdlog::warn("[IndexClient] transport kind={} error={}", network::to_string(error.kind),
                     redact_secret(error.message, secret));
        if (error.kind == TransportError::Kind::Timeout) {
            return Err<json>(RemoteError::transient("Server request timed out"));
        }
        if (error.kind == TransportError::Kind::InvalidUrl) {
            return Err<json>(RemoteError::permanent("Invalid server URL: " + redact_secret(error.message, secret)));
        }
        return Err<json>(RemoteError::transient("Cannot connect to server"));
    }

    const auto& http = response.value();
    const int status = http.status_code;
    const bool is_json = http.has_content_type("application/json");

    json body;
    bool parsed = false;
    if (is_json) {
        try {
            body = json::parse(http.body);
            parsed = true;
        } catch (const json::parse_error& e) {
            spdlog::debug("[IndexClient] invalid JSON status={} error={}", status, e.what());
        }
    }

    if (status == 404) {
        return Err<json>(RemoteError::not_found("Not found on server"));
    }
    if (status == 413) {
        RemoteError error{ErrorKind::PayloadTooLarge, "Server rejected the metadata as too large", status,
                          std::chrono::seconds{0}, {}};
        return Err<json>(std::move(error));
    }
    if (status == 429) {
        const auto wait = rate_limit_wait(http, parsed ? &body : nullptr);
        return Err<json>(RemoteError::rate_limited(
            fmt::format("Rate limited by server. Retry after {}s", wait.count()), wait, status));
    }
    if (status == 502 || status == 503 || status == 504) {
        return Err<json>(RemoteError::transient(fmt::format("Server temporarily unavailable (HTTP {})", status),
                                                status));
    }

    if (!is_json) {
        const auto content_type = http.get_header("Content-Type");
        return Err<json>(RemoteError::format(
            fmt::format("Unexpected response from server (HTTP {}, content type '{}')", status,
                        content_type.empty() ? "none" : content_type),
            status));
    }
    if (!parsed || !body.is_object()) {
        return Err<json>(RemoteError::format("Invalid response from server", status));
    }

    const auto success = body.find("success");
    if (http.is_success() && success != body.end() && success->is_boolean() && success->get<bool>()) {
        return Ok<json, RemoteError>(std::move(body));
    }

    auto message = text_field(body, "error");
    if (message.empty()) {
        message = text_field(body, "message");
    }
    if (message.empty()) {
        message = fmt::format("Request failed (HTTP {})", status);
    }

    RemoteError error = status >= 500 ? RemoteError::transient(redact_secret(message, secret), status)
                                      : RemoteError::permanent(redact_secret(message, secret), status);
    for (const auto& detail : collect_details(body)) {
        error.details.push_back(redact_secret(detail, secret));
    }
    return Err<json>(std::move(error));
}

RemoteResult<json> IndexClient::request(network::HttpMethod method,
                                        const std::string& url,
                                        const std::string& body,
                                        const std::string& secret) {
    network::HttpRequest http;
    http.method = method;
    http.url = url;
    http.set_header("Accept", "application/json");
    if (!body.empty()) {
        http.set_json_body(body);
    }

    auto response = transport_.send(http, api_timeout_);
    if (response.is_ok()) {
        spdlog::debug("[IndexClient] method={} status={}", network::to_string(method), response.value().status_code);
    }
    return interpret(response, secret);
}

Result<void, RemoteError> IndexClient::probe_connectivity() {
    auto result = retry_.run("health", [&]() -> Result<void, RemoteError> {
        network::HttpRequest http;
        http.url = server_url_ + "/health";

        auto response = transport_.send(http, health_timeout_);
        if (response.is_error()) {
            spdlog::warn("[IndexClient] health transport kind={} error={}",
                         network::to_string(response.error().kind), response.error().message);
            if (response.error().kind == network::TransportError::Kind::InvalidUrl) {
                return Err<void>(RemoteError::permanent("Invalid server URL"));
            }
            if (response.error().kind == network::TransportError::Kind::Timeout) {
                return Err<void>(RemoteError::transient("Connection timed out"));
            }
            return Err<void>(RemoteError::transient("Cannot connect to server"));
        }

        const int status = response.value().status_code;
        if (status == 200) {
            return Ok<RemoteError>();
        }
        if (status == 429) {
            return Err<void>(RemoteError::rate_limited("Server is rate limiting requests",
                                                       rate_limit_wait(response.value(), nullptr)));
        }
        auto message = fmt::format("Server returned status {}", status);
        return Err<void>(status >= 500 ? RemoteError::transient(message, status)
                                       : RemoteError::permanent(message, status));
    });

    if (result.is_ok()) {
        spdlog::debug("[IndexClient] server online url={}", server_url_);
    }
    return result;
}

RemoteResult<ServerStatus> IndexClient::fetch_status(const std::string& credential) {
    const auto url = api_url("/bot-status/" + network::url_encode(credential));
    auto result = retry_.run("bot-status", [&] { return request(network::HttpMethod::GET, url, "", credential); });
    if (result.is_error()) {
        return Err<ServerStatus>(result.error());
    }

    const auto& body = result.value();
    ServerStatus status;
    status.status = text_field(body, "status");
    status.bot_id = text_field(body, "botId");
    status.bot_username = text_field(body, "botUsername");

    const auto owner = body.find("ownerRegistered");
    status.owner_registered = owner != body.end() && owner->is_boolean() && owner->get<bool>();

    const auto metadata = body.find("metadata");
    if (metadata != body.end() && !metadata->is_null()) {
        status.metadata = *metadata;
    }
    return Ok<ServerStatus, RemoteError>(std::move(status));
}

RemoteResult<tree::TreeNode> IndexClient::fetch_tree(const std::string& credential) {
    const auto url = api_url("/bot-metadata/" + network::url_encode(credential));
    auto result = retry_.run("bot-metadata", [&] { return request(network::HttpMethod::GET, url, "", credential); });
    if (result.is_error()) {
        return Err<tree::TreeNode>(result.error());
    }

    const auto& body = result.value();
    const auto metadata = body.find("metadata");
    if (metadata == body.end() || metadata->is_null()) {
        return Err<tree::TreeNode>(RemoteError::not_found("No metadata stored for this bot", 200));
    }

    auto decoded = codec_.deserialize(*metadata);
    if (decoded.is_error()) {
        return Err<tree::TreeNode>(RemoteError::format("Stored metadata is invalid: " + decoded.error()));
    }
    return Ok<tree::TreeNode, RemoteError>(std::move(decoded.value()));
}

RemoteResult<PersistReceipt> IndexClient::persist_tree(const std::string& credential,
                                                       const std::string& destination_id,
                                                       const std::string& bot_username,
                                                       const tree::TreeNode& tree) {
    auto encoded = codec_.serialize(tree);
    if (encoded.is_error()) {
        return Err<PersistReceipt>(RemoteError::format("Cannot encode metadata: " + encoded.error()));
    }

    const json payload = {
        {"botToken", credential},
        {"channelId", destination_id},
        {"botUsername", bot_username},
        {"metadata", std::move(encoded.value())},
    };
    std::string body;
    try {
        body = payload.dump();
    } catch (const json::type_error& e) {
        spdlog::warn("[IndexClient] payload not encodable: {}", e.what());
        return Err<PersistReceipt>(RemoteError::format("Cannot encode metadata: text is not valid UTF-8"));
    }

    if (body.size() > max_payload_bytes_) {
        constexpr double kMiB = 1024.0 * 1024.0;
        RemoteError error{ErrorKind::PayloadTooLarge,
                          fmt::format("Metadata too large ({:.2f}MB > {:.2f}MB). Reduce folder structure.",
                                      static_cast<double>(body.size()) / kMiB,
                                      static_cast<double>(max_payload_bytes_) / kMiB),
                          0, std::chrono::seconds{0}, {}};
        spdlog::warn("[IndexClient] payload rejected locally bytes={} limit={}", body.size(), max_payload_bytes_);
        return Err<PersistReceipt>(std::move(error));
    }

    const auto url = api_url("/upload");
    auto result = retry_.run("upload", [&] { return request(network::HttpMethod::POST, url, body, credential); });
    if (result.is_error()) {
        return Err<PersistReceipt>(result.error());
    }

    const auto& response = result.value();
    PersistReceipt receipt;
    receipt.assigned_id = text_field(response, "botId");
    receipt.status = text_field(response, "status");
    receipt.message = text_field(response, "message");

    const auto update = response.find("isUpdate");
    receipt.is_update = update != response.end() && update->is_boolean() && update->get<bool>();

    const auto percentage = response.find("changePercentage");
    if (percentage != response.end() && percentage->is_number()) {
        receipt.change_percentage = percentage->get<double>();
    }
    return Ok<PersistReceipt, RemoteError>(std::move(receipt));
}

} // namespace chsync::remote
