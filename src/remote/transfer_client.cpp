#include "chsync/remote/transfer_client.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace chsync::remote {
namespace {

using nlohmann::json;

constexpr std::chrono::seconds kDefaultRateLimitWait{30};

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

std::optional<std::int64_t> int_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

bool bool_field(const json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

bool contains_icase(const std::string& haystack, const std::string& needle) {
    const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                                [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
    return it != haystack.end();
}

std::chrono::seconds parse_retry_after_header(const network::HttpResponse& response) {
    const auto header = response.get_header("Retry-After");
    if (header.empty() || header.size() >= 10 ||
        !std::all_of(header.begin(), header.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::chrono::seconds{0};
    }
    return std::min(std::chrono::seconds(std::stoll(header)), kMaxRateLimitWait);
}

// Documents carry their id under "document"; media the server re-typed
// carry it under their own key, photos as an array of sizes.
std::string extract_object_id(const json& message) {
    const auto document = message.find("document");
    if (document != message.end() && document->is_object()) {
        auto id = string_field(*document, "file_id");
        if (!id.empty()) {
            return id;
        }
    }

    for (const char* key : {"video", "audio", "animation"}) {
        const auto media = message.find(key);
        if (media != message.end() && media->is_object()) {
            auto id = string_field(*media, "file_id");
            if (!id.empty()) {
                return id;
            }
        }
    }

    const auto photo = message.find("photo");
    if (photo != message.end() && photo->is_array() && !photo->empty() && photo->back().is_object()) {
        return string_field(photo->back(), "file_id");
    }
    return {};
}

} // namespace

TransferClient::TransferClient(network::HttpTransport& transport,
                               RetryPolicy& retry,
                               const Settings& settings,
                               std::string credential)
    : transport_(transport)
    , retry_(retry)
    , api_base_url_(settings.transfer_api_url)
    , credential_(std::move(credential))
    , api_timeout_(settings.api_timeout)
    , transfer_timeout_min_(settings.transfer_timeout_min)
    , transfer_timeout_max_(settings.transfer_timeout_max)
    , throughput_(std::max<std::uint64_t>(1, settings.assumed_throughput_bytes_per_sec))
    , max_object_size_(settings.max_object_size)
    , codec_(tree::CodecOptions{settings.max_tree_depth, settings.min_object_id_length}) {}

std::string TransferClient::translate_error(const std::string& description) {
    static const std::array<std::pair<const char*, const char*>, 9> kTranslations = {{
        {"chat not found", "Channel not found. Check the channel ID is correct."},
        {"have no rights", "Bot lacks permissions. Add the bot as admin with posting rights."},
        {"not enough rights", "Bot lacks permissions. Add the bot as admin with posting rights."},
        {"TOKEN_INVALID", "Bot token is invalid or revoked."},
        {"Unauthorized", "Bot token is invalid or revoked."},
        {"message is too long", "File name is too long. Rename the file."},
        {"CHAT_WRITE_FORBIDDEN", "Bot cannot write to this channel. Add the bot as admin."},
        {"bot was kicked", "Bot was removed from the channel. Add it back as admin."},
        {"Request Entity Too Large", "File is too large for the Bot API."},
    }};

    for (const auto& [needle, friendly] : kTranslations) {
        if (contains_icase(description, needle)) {
            return friendly;
        }
    }
    return description;
}

std::string TransferClient::method_url(const std::string& method) const {
    return api_base_url_ + "/bot" + credential_ + "/" + method;
}

std::chrono::seconds TransferClient::transfer_timeout(std::uint64_t size) const {
    const auto estimate = static_cast<std::int64_t>((size + throughput_ - 1) / throughput_);
    return std::clamp(std::chrono::seconds{estimate}, transfer_timeout_min_, transfer_timeout_max_);
}

RemoteResult<json> TransferClient::interpret(
    const Result<network::HttpResponse, network::TransportError>& response) const {
    using network::TransportError;

    if (response.is_error()) {
        const auto& error = response.error();
        spdlog::warn("[TransferClient] transport kind={} error={}", network::to_string(error.kind),
                     redact(error.message));
        switch (error.kind) {
            case TransportError::Kind::File:
                return Err<json>(RemoteError::permanent("Cannot read file: " + redact(error.message)));
            case TransportError::Kind::InvalidUrl:
                return Err<json>(RemoteError::permanent("Invalid Bot API URL: " + redact(error.message)));
            case TransportError::Kind::Timeout:
                return Err<json>(RemoteError::transient("Request to Telegram timed out"));
            default:
                return Err<json>(RemoteError::transient("Network error: " + redact(error.message)));
        }
    }

    const auto& http = response.value();
    const int status = http.status_code;

    if (status == 502 || status == 503 || status == 504) {
        return Err<json>(RemoteError::transient(fmt::format("Telegram is temporarily unavailable (HTTP {})", status),
                                                status));
    }

    if (!http.has_content_type("application/json")) {
        if (status == 429) {
            auto wait = parse_retry_after_header(http);
            if (wait.count() <= 0) {
                wait = kDefaultRateLimitWait;
            }
            return Err<json>(RemoteError::rate_limited(fmt::format("Rate limited. Retry after {}s", wait.count()),
                                                       wait));
        }
        return Err<json>(RemoteError::format(fmt::format("Unexpected response from Telegram (HTTP {})", status),
                                             status));
    }

    json body;
    try {
        body = json::parse(http.body);
    } catch (const json::parse_error& e) {
        spdlog::debug("[TransferClient] invalid JSON status={} error={}", status, e.what());
        return Err<json>(RemoteError::format("Invalid response from Telegram", status));
    }
    if (!body.is_object()) {
        return Err<json>(RemoteError::format("Invalid response from Telegram", status));
    }

    if (bool_field(body, "ok")) {
        const auto result = body.find("result");
        if (result == body.end()) {
            return Err<json>(RemoteError::format("Telegram response has no result", status));
        }
        return Ok<json, RemoteError>(*result);
    }

    const auto description = redact(string_field(body, "description"));
    const auto code = int_field(body, "error_code").value_or(status);

    if (code == 429 || contains_icase(description, "retry after")) {
        std::chrono::seconds wait{0};
        const auto parameters = body.find("parameters");
        if (parameters != body.end() && parameters->is_object()) {
            const auto requested = int_field(*parameters, "retry_after").value_or(0);
            wait = std::chrono::seconds(std::clamp<std::int64_t>(requested, 0, kMaxRateLimitWait.count()));
        }
        if (wait.count() <= 0) {
            wait = parse_retry_after_header(http);
        }
        if (wait.count() <= 0) {
            wait = kDefaultRateLimitWait;
        }
        return Err<json>(RemoteError::rate_limited(fmt::format("Rate limited. Retry after {}s", wait.count()),
                                                   wait, static_cast<int>(code)));
    }

    if (code >= 500) {
        return Err<json>(RemoteError::transient(
            description.empty() ? fmt::format("Telegram server error (HTTP {})", code) : description,
            static_cast<int>(code)));
    }

    if (code == 401 || (code == 404 && description == "Not Found")) {
        return Err<json>(RemoteError::permanent("Bot token is invalid or revoked.", static_cast<int>(code)));
    }

    return Err<json>(RemoteError::permanent(
        description.empty() ? fmt::format("Telegram request failed (HTTP {})", code) : translate_error(description),
        static_cast<int>(code)));
}

RemoteResult<json> TransferClient::call(const std::string& method,
                                        const network::FormFields& params,
                                        std::chrono::seconds timeout) {
    network::HttpRequest request;
    request.url = method_url(method);
    if (params.empty()) {
        request.method = network::HttpMethod::GET;
    } else {
        request.method = network::HttpMethod::POST;
        request.set_header("Content-Type", "application/x-www-form-urlencoded");
        request.body = network::encode_query(params);
    }

    auto response = transport_.send(request, timeout);
    if (response.is_ok()) {
        spdlog::debug("[TransferClient] method={} status={}", method, response.value().status_code);
    }
    return interpret(response);
}

RemoteResult<Identity> TransferClient::validate_credential() {
    auto result = retry_.run("getMe", [&] { return call("getMe", {}, api_timeout_); });
    if (result.is_error()) {
        return Err<Identity>(result.error());
    }

    const auto& me = result.value();
    const auto id = me.is_object() ? int_field(me, "id") : std::nullopt;
    if (!id) {
        return Err<Identity>(RemoteError::format("Telegram returned an incomplete bot profile"));
    }

    Identity identity;
    identity.id = *id;
    identity.username = string_field(me, "username");
    identity_ = identity;

    spdlog::debug("[TransferClient] validated bot id={} username={}", identity.id, identity.username);
    return Ok<Identity, RemoteError>(std::move(identity));
}

RemoteResult<DestinationAccess> TransferClient::check_destination_permission(const std::string& destination_id) {
    if (!identity_) {
        auto me = validate_credential();
        if (me.is_error()) {
            return Err<DestinationAccess>(me.error());
        }
    }

    auto chat = retry_.run("getChat", [&] { return call("getChat", {{"chat_id", destination_id}}, api_timeout_); });
    if (chat.is_error()) {
        return Err<DestinationAccess>(chat.error());
    }

    const network::FormFields member_params = {
        {"chat_id", destination_id},
        {"user_id", std::to_string(identity_->id)},
    };
    auto member = retry_.run("getChatMember", [&] { return call("getChatMember", member_params, api_timeout_); });
    if (member.is_error()) {
        auto error = member.error();
        error.message = "Cannot check bot status: " + error.message;
        return Err<DestinationAccess>(std::move(error));
    }

    const auto& info = member.value();
    const auto role = info.is_object() ? string_field(info, "status") : std::string();

    if (role == "administrator" && !bool_field(info, "can_post_messages")) {
        return Err<DestinationAccess>(RemoteError::permanent(
            "Bot is admin but lacks permission to post messages. "
            "Enable \"Post Messages\" in the bot's admin permissions."));
    }
    if (role != "creator" && role != "administrator") {
        return Err<DestinationAccess>(RemoteError::permanent(
            "Bot must be an administrator in the channel (current status: " +
            (role.empty() ? std::string("unknown") : role) + ")."));
    }

    DestinationAccess access;
    access.role = role;
    if (chat.value().is_object()) {
        access.title = string_field(chat.value(), "title");
        access.type = string_field(chat.value(), "type");
    }
    return Ok<DestinationAccess, RemoteError>(std::move(access));
}

RemoteResult<TransferReceipt> TransferClient::transfer_object(const std::string& destination_id,
                                                              const fs::path& local_path) {
    const auto name = local_path.filename().string();

    std::error_code ec;
    const auto size = fs::file_size(local_path, ec);
    if (ec) {
        return Err<TransferReceipt>(RemoteError::permanent("File not found: " + name));
    }
    if (size == 0) {
        return Err<TransferReceipt>(RemoteError::permanent("File is empty: " + name));
    }
    if (size > max_object_size_) {
        constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
        auto error = RemoteError::permanent(fmt::format("File too large ({:.2f}GB > {:.2f}GB limit)",
                                                        static_cast<double>(size) / kGiB,
                                                        static_cast<double>(max_object_size_) / kGiB));
        error.kind = ErrorKind::PayloadTooLarge;
        return Err<TransferReceipt>(std::move(error));
    }

    return retry_.run("sendDocument", [&] { return upload_once(destination_id, local_path, size); });
}

RemoteResult<TransferReceipt> TransferClient::upload_once(const std::string& destination_id,
                                                          const fs::path& local_path,
                                                          std::uint64_t size) {
    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = method_url("sendDocument");

    network::MultipartFile file;
    file.field_name = "document";
    file.file_name = local_path.filename().string();
    file.local_path = local_path.string();

    const auto timeout = transfer_timeout(size);
    spdlog::debug("[TransferClient] sendDocument name={} bytes={} timeout_s={}", file.file_name, size, timeout.count());

    auto response = transport_.send_multipart(request, {{"chat_id", destination_id}}, file, timeout);
    auto result = interpret(response);
    if (result.is_error()) {
        return Err<TransferReceipt>(result.error());
    }

    const auto& message = result.value();
    if (!message.is_object()) {
        return Err<TransferReceipt>(RemoteError::permanent("Upload response is not a message"));
    }

    TransferReceipt receipt;
    receipt.object_id = extract_object_id(message);
    receipt.message_id = int_field(message, "message_id").value_or(0);

    if (!codec_.is_valid_object_id(receipt.object_id)) {
        return Err<TransferReceipt>(RemoteError::permanent("Upload response has no valid file id"));
    }
    if (receipt.message_id <= 0) {
        return Err<TransferReceipt>(RemoteError::permanent("Upload response has no valid message id"));
    }
    return Ok<TransferReceipt, RemoteError>(std::move(receipt));
}

bool TransferClient::delete_object(const std::string& destination_id, std::int64_t message_id) {
    const network::FormFields params = {
        {"chat_id", destination_id},
        {"message_id", std::to_string(message_id)},
    };

    auto result = call("deleteMessage", params, api_timeout_);
    if (result.is_error()) {
        spdlog::warn("[TransferClient] deleteMessage message_id={} failed: {}", message_id, result.error().message);
        return false;
    }
    if (!result.value().is_boolean() || !result.value().get<bool>()) {
        spdlog::warn("[TransferClient] deleteMessage message_id={} not confirmed", message_id);
        return false;
    }
    return true;
}

} // namespace chsync::remote
