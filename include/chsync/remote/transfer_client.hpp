#pragma once

/**
 * @file transfer_client.hpp
 * @brief Resilient client for the object store (Telegram Bot API)
 *
 * WHY THIS FILE EXISTS:
 * Files are stored as documents posted to a channel. This client hides the
 * Bot API behind four operations and turns every failure into a classified
 * RemoteError, so the orchestrator never inspects HTTP.
 *
 * CALLS:
 * validate_credential()           getMe
 * check_destination_permission()  getChat + getChatMember
 * transfer_object()               sendDocument (multipart, streamed)
 * delete_object()                 deleteMessage (single attempt, best effort)
 *
 * The first three go through the RetryPolicy. The credential is part of every
 * URL and is scrubbed from every message this class produces.
 */

#include "chsync/core/config.hpp"
#include "chsync/network/http_client.hpp"
#include "chsync/remote/errors.hpp"
#include "chsync/remote/retry_policy.hpp"
#include "chsync/tree/codec.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace chsync::remote {

struct Identity {
    std::int64_t id = 0;
    std::string username;
};

struct DestinationAccess {
    std::string title;
    std::string type;
    std::string role;   ///< "creator" or "administrator"
};

struct TransferReceipt {
    std::string object_id;
    std::int64_t message_id = 0;
};

class TransferClient {
public:
    TransferClient(network::HttpTransport& transport,
                   RetryPolicy& retry,
                   const Settings& settings,
                   std::string credential);

    RemoteResult<Identity> validate_credential();

    /**
     * @brief Require creator, or administrator with can_post_messages
     *
     * Resolves the caller's identity first when validate_credential() has not
     * run yet.
     */
    RemoteResult<DestinationAccess> check_destination_permission(const std::string& destination_id);

    /**
     * @brief Upload one file as a document
     *
     * Succeeds only when the response carries an object id of valid shape and
     * a positive message id.
     */
    RemoteResult<TransferReceipt> transfer_object(const std::string& destination_id,
                                                  const std::filesystem::path& local_path);

    /// Failures are logged and reported as false
    bool delete_object(const std::string& destination_id, std::int64_t message_id);

    /// Request deadline for a file of this size, within the configured bounds
    std::chrono::seconds transfer_timeout(std::uint64_t size) const;

    /// Friendlier text for known Bot API error descriptions
    static std::string translate_error(const std::string& description);

    const std::optional<Identity>& identity() const noexcept { return identity_; }

private:
    RemoteResult<nlohmann::json> call(const std::string& method,
                                      const network::FormFields& params,
                                      std::chrono::seconds timeout);

    RemoteResult<nlohmann::json> interpret(const Result<network::HttpResponse, network::TransportError>& response) const;

    RemoteResult<TransferReceipt> upload_once(const std::string& destination_id,
                                              const std::filesystem::path& local_path,
                                              std::uint64_t size);

    std::string method_url(const std::string& method) const;

    std::string redact(const std::string& text) const { return redact_secret(text, credential_); }

    network::HttpTransport& transport_;
    RetryPolicy& retry_;
    std::string api_base_url_;
    std::string credential_;
    std::chrono::seconds api_timeout_;
    std::chrono::seconds transfer_timeout_min_;
    std::chrono::seconds transfer_timeout_max_;
    std::uint64_t throughput_;
    std::uint64_t max_object_size_;
    tree::TreeCodec codec_;   ///< Object ids must be accepted by the exchange form
    std::optional<Identity> identity_;
};

} // namespace chsync::remote
