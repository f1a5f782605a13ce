#pragma once

/**
 * @file index_client.hpp
 * @brief Resilient client for the metadata index server
 *
 * ENDPOINTS:
 * GET  {server}/health
 * GET  {server}{prefix}/bot-status/{token}
 * GET  {server}{prefix}/bot-metadata/{token}
 * POST {server}{prefix}/upload   {botToken, channelId, botUsername, metadata}
 *
 * STATUS MAPPING:
 * 404        NotFound (a normal answer for a first upload)
 * 413        PayloadTooLarge
 * 429        RateLimited, wait from Retry-After, body retryAfter or
 *            parameters.retry_after (30s when none is given)
 * 502-504    Transient
 *
 * Bodies are only parsed when the response declares application/json; an
 * HTML error page is a Format error, never a success.
 */

#include "chsync/core/config.hpp"
#include "chsync/network/http_client.hpp"
#include "chsync/remote/errors.hpp"
#include "chsync/remote/retry_policy.hpp"
#include "chsync/tree/codec.hpp"
#include "chsync/tree/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace chsync::remote {

struct ServerStatus {
    std::string status;
    std::string bot_id;
    std::string bot_username;
    bool owner_registered = false;
    std::optional<nlohmann::json> metadata;
};

struct PersistReceipt {
    std::string assigned_id;
    std::string status;
    std::string message;
    bool is_update = false;
    std::optional<double> change_percentage;
};

class IndexClient {
public:
    IndexClient(network::HttpTransport& transport, RetryPolicy& retry, const Settings& settings);

    /// Health check with the short health timeout
    Result<void, RemoteError> probe_connectivity();

    /**
     * @brief Previously persisted tree for this credential
     *
     * ErrorKind::NotFound when the server has none (404, or success with no
     * metadata). A tree that fails structural validation is a Format error.
     */
    RemoteResult<tree::TreeNode> fetch_tree(const std::string& credential);

    RemoteResult<ServerStatus> fetch_status(const std::string& credential);

    /**
     * @brief Serialize tree and store it as the new remote tree
     *
     * The request body is measured first; above max_payload_bytes the call
     * fails with PayloadTooLarge without touching the network. Server-side
     * rejections keep their itemized details.
     */
    RemoteResult<PersistReceipt> persist_tree(const std::string& credential,
                                              const std::string& destination_id,
                                              const std::string& bot_username,
                                              const tree::TreeNode& tree);

    const tree::TreeCodec& codec() const noexcept { return codec_; }

private:
    RemoteResult<nlohmann::json> request(network::HttpMethod method,
                                         const std::string& url,
                                         const std::string& body,
                                         const std::string& secret);

    RemoteResult<nlohmann::json> interpret(const Result<network::HttpResponse, network::TransportError>& response,
                                           const std::string& secret) const;

    std::string api_url(const std::string& path) const;

    network::HttpTransport& transport_;
    RetryPolicy& retry_;
    tree::TreeCodec codec_;
    std::string server_url_;
    std::string api_prefix_;
    std::chrono::seconds api_timeout_;
    std::chrono::seconds health_timeout_;
    std::size_t max_payload_bytes_;
};

} // namespace chsync::remote
