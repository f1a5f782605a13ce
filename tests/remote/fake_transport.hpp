#pragma once

/**
 * @file fake_transport.hpp
 * @brief Scripted HttpTransport and Sleeper for client and orchestrator tests
 *
 * Routes are matched in registration order by URL substring; an unmatched
 * request gets a JSON 404. Every request is recorded.
 */

#include "chsync/core/cancellation.hpp"
#include "chsync/network/http_client.hpp"
#include "chsync/remote/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace chsync::testing {

using TransportResult = Result<network::HttpResponse, network::TransportError>;

inline network::HttpResponse json_response(int status, const nlohmann::json& body) {
    network::HttpResponse response;
    response.status_code = status;
    response.headers["Content-Type"] = "application/json; charset=utf-8";
    response.body = body.dump();
    return response;
}

inline network::HttpResponse text_response(int status, const std::string& body, const std::string& type = "text/html") {
    network::HttpResponse response;
    response.status_code = status;
    response.headers["Content-Type"] = type;
    response.body = body;
    return response;
}

inline TransportResult reply(network::HttpResponse response) {
    return Ok<network::HttpResponse, network::TransportError>(std::move(response));
}

inline TransportResult transport_failure(network::TransportError::Kind kind, std::string message) {
    return Err<network::HttpResponse>(network::TransportError{kind, std::move(message)});
}

/// {"ok": true, "result": ...}
inline TransportResult telegram_ok(const nlohmann::json& result) {
    return reply(json_response(200, {{"ok", true}, {"result", result}}));
}

inline TransportResult telegram_error(int code, const std::string& description) {
    return reply(json_response(code, {{"ok", false}, {"error_code", code}, {"description", description}}));
}

class FakeTransport : public network::HttpTransport {
public:
    using Handler = std::function<TransportResult(const network::HttpRequest&)>;

    struct MultipartCall {
        network::HttpRequest request;
        network::FormFields fields;
        network::MultipartFile file;
        std::chrono::seconds timeout{0};
    };

    void on(std::string url_fragment, Handler handler) {
        std::lock_guard lock(mutex_);
        routes_.emplace_back(std::move(url_fragment), std::move(handler));
    }

    TransportResult send(const network::HttpRequest& request, std::chrono::seconds /*timeout*/) override {
        Handler handler;
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(request);
            handler = find(request.url);
        }
        return handler ? handler(request) : reply(json_response(404, {{"error", "no route"}}));
    }

    TransportResult send_multipart(const network::HttpRequest& request,
                                   const network::FormFields& fields,
                                   const network::MultipartFile& file,
                                   std::chrono::seconds timeout) override {
        Handler handler;
        network::HttpRequest recorded = request;
        recorded.method = network::HttpMethod::POST;
        recorded.body = network::encode_query(fields);
        {
            std::lock_guard lock(mutex_);
            requests_.push_back(recorded);
            multipart_.push_back(MultipartCall{recorded, fields, file, timeout});
            handler = find(request.url);
        }
        return handler ? handler(recorded) : reply(json_response(404, {{"error", "no route"}}));
    }

    void close() override {
        std::lock_guard lock(mutex_);
        close_calls_++;
    }

    /// Number of recorded requests whose URL contains fragment
    std::size_t count(const std::string& fragment) const {
        std::lock_guard lock(mutex_);
        std::size_t n = 0;
        for (const auto& request : requests_) {
            if (request.url.find(fragment) != std::string::npos) {
                n++;
            }
        }
        return n;
    }

    std::vector<network::HttpRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    std::vector<MultipartCall> multipart_calls() const {
        std::lock_guard lock(mutex_);
        return multipart_;
    }

    int close_calls() const {
        std::lock_guard lock(mutex_);
        return close_calls_;
    }

private:
    Handler find(const std::string& url) const {
        for (const auto& [fragment, handler] : routes_) {
            if (url.find(fragment) != std::string::npos) {
                return handler;
            }
        }
        return nullptr;
    }

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Handler>> routes_;
    std::vector<network::HttpRequest> requests_;
    std::vector<MultipartCall> multipart_;
    int close_calls_ = 0;
};

/**
 * @brief Records requested waits instead of sleeping
 *
 * With cancel_after set, the token passed to sleep_for is cancelled on that
 * call (1-based) and the wait reports cancellation.
 */
class RecordingSleeper : public remote::Sleeper {
public:
    bool sleep_for(std::chrono::milliseconds duration, const CancellationToken& token) override {
        std::lock_guard lock(mutex_);
        waits_.push_back(duration);
        if (cancel_after_ > 0 && waits_.size() >= cancel_after_) {
            token.cancel();
        }
        return !token.is_cancelled();
    }

    void cancel_after(std::size_t calls) { cancel_after_ = calls; }

    std::vector<std::chrono::milliseconds> waits() const {
        std::lock_guard lock(mutex_);
        return waits_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::chrono::milliseconds> waits_;
    std::size_t cancel_after_ = 0;
};

} // namespace chsync::testing
