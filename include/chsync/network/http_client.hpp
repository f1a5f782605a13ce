#pragma once

/**
 * @file http_client.hpp
 * @brief Blocking HTTP(S) client used by the remote clients
 *
 * WHY THIS FILE EXISTS:
 * TransferClient and IndexClient only need "send this request, give me the
 * response or tell me why the transport failed". HttpTransport is that seam;
 * HttpClient implements it on Boost.Beast, and tests substitute a scripted
 * fake.
 *
 * CONNECTION LIFETIME:
 * HttpClient keeps one keep-alive connection to the last host it talked to.
 * A request to another host, a server "Connection: close" or any transport
 * error drops it. close() and the destructor release it on every path.
 *
 * TIMEOUTS:
 * Each call takes a deadline covering connect, write and read together. The
 * caller picks it (for uploads it scales with the file size).
 */

#include "chsync/core/result.hpp"
#include "chsync/network/http_types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace chsync::network {

struct TransportError {
    enum class Kind {
        InvalidUrl,
        Resolve,
        Connect,
        Tls,
        Write,
        Read,
        Timeout,
        File
    };

    Kind kind = Kind::Connect;
    std::string message;
};

const char* to_string(TransportError::Kind kind) noexcept;

/**
 * @brief Sends one request and waits for its response
 *
 * A response with any status code is a success at this level; only failures
 * to complete the exchange are TransportErrors.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual Result<HttpResponse, TransportError> send(const HttpRequest& request,
                                                      std::chrono::seconds timeout) = 0;

    /**
     * @brief POST multipart/form-data: fields first, then the file streamed from disk
     *
     * request.method and request.body are ignored.
     */
    virtual Result<HttpResponse, TransportError> send_multipart(const HttpRequest& request,
                                                                const FormFields& fields,
                                                                const MultipartFile& file,
                                                                std::chrono::seconds timeout) = 0;

    /// Release any pooled connection
    virtual void close() {}
};

class HttpClient : public HttpTransport {
public:
    HttpClient();
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    Result<HttpResponse, TransportError> send(const HttpRequest& request,
                                              std::chrono::seconds timeout) override;

    Result<HttpResponse, TransportError> send_multipart(const HttpRequest& request,
                                                        const FormFields& fields,
                                                        const MultipartFile& file,
                                                        std::chrono::seconds timeout) override;

    void close() override;

private:
    struct Connection;

    Result<void, TransportError> connect(const Url& url, std::chrono::seconds timeout, bool& reused);

    template<typename WriteFn>
    Result<HttpResponse, TransportError> perform(const std::string& url,
                                                 std::chrono::seconds timeout,
                                                 WriteFn&& write);

    boost::asio::io_context io_context_;
    boost::asio::ssl::context ssl_context_;
    std::unique_ptr<Connection> connection_;
};

} // namespace chsync::network
