#include "chsync/network/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <spdlog/spdlog.h>

#include <openssl/ssl.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace chsync::network {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr const char* kUserAgent = "channel-sync/1.0";
constexpr std::uint64_t kMaxResponseBytes = 64ULL * 1024 * 1024;
constexpr std::size_t kChunkSize = 64 * 1024;

/**
 * Start one async operation and drive the io_context until it completes.
 * Deadlines come from beast::tcp_stream::expires_after, so run() always
 * returns.
 */
template<typename Initiate>
boost::system::error_code run_io(asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = asio::error::would_block;
    initiate([&result](const boost::system::error_code& ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    return result;
}

TransportError make_error(TransportError::Kind kind, const boost::system::error_code& ec) {
    if (ec == beast::error::timeout) {
        return TransportError{TransportError::Kind::Timeout, "Request timed out"};
    }
    if (ec.category() == asio::error::get_ssl_category()) {
        kind = TransportError::Kind::Tls;
    }
    return TransportError{kind, ec.message()};
}

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::DELETE_METHOD: return http::verb::delete_;
    }
    return http::verb::get;
}

std::string host_header(const Url& url) {
    const bool default_port = (url.is_tls() && url.port == "443") || (!url.is_tls() && url.port == "80");
    return default_port ? url.host : url.host + ":" + url.port;
}

template<typename Message>
void apply_headers(Message& message, const Url& url, const HttpRequest& request) {
    message.set(http::field::host, host_header(url));
    message.set(http::field::user_agent, kUserAgent);
    for (const auto& [name, value] : request.headers) {
        message.set(name, value);
    }
}

std::string make_boundary() {
    static constexpr char kHex[] = "0123456789abcdef";
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> digit(0, 15);

    std::string boundary = "----chsync";
    for (int i = 0; i < 24; ++i) {
        boundary.push_back(kHex[digit(generator)]);
    }
    return boundary;
}

std::string sanitize_disposition(std::string value) {
    for (auto& c : value) {
        if (c == '"' || c == '\r' || c == '\n') {
            c = '_';
        }
    }
    return value;
}

template<typename Stream>
Result<HttpResponse, TransportError> read_response(asio::io_context& io,
                                                   Stream& stream,
                                                   beast::flat_buffer& buffer,
                                                   bool& keep_alive) {
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxResponseBytes);

    const auto ec = run_io(io, [&](auto handler) { http::async_read(stream, buffer, parser, handler); });
    if (ec) {
        return Err<HttpResponse>(make_error(TransportError::Kind::Read, ec));
    }

    auto message = parser.release();
    HttpResponse response;
    response.status_code = static_cast<int>(message.result_int());
    response.reason_phrase = std::string(message.reason());
    for (const auto& field : message) {
        response.headers[std::string(field.name_string())] = std::string(field.value());
    }
    response.body = std::move(message.body());
    keep_alive = message.keep_alive();
    return Ok<HttpResponse, TransportError>(std::move(response));
}

} // namespace

const char* to_string(TransportError::Kind kind) noexcept {
    switch (kind) {
        case TransportError::Kind::InvalidUrl: return "invalid_url";
        case TransportError::Kind::Resolve: return "resolve";
        case TransportError::Kind::Connect: return "connect";
        case TransportError::Kind::Tls: return "tls";
        case TransportError::Kind::Write: return "write";
        case TransportError::Kind::Read: return "read";
        case TransportError::Kind::Timeout: return "timeout";
        case TransportError::Kind::File: return "file";
    }
    return "unknown";
}

struct HttpClient::Connection {
    std::string scheme;
    std::string host;
    std::string port;
    std::unique_ptr<beast::tcp_stream> plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls;
    beast::flat_buffer buffer;

    beast::tcp_stream& lowest() {
        return tls ? beast::get_lowest_layer(*tls) : *plain;
    }

    bool matches(const Url& url) const {
        return scheme == url.scheme && host == url.host && port == url.port;
    }

    template<typename F>
    auto with_stream(F&& f) {
        return tls ? f(*tls) : f(*plain);
    }
};

HttpClient::HttpClient()
    : ssl_context_(ssl::context::tls_client) {
    boost::system::error_code ec;
    ssl_context_.set_default_verify_paths(ec);
    if (ec) {
        spdlog::warn("[HttpClient] could not load system CA certificates: {}", ec.message());
    }
    ssl_context_.set_verify_mode(ssl::verify_peer);
}

HttpClient::~HttpClient() {
    close();
}

void HttpClient::close() {
    if (!connection_) {
        return;
    }

    auto& stream = connection_->lowest();
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != asio::error::not_connected) {
        spdlog::debug("[HttpClient] shutdown host={} error={}", connection_->host, ec.message());
    }
    stream.close();
    connection_.reset();
}

Result<void, TransportError> HttpClient::connect(const Url& url, std::chrono::seconds timeout, bool& reused) {
    reused = false;
    if (connection_ && connection_->matches(url) && connection_->lowest().socket().is_open()) {
        reused = true;
        return Ok<TransportError>();
    }
    close();

    auto connection = std::make_unique<Connection>();
    connection->scheme = url.scheme;
    connection->host = url.host;
    connection->port = url.port;

    // The resolver has no deadline of its own; bound it with run_for()
    tcp::resolver resolver(io_context_);
    tcp::resolver::results_type endpoints;
    boost::system::error_code ec = asio::error::would_block;
    resolver.async_resolve(url.host, url.port,
                           [&](const boost::system::error_code& e, tcp::resolver::results_type results) {
                               ec = e;
                               endpoints = std::move(results);
                           });
    io_context_.restart();
    io_context_.run_for(timeout);
    if (ec == asio::error::would_block) {
        resolver.cancel();
        io_context_.restart();
        io_context_.run();
        return Err<void>(TransportError{TransportError::Kind::Timeout, "Timed out resolving " + url.host});
    }
    if (ec) {
        return Err<void>(make_error(TransportError::Kind::Resolve, ec));
    }

    if (url.is_tls()) {
        connection->tls = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(io_context_, ssl_context_);
    } else {
        connection->plain = std::make_unique<beast::tcp_stream>(io_context_);
    }

    auto& lowest = connection->lowest();
    lowest.expires_after(timeout);
    ec = run_io(io_context_, [&](auto handler) { lowest.async_connect(endpoints, handler); });
    if (ec) {
        return Err<void>(make_error(TransportError::Kind::Connect, ec));
    }

    if (connection->tls) {
        auto& tls = *connection->tls;
        if (!SSL_set_tlsext_host_name(tls.native_handle(), url.host.c_str())) {
            return Err<void>(TransportError{TransportError::Kind::Tls, "Failed to set TLS server name"});
        }
        tls.set_verify_callback(ssl::host_name_verification(url.host));

        lowest.expires_after(timeout);
        ec = run_io(io_context_, [&](auto handler) { tls.async_handshake(ssl::stream_base::client, handler); });
        if (ec) {
            return Err<void>(make_error(TransportError::Kind::Tls, ec));
        }
    }

    spdlog::debug("[HttpClient] connected scheme={} host={} port={}", url.scheme, url.host, url.port);
    connection_ = std::move(connection);
    return Ok<TransportError>();
}

template<typename WriteFn>
Result<HttpResponse, TransportError> HttpClient::perform(const std::string& url_text,
                                                         std::chrono::seconds timeout,
                                                         WriteFn&& write) {
    auto url = Url::parse(url_text);
    if (url.is_error()) {
        return Err<HttpResponse>(TransportError{TransportError::Kind::InvalidUrl, url.error()});
    }

    for (int attempt = 0;; ++attempt) {
        bool reused = false;
        auto connected = connect(url.value(), timeout, reused);
        if (connected.is_error()) {
            close();
            return Err<HttpResponse>(connected.error());
        }

        bool keep_alive = false;
        auto response = connection_->with_stream([&](auto& stream) -> Result<HttpResponse, TransportError> {
            beast::get_lowest_layer(stream).expires_after(timeout);
            auto written = write(stream, url.value());
            if (written.is_error()) {
                return Err<HttpResponse>(written.error());
            }
            return read_response(io_context_, stream, connection_->buffer, keep_alive);
        });

        if (response.is_error()) {
            const auto kind = response.error().kind;
            close();
            // An idle keep-alive connection may have been closed by the server
            if (reused && attempt == 0 && (kind == TransportError::Kind::Write || kind == TransportError::Kind::Read)) {
                spdlog::debug("[HttpClient] stale connection to {}, reconnecting", url.value().host);
                continue;
            }
            return response;
        }

        if (!keep_alive) {
            close();
        }
        return response;
    }
}

Result<HttpResponse, TransportError> HttpClient::send(const HttpRequest& request, std::chrono::seconds timeout) {
    return perform(request.url, timeout, [&](auto& stream, const Url& url) -> Result<void, TransportError> {
        http::request<http::string_body> message{to_verb(request.method), url.target, 11};
        apply_headers(message, url, request);
        message.body() = request.body;
        message.prepare_payload();

        const auto ec = run_io(io_context_, [&](auto handler) { http::async_write(stream, message, handler); });
        if (ec) {
            return Err<void>(make_error(TransportError::Kind::Write, ec));
        }
        return Ok<TransportError>();
    });
}

Result<HttpResponse, TransportError> HttpClient::send_multipart(const HttpRequest& request,
                                                                const FormFields& fields,
                                                                const MultipartFile& file,
                                                                std::chrono::seconds timeout) {
    std::error_code size_error;
    const auto file_size = std::filesystem::file_size(file.local_path, size_error);
    if (size_error) {
        return Err<HttpResponse>(TransportError{TransportError::Kind::File,
                                                "Cannot read file size: " + size_error.message()});
    }

    std::ifstream input(file.local_path, std::ios::binary);
    if (!input) {
        return Err<HttpResponse>(TransportError{TransportError::Kind::File, "Cannot open file for reading"});
    }

    const auto boundary = make_boundary();

    std::string prefix;
    for (const auto& [name, value] : fields) {
        prefix += "--" + boundary + "\r\n";
        prefix += "Content-Disposition: form-data; name=\"" + sanitize_disposition(name) + "\"\r\n\r\n";
        prefix += value + "\r\n";
    }
    prefix += "--" + boundary + "\r\n";
    prefix += "Content-Disposition: form-data; name=\"" + sanitize_disposition(file.field_name) +
              "\"; filename=\"" + sanitize_disposition(file.file_name) + "\"\r\n";
    prefix += "Content-Type: " + file.content_type + "\r\n\r\n";

    const std::string suffix = "\r\n--" + boundary + "--\r\n";
    const std::uint64_t content_length = prefix.size() + file_size + suffix.size();

    return perform(request.url, timeout, [&](auto& stream, const Url& url) -> Result<void, TransportError> {
        input.clear();
        input.seekg(0);

        http::request<http::empty_body> header{http::verb::post, url.target, 11};
        apply_headers(header, url, request);
        header.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
        header.content_length(content_length);

        http::request_serializer<http::empty_body> serializer{header};
        auto ec = run_io(io_context_, [&](auto handler) { http::async_write_header(stream, serializer, handler); });
        if (ec) {
            return Err<void>(make_error(TransportError::Kind::Write, ec));
        }

        ec = run_io(io_context_, [&](auto handler) { asio::async_write(stream, asio::buffer(prefix), handler); });
        if (ec) {
            return Err<void>(make_error(TransportError::Kind::Write, ec));
        }

        std::vector<char> chunk(kChunkSize);
        std::uint64_t sent = 0;
        while (sent < file_size) {
            input.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            const auto count = input.gcount();
            if (count <= 0) {
                break;
            }
            ec = run_io(io_context_, [&](auto handler) {
                asio::async_write(stream, asio::buffer(chunk.data(), static_cast<std::size_t>(count)), handler);
            });
            if (ec) {
                return Err<void>(make_error(TransportError::Kind::Write, ec));
            }
            sent += static_cast<std::uint64_t>(count);
        }
        if (sent != file_size) {
            return Err<void>(TransportError{TransportError::Kind::File, "File changed while uploading"});
        }

        ec = run_io(io_context_, [&](auto handler) { asio::async_write(stream, asio::buffer(suffix), handler); });
        if (ec) {
            return Err<void>(make_error(TransportError::Kind::Write, ec));
        }
        return Ok<TransportError>();
    });
}

} // namespace chsync::network
