#pragma once

#include "chsync/core/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chsync::network {

/**
 * @brief HTTP request methods used by the remote clients
 *
 * DELETE is spelled DELETE_METHOD to stay clear of the Windows macro.
 */
enum class HttpMethod {
    GET,
    POST,
    DELETE_METHOD
};

std::string to_string(HttpMethod method);

/**
 * @brief Absolute http(s) URL split into the parts a client connection needs
 *
 * Example:
 * https://api.telegram.org:443/bot<token>/getMe?x=1
 *   scheme = "https", host = "api.telegram.org", port = "443",
 *   target = "/bot<token>/getMe?x=1"
 */
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target = "/";

    bool is_tls() const noexcept { return scheme == "https"; }

    /**
     * @brief Parse an absolute URL; only http and https are accepted
     *
     * The port defaults to 80/443 and the target to "/".
     */
    static Result<Url> parse(const std::string& text);
};

/**
 * @brief Outgoing HTTP request
 *
 * url is absolute; the client derives host, port and target from it.
 * Headers are stored as given, lookups are case-insensitive.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /// Header value, or empty when absent
    std::string get_header(const std::string& name) const;

    /// Set body and Content-Type for a JSON payload
    void set_json_body(std::string json_text) {
        body = std::move(json_text);
        headers["Content-Type"] = "application/json";
    }
};

/**
 * @brief Received HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    /// Header value, or empty when absent
    std::string get_header(const std::string& name) const;

    bool is_success() const noexcept { return status_code >= 200 && status_code < 300; }

    /**
     * @brief True when Content-Type names the given media type
     *
     * Parameters such as "; charset=utf-8" are ignored and the comparison is
     * case-insensitive.
     */
    bool has_content_type(const std::string& media_type) const;
};

/**
 * @brief A file part of a multipart/form-data request, streamed from disk
 */
struct MultipartFile {
    std::string field_name;
    std::string file_name;
    std::string local_path;
    std::string content_type = "application/octet-stream";
};

/// Plain form fields sent ahead of the file part
using FormFields = std::vector<std::pair<std::string, std::string>>;

/// Percent-encode everything except RFC 3986 unreserved characters
std::string url_encode(const std::string& value);

/// "a=1&b=2" with both sides percent-encoded
std::string encode_query(const FormFields& fields);

/// Case-insensitive ASCII comparison
bool iequals(const std::string& lhs, const std::string& rhs);

} // namespace chsync::network
