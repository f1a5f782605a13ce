#include "chsync/network/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace chsync::network {
namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::string find_header(const std::unordered_map<std::string, std::string>& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return "";
}

} // namespace

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::DELETE_METHOD: return "DELETE";
    }
    return "UNKNOWN";
}

bool iequals(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos) {
        return Err<Url>(std::string("URL has no scheme"));
    }

    Url url;
    url.scheme = lowercase(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>("Unsupported URL scheme: " + url.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = text.find_first_of("/?", authority_start);
    const auto authority = text.substr(authority_start,
                                       path_start == std::string::npos ? std::string::npos
                                                                       : path_start - authority_start);
    if (authority.empty()) {
        return Err<Url>(std::string("URL has no host"));
    }
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(std::string("URL user info is not supported"));
    }

    const auto colon = authority.rfind(':');
    const auto bracket = authority.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
        if (url.port.empty() || !std::all_of(url.port.begin(), url.port.end(),
                                             [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return Err<Url>("Invalid URL port: " + url.port);
        }
    } else {
        url.host = authority;
        url.port = url.is_tls() ? "443" : "80";
    }
    if (url.host.size() >= 2 && url.host.front() == '[' && url.host.back() == ']') {
        url.host = url.host.substr(1, url.host.size() - 2);
    }
    if (url.host.empty()) {
        return Err<Url>(std::string("URL has no host"));
    }

    if (path_start != std::string::npos) {
        url.target = text.substr(path_start);
        if (url.target.front() == '?') {
            url.target.insert(url.target.begin(), '/');
        }
    }
    return Ok(std::move(url));
}

std::string HttpRequest::get_header(const std::string& name) const {
    return find_header(headers, name);
}

std::string HttpResponse::get_header(const std::string& name) const {
    return find_header(headers, name);
}

bool HttpResponse::has_content_type(const std::string& media_type) const {
    const auto value = get_header("Content-Type");
    const auto semicolon = value.find(';');
    return iequals(trim(value.substr(0, semicolon)), media_type);
}

std::string url_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[c >> 4]);
            encoded.push_back(kHex[c & 0x0F]);
        }
    }
    return encoded;
}

std::string encode_query(const FormFields& fields) {
    std::string query;
    for (const auto& [name, value] : fields) {
        if (!query.empty()) {
            query.push_back('&');
        }
        query += url_encode(name);
        query.push_back('=');
        query += url_encode(value);
    }
    return query;
}

} // namespace chsync::network
