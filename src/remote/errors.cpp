#include "chsync/remote/errors.hpp"

#include "chsync/network/http_types.hpp"

namespace chsync::remote {
namespace {

constexpr const char* kMask = "***";

void replace_all(std::string& text, const std::string& needle) {
    if (needle.empty()) {
        return;
    }
    std::string::size_type pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), kMask);
        pos += std::char_traits<char>::length(kMask);
    }
}

} // namespace

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Permanent: return "permanent";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::RateLimited: return "rate_limited";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::PayloadTooLarge: return "payload_too_large";
        case ErrorKind::Format: return "format";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string RemoteError::describe() const {
    std::string text = message;
    for (const auto& detail : details) {
        text += "\n  - " + detail;
    }
    return text;
}

std::string redact_secret(const std::string& text, const std::string& secret) {
    std::string result = text;
    replace_all(result, secret);
    const auto encoded = network::url_encode(secret);
    if (encoded != secret) {
        replace_all(result, encoded);
    }
    return result;
}

} // namespace chsync::remote
