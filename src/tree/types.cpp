#include "chsync/tree/types.hpp"

#include <algorithm>
#include <cctype>

namespace chsync::tree {

bool name_less(const std::string& lhs, const std::string& rhs) {
    const auto lower = [](unsigned char c) { return static_cast<char>(std::tolower(c)); };
    const bool less_ci = std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [&](char a, char b) { return lower(static_cast<unsigned char>(a)) < lower(static_cast<unsigned char>(b)); });
    if (less_ci) {
        return true;
    }
    const bool greater_ci = std::lexicographical_compare(
        rhs.begin(), rhs.end(), lhs.begin(), lhs.end(),
        [&](char a, char b) { return lower(static_cast<unsigned char>(a)) < lower(static_cast<unsigned char>(b)); });
    if (greater_ci) {
        return false;
    }
    // Equal ignoring case: fall back to bytewise so the order is total
    return lhs < rhs;
}

bool FolderNameLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return name_less(lhs, rhs);
}

std::string join_path(const std::string& parent, const std::string& name) {
    if (parent.empty()) {
        return name;
    }
    return parent + '/' + name;
}

bool is_valid_utf8(const std::string& text) noexcept {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            i++;
            continue;
        }

        std::size_t length = 0;
        unsigned char min_second = 0x80;
        unsigned char max_second = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                min_second = 0xA0;
            } else if (lead == 0xED) {
                max_second = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                min_second = 0x90;
            } else if (lead == 0xF4) {
                max_second = 0x8F;
            }
        } else {
            return false;
        }

        if (n - i < length) {
            return false;
        }
        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < min_second || second > max_second) {
            return false;
        }
        for (std::size_t k = 2; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

} // namespace chsync::tree
