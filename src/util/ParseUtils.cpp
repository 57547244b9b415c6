#include "util/ParseUtils.hpp"

#include <cctype>
#include <limits>

namespace blamer {

namespace ParseUtils {

uint64_t parseUnsignedOr(std::string_view text, uint64_t fallback) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) return fallback;

    constexpr uint64_t maxValue = std::numeric_limits<uint64_t>::max();
    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return fallback;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        // Overflow check before the multiply-add
        if (value > (maxValue - digit) / 10) return fallback;
        value = value * 10 + digit;
    }
    return value;
}

std::vector<std::string_view> splitWhitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

std::optional<std::pair<std::string_view, std::string_view>> splitOnce(std::string_view text, char sep) {
    size_t pos = text.find(sep);
    if (pos == std::string_view::npos) return std::nullopt;
    return std::make_pair(text.substr(0, pos), text.substr(pos + 1));
}

}  // namespace ParseUtils

}  // namespace blamer
