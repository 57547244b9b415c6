#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace blamer {

/**
 * @brief Tolerant text helpers used by the porcelain parser
 *
 * None of these functions fail. Malformed input degrades to a caller
 * supplied fallback or to an empty result, which keeps the parser's
 * "never reject on bad data" policy in one place.
 */
namespace ParseUtils {

/**
 * @brief Parse an unsigned decimal integer, or return a fallback
 *
 * The whole of @p text must be decimal digits, optionally preceded by a
 * single '+'. Empty text, any other character, or a value that does not
 * fit in 64 bits yields @p fallback.
 *
 * Examples:
 *   parseUnsignedOr("1744981061", 0) -> 1744981061
 *   parseUnsignedOr("12a", 0)        -> 0
 *   parseUnsignedOr("-3", 7)         -> 7
 */
uint64_t parseUnsignedOr(std::string_view text, uint64_t fallback);

/**
 * @brief Split on runs of whitespace, dropping empty tokens
 *
 * Leading and trailing whitespace never produce tokens, so "  a  b " yields
 * {"a", "b"} and an all-blank string yields an empty vector.
 */
std::vector<std::string_view> splitWhitespace(std::string_view text);

/**
 * @brief Split at the first occurrence of @p sep
 * @return (before, after) with the separator removed, or nullopt when
 *         @p sep does not occur
 */
std::optional<std::pair<std::string_view, std::string_view>> splitOnce(std::string_view text, char sep);

/// True if @p text begins with @p prefix
inline bool startsWith(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

}  // namespace ParseUtils

}  // namespace blamer
