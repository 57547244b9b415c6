#pragma once

#include <string>
#include <string_view>

namespace blamer {

namespace Utf8 {

/// U+FFFD REPLACEMENT CHARACTER encoded as UTF-8
constexpr const char* REPLACEMENT = "\xEF\xBF\xBD";

/**
 * @brief Lossily decode bytes as UTF-8
 *
 * Valid sequences are copied unchanged. Each maximal invalid subpart
 * (truncated sequence, overlong form, surrogate, stray continuation
 * byte, value above U+10FFFF) is replaced with a single U+FFFD.
 *
 * git prints file contents as raw bytes, so blame output of a Latin-1
 * source file would otherwise carry invalid UTF-8 into the records.
 */
std::string sanitize(std::string_view bytes);

/// True if @p bytes is entirely well-formed UTF-8
bool isValid(std::string_view bytes);

}  // namespace Utf8

}  // namespace blamer
