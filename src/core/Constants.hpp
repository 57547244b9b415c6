#pragma once

#include <cstddef>

/**
 * @brief Porcelain format constants used throughout the codebase
 *
 * Centralizes magic values of the `git blame --line-porcelain` format.
 */
namespace blamer {

namespace Constants {
    // Hash constants
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 produces 40-char hex strings
    constexpr size_t SHORT_HASH_LENGTH = 7;       // Abbreviated commit id length
    constexpr const char* UNCOMMITTED_HASH = "0000000000000000000000000000000000000000";

    // Line grammar
    constexpr char CONTENT_MARKER = '\t';         // Prefix of the line that ends a blob
    constexpr char KEY_SEPARATOR = ' ';           // Separates a metadata key from its value
    constexpr const char* BOUNDARY_KEYWORD = "boundary";
    constexpr const char* NO_HEADER_MESSAGE = "no header";

    // Rendering
    constexpr int LINE_NUMBER_WIDTH = 4;          // Zero-padded width of line numbers
}
}
