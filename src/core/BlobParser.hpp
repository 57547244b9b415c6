#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/BlameRecord.hpp"
#include "util/Expected.hpp"

namespace blamer {

/**
 * @brief Parses one porcelain blob into a BlameRecord
 *
 * A blob is the header line, zero or more `<key> <value>` metadata lines
 * and the tab-prefixed content line that ends it.
 *
 * Parsing is tolerant: unknown keys, non-numeric line numbers or times,
 * and a malformed `previous` value fall back to defaults. The only failure
 * is a blob without a header (ErrorCode::NoHeader).
 */
class BlobParser {
public:
    /**
     * @brief Build a record from the lines of one blob
     * @param lines Blob lines without their trailing newline
     * @return Parsed record, or NoHeader if the blob is empty, its first
     *         line has no tokens, or its first line is the content line
     */
    static Expected<BlameRecord> parse(const std::vector<std::string_view>& lines);

    /// Metadata keys that map to record fields, sorted
    static std::vector<std::string> fieldKeys();

private:
    static Expected<void> parseHeader(std::string_view header, BlameRecord& record);
    static void parseBodyLine(std::string_view line, BlameRecord& record);
};

}
