#pragma once

#include <string_view>
#include <vector>

#include "core/BlameRecord.hpp"
#include "util/Expected.hpp"

namespace blamer {

/**
 * @brief Parser for `git blame --line-porcelain` output
 *
 * Splits the output into blobs, one per blamed line, and hands each blob
 * to BlobParser. The content line (tab prefix) terminates a blob.
 *
 * Only the line-porcelain variant is supported: plain `--porcelain`
 * omits repeated commit metadata, so its later records would come out
 * without author or summary.
 *
 * Usage:
 *   auto res = PorcelainParser::parse(output);
 *   if (!res) { ... res.error().message ... }
 *   for (const auto& record : res.value()) { ... }
 */
class PorcelainParser {
public:
    /**
     * @brief Parse complete blame output into records
     * @param porcelain Entire stdout of git blame
     * @return Records in input order, or the first blob error
     *
     * Empty input yields no records. Lines after the last content line
     * form an unterminated blob and are dropped (logged at warn level).
     */
    static Expected<std::vector<BlameRecord>> parse(std::string_view porcelain);

    /**
     * @brief Segment output into complete blobs without parsing them
     *
     * Each returned blob ends with its content line. Views point into
     * @p porcelain, which must outlive the result.
     */
    static std::vector<std::vector<std::string_view>> splitBlobs(std::string_view porcelain);

    /**
     * @brief Split text into lines
     *
     * Lines end at '\n'; a trailing '\r' is stripped. A final newline does
     * not produce an empty last line.
     */
    static std::vector<std::string_view> splitLines(std::string_view text);

private:
    static std::vector<std::vector<std::string_view>> segment(std::string_view porcelain, size_t& droppedLines);
};

}
