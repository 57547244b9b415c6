#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "core/BlameRecord.hpp"

namespace blamer {

/**
 * @brief Console rendering of parsed blame records
 *
 * Default layout, one block per record:
 *
 *   * 6cebf08: 0001 by mitsu-ksgr <mitsu-ksgr@users.noreply.github.com>
 *   summary: Initial commit
 *   content: `# git-blame-parser`
 *
 * Oneline layout:
 *
 *   6cebf08    1 (mitsu-ksgr 2025-04-18 21:57:41 +0900) # git-blame-parser
 */
namespace BlameRenderer {

enum class Style { Full, Oneline };

void render(std::ostream& out, const BlameRecord& record, Style style);
void renderAll(std::ostream& out, const std::vector<BlameRecord>& records, Style style);

/**
 * @brief Convert a git timezone string ("+0900", "-0130") to seconds
 *
 * Anything that is not a sign followed by four digits yields 0.
 */
int64_t tzOffsetSeconds(const std::string& tz);

/**
 * @brief Format a unix time as "YYYY-MM-DD HH:MM:SS" in the given zone
 *
 * Times too large for std::time_t yield an empty string.
 */
std::string formatTime(uint64_t unixTime, const std::string& tz);

}  // namespace BlameRenderer

}  // namespace blamer
