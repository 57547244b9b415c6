#include "cli/BlameRenderer.hpp"

#include <ctime>
#include <iomanip>
#include <limits>

#include "core/Constants.hpp"

namespace blamer {

namespace BlameRenderer {

int64_t tzOffsetSeconds(const std::string& tz) {
    if (tz.size() != 5 || (tz[0] != '+' && tz[0] != '-')) return 0;
    for (size_t i = 1; i < tz.size(); ++i) {
        if (tz[i] < '0' || tz[i] > '9') return 0;
    }
    int64_t hours = (tz[1] - '0') * 10 + (tz[2] - '0');
    int64_t minutes = (tz[3] - '0') * 10 + (tz[4] - '0');
    int64_t seconds = hours * 3600 + minutes * 60;
    return tz[0] == '-' ? -seconds : seconds;
}

std::string formatTime(uint64_t unixTime, const std::string& tz) {
    // Leave room for the largest timezone offset before converting
    constexpr uint64_t maxTime = static_cast<uint64_t>(std::numeric_limits<std::time_t>::max() - 86400);
    if (unixTime > maxTime) return "";
    std::time_t shifted = static_cast<std::time_t>(unixTime) + static_cast<std::time_t>(tzOffsetSeconds(tz));
    std::tm* timeinfo = std::gmtime(&shifted);
    if (!timeinfo) return "";
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", timeinfo);
    return buffer;
}

void render(std::ostream& out, const BlameRecord& record, Style style) {
    if (style == Style::Oneline) {
        out << record.shortCommit() << " "
            << std::setw(Constants::LINE_NUMBER_WIDTH) << std::setfill(' ') << record.finalLineNo
            << " (" << record.author << " " << formatTime(record.authorTime, record.authorTz)
            << " " << record.authorTz << ") " << record.content << "\n";
        return;
    }

    out << "* " << record.shortCommit() << ": "
        << std::setw(Constants::LINE_NUMBER_WIDTH) << std::setfill('0') << record.originalLineNo
        << std::setfill(' ')
        << " by " << record.author << " " << record.authorMail << "\n";
    out << "summary: " << record.summary << "\n";
    out << "content: `" << record.content << "`\n";
    out << "\n";
}

void renderAll(std::ostream& out, const std::vector<BlameRecord>& records, Style style) {
    for (const auto& record : records) {
        render(out, record, style);
    }
}

}  // namespace BlameRenderer

}  // namespace blamer
