#include "core/PorcelainParser.hpp"

#include <string>

#include "core/BlobParser.hpp"
#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace blamer {

std::vector<std::string_view> PorcelainParser::splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        size_t next = end == std::string_view::npos ? text.size() : end + 1;
        if (end == std::string_view::npos) end = text.size();

        std::string_view line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = next;
    }
    return lines;
}

std::vector<std::vector<std::string_view>> PorcelainParser::segment(std::string_view porcelain, size_t& droppedLines) {
    std::vector<std::vector<std::string_view>> blobs;
    std::vector<std::string_view> blob;

    for (std::string_view line : splitLines(porcelain)) {
        blob.push_back(line);

        // End of one blamed line
        if (!line.empty() && line.front() == Constants::CONTENT_MARKER) {
            blobs.push_back(std::move(blob));
            blob.clear();
        }
    }

    droppedLines = blob.size();
    return blobs;
}

std::vector<std::vector<std::string_view>> PorcelainParser::splitBlobs(std::string_view porcelain) {
    size_t dropped = 0;
    return segment(porcelain, dropped);
}

Expected<std::vector<BlameRecord>> PorcelainParser::parse(std::string_view porcelain) {
    size_t dropped = 0;
    auto blobs = segment(porcelain, dropped);

    if (dropped > 0) {
        Logger::instance().warn("Ignoring " + std::to_string(dropped) +
                                " trailing line(s) not terminated by a content line");
    }

    std::vector<BlameRecord> records;
    records.reserve(blobs.size());
    for (const auto& blob : blobs) {
        auto res = BlobParser::parse(blob);
        if (!res) return res.error();
        records.push_back(std::move(res.value()));
    }

    Logger::instance().debug("Parsed " + std::to_string(records.size()) + " blame record(s)");
    return records;
}

}
