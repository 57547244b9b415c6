#include "core/BlobParser.hpp"

#include <algorithm>
#include <functional>
#include <unordered_map>

#include "core/Constants.hpp"
#include "util/ParseUtils.hpp"

namespace blamer {

namespace {

using FieldSetter = std::function<void(BlameRecord&, std::string_view)>;

FieldSetter setString(std::string BlameRecord::*field) {
    return [field](BlameRecord& r, std::string_view value) { r.*field = std::string(value); };
}

FieldSetter setTime(uint64_t BlameRecord::*field) {
    return [field](BlameRecord& r, std::string_view value) {
        r.*field = ParseUtils::parseUnsignedOr(value, 0);
    };
}

void setPrevious(BlameRecord& r, std::string_view value) {
    // "<commit> <filepath>"; without the space neither part is kept
    auto parts = ParseUtils::splitOnce(value, Constants::KEY_SEPARATOR);
    if (!parts) return;
    r.previous = PreviousRef{std::string(parts->first), std::string(parts->second)};
}

const std::unordered_map<std::string, FieldSetter>& fieldTable() {
    static const std::unordered_map<std::string, FieldSetter> table = {
        {"filename", setString(&BlameRecord::filename)},
        {"summary", setString(&BlameRecord::summary)},
        {"author", setString(&BlameRecord::author)},
        {"author-mail", setString(&BlameRecord::authorMail)},
        {"author-time", setTime(&BlameRecord::authorTime)},
        {"author-tz", setString(&BlameRecord::authorTz)},
        {"committer", setString(&BlameRecord::committer)},
        {"committer-mail", setString(&BlameRecord::committerMail)},
        {"committer-time", setTime(&BlameRecord::committerTime)},
        {"committer-tz", setString(&BlameRecord::committerTz)},
        {"previous", FieldSetter(setPrevious)},
    };
    return table;
}

const FieldSetter* findSetter(std::string_view key) {
    const auto& table = fieldTable();
    auto it = table.find(std::string(key));
    if (it == table.end() && !key.empty() && key.back() == ':') {
        // "summary: text" is read as the summary key
        it = table.find(std::string(key.substr(0, key.size() - 1)));
    }
    return it == table.end() ? nullptr : &it->second;
}

}

Expected<BlameRecord> BlobParser::parse(const std::vector<std::string_view>& lines) {
    if (lines.empty()) {
        return Error{ErrorCode::NoHeader, Constants::NO_HEADER_MESSAGE};
    }

    BlameRecord record;
    auto headerRes = parseHeader(lines.front(), record);
    if (!headerRes) return headerRes.error();

    for (size_t i = 1; i < lines.size(); ++i) {
        parseBodyLine(lines[i], record);
    }
    return record;
}

std::vector<std::string> BlobParser::fieldKeys() {
    std::vector<std::string> keys;
    for (const auto& kv : fieldTable()) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

Expected<void> BlobParser::parseHeader(std::string_view header, BlameRecord& record) {
    // A content line in header position means the blob has no header at all
    if (!header.empty() && header.front() == Constants::CONTENT_MARKER) {
        return Error{ErrorCode::NoHeader, Constants::NO_HEADER_MESSAGE};
    }

    auto tokens = ParseUtils::splitWhitespace(header);
    if (tokens.empty()) {
        return Error{ErrorCode::NoHeader, Constants::NO_HEADER_MESSAGE};
    }

    record.commit = std::string(tokens[0]);
    if (tokens.size() > 1) {
        record.originalLineNo = ParseUtils::parseUnsignedOr(tokens[1], 0);
    }
    if (tokens.size() > 2) {
        record.finalLineNo = ParseUtils::parseUnsignedOr(tokens[2], 0);
    }
    return {};
}

void BlobParser::parseBodyLine(std::string_view line, BlameRecord& record) {
    if (!line.empty() && line.front() == Constants::CONTENT_MARKER) {
        record.content = std::string(line.substr(1));
        return;
    }

    auto kv = ParseUtils::splitOnce(line, Constants::KEY_SEPARATOR);
    if (!kv) {
        if (line == Constants::BOUNDARY_KEYWORD) {
            record.boundary = true;
        }
        return;
    }

    if (const FieldSetter* setter = findSetter(kv->first)) {
        (*setter)(record, kv->second);
    }
}

}
