#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/Constants.hpp"

namespace blamer {

/**
 * @brief Origin of a line before the blamed commit touched it
 *
 * Taken from the porcelain line `previous <commit> <filepath>`. Both
 * parts are always present together.
 */
struct PreviousRef {
    std::string commit;
    std::string filepath;
};

/**
 * @brief Blame information for a single source line
 *
 * Built from one blob of `git blame --line-porcelain` output:
 *
 *   <commit> <orig-line> <final-line> [<group-size>]
 *   author Name
 *   author-mail <email>
 *   author-time 1744981061
 *   author-tz +0900
 *   committer ...
 *   summary First line of the message
 *   previous <commit> <filepath>
 *   boundary
 *   filename <path>
 *   \t<line content>
 *
 * Times are unix seconds. `boundary` is only emitted by git for the commit
 * where history tracing stopped.
 */
struct BlameRecord {
    std::string commit;
    uint64_t originalLineNo{0};
    uint64_t finalLineNo{0};

    std::string filename;
    std::string summary;

    std::string content;           // Line text without the leading tab

    std::optional<PreviousRef> previous;

    bool boundary{false};

    std::string author;
    std::string authorMail;
    uint64_t authorTime{0};
    std::string authorTz;

    std::string committer;
    std::string committerMail;
    uint64_t committerTime{0};
    std::string committerTz;

    /**
     * @brief Get short hash (first 7 characters, or all of a shorter id)
     */
    std::string shortCommit() const {
        return commit.substr(0, Constants::SHORT_HASH_LENGTH);
    }

    std::optional<std::string> previousCommit() const {
        if (!previous) return std::nullopt;
        return previous->commit;
    }

    std::optional<std::string> previousFilepath() const {
        if (!previous) return std::nullopt;
        return previous->filepath;
    }

    /// True for working-tree lines that git attributes to the all-zero commit
    bool isUncommitted() const {
        return commit == Constants::UNCOMMITTED_HASH;
    }
};

inline bool operator==(const PreviousRef& a, const PreviousRef& b) {
    return a.commit == b.commit && a.filepath == b.filepath;
}

inline bool operator==(const BlameRecord& a, const BlameRecord& b) {
    return a.commit == b.commit && a.originalLineNo == b.originalLineNo &&
           a.finalLineNo == b.finalLineNo && a.filename == b.filename &&
           a.summary == b.summary && a.content == b.content &&
           a.previous == b.previous && a.boundary == b.boundary &&
           a.author == b.author && a.authorMail == b.authorMail &&
           a.authorTime == b.authorTime && a.authorTz == b.authorTz &&
           a.committer == b.committer && a.committerMail == b.committerMail &&
           a.committerTime == b.committerTime && a.committerTz == b.committerTz;
}

}
