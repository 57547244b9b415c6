#pragma once

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace blamer::test {

/**
 * @brief Shared fixtures and helpers for blamer tests
 */
namespace utils {

/// Two blamed lines: one with a previous commit, then one from a boundary commit
extern const char* const SAMPLE_PORCELAIN;

/// Single working-tree line attributed to the all-zero commit
extern const char* const UNCOMMITTED_PORCELAIN;

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/// True if a `git` executable can be run from PATH
bool gitAvailable();

/**
 * @brief Run a git command inside @p repo, discarding its output
 * @return true if git exited with status 0
 *
 * Identity is passed with -c so no global git config is needed.
 */
bool runGit(const std::filesystem::path& repo, const std::string& args);

/**
 * @brief Redirects std::cout into a buffer for its lifetime
 */
class CoutCapture {
public:
    CoutCapture() : old(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old); }

    CoutCapture(const CoutCapture&) = delete;
    CoutCapture& operator=(const CoutCapture&) = delete;

    std::string str() const { return buffer.str(); }
    void clear() {
        buffer.str("");
        buffer.clear();
    }

private:
    std::stringstream buffer;
    std::streambuf* old;
};

} // namespace utils

} // namespace blamer::test
