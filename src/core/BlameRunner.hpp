#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace blamer {

/**
 * @brief Runs `git blame --line-porcelain` on a file
 *
 * The command is run as `<git> -C <dir> blame --line-porcelain -- <name>`
 * where <dir> is the directory containing the file, so the file does not
 * have to live under the current working directory.
 *
 * Errors:
 *   InvalidArgs      - path is not an existing regular file
 *   SubprocessFailed - git could not be executed or exited non-zero;
 *                      the message carries git's stderr
 *   InternalError    - pipe/fork failures
 *   IoError          - reading the child's output failed
 */
class BlameRunner {
public:
    struct ProcessOutput {
        std::string out;
        std::string err;
        int exitCode{0};
    };

    /**
     * @param gitExecutable Program name or path of git (looked up in PATH)
     */
    explicit BlameRunner(std::string gitExecutable = "git");

    /**
     * @brief Blame a file and return git's stdout
     * @return Porcelain text, lossily decoded to valid UTF-8
     */
    Expected<std::string> run(const std::filesystem::path& file) const;

    /// Argument vector (including argv[0]) used to blame @p file
    std::vector<std::string> buildArgs(const std::filesystem::path& file) const;

    /**
     * @brief Execute a program and capture both output streams
     * @param args argv, args[0] is resolved through PATH
     *
     * A program that cannot be executed yields SubprocessFailed. A
     * non-zero exit is not an error here; it is reported in exitCode.
     */
    static Expected<ProcessOutput> execute(const std::vector<std::string>& args);

private:
    std::string git;
};

}
