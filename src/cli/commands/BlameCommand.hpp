#pragma once

#include "cli/ICommand.hpp"

namespace blamer {

/**
 * @brief Execute 'blamer blame' command
 *
 * Runs `git blame --line-porcelain` on a file and prints one entry per
 * line of the file.
 *
 * Usage:
 *   blamer blame <file>
 *   blamer blame --oneline <file>
 */
class BlameCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "blame"; }
    const char* description() const override { return "Show who last changed each line of a file"; }
    const char* helpNameLine() const override { return "blame -  Show what revision and author last modified each line of a file"; }
    const char* helpSynopsis() const override { return "blamer blame [--oneline] <file>"; }
    const char* helpDescription() const override {
        return "Run git blame on <file> and print, for every line, the commit, author,\n"
               "commit summary and line content. The git executable can be overridden\n"
               "with the BLAMER_GIT environment variable.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<file>", "File inside a git work tree"},
            {"--oneline", "Print one line per blamed line"}
        };
    }
};

}
