#pragma once

#include "cli/ICommand.hpp"

namespace blamer {

/**
 * @brief Execute 'blamer parse' command
 *
 * Reads saved `git blame --line-porcelain` output from a file or stdin
 * and prints it the same way as 'blamer blame'.
 */
class ParseCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "parse"; }
    const char* description() const override { return "Render saved line-porcelain blame output"; }
    const char* helpNameLine() const override { return "parse -  Parse git blame --line-porcelain output"; }
    const char* helpSynopsis() const override { return "blamer parse [--oneline] [<file> | -]"; }
    const char* helpDescription() const override {
        return "Parse the output of 'git blame --line-porcelain' from <file>, or from\n"
               "standard input when <file> is '-' or omitted, and print each record.";
    }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"<file>", "File holding line-porcelain output ('-' for stdin)"},
            {"--oneline", "Print one line per blamed line"}
        };
    }
};

}
