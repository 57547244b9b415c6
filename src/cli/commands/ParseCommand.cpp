#include "cli/commands/ParseCommand.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include "cli/BlameRenderer.hpp"
#include "core/PorcelainParser.hpp"
#include "util/Utf8.hpp"

namespace fs = std::filesystem;

namespace blamer {

namespace {

Expected<std::string> readInput(const std::string& source) {
    if (source.empty() || source == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad()) {
            return Error{ErrorCode::IoError, "Failed to read standard input"};
        }
        return buffer.str();
    }

    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Error{ErrorCode::InvalidArgs, "invalid file path: " + source};
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open file for reading: " + source};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading file: " + source};
    }
    return content;
}

}

Expected<void> ParseCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    BlameRenderer::Style style = BlameRenderer::Style::Full;
    std::string source;
    bool haveSource = false;

    for (const auto& arg : args) {
        if (arg == "--oneline") {
            style = BlameRenderer::Style::Oneline;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + arg};
        } else if (!haveSource) {
            source = arg;
            haveSource = true;
        } else {
            return Error{ErrorCode::InvalidArgs, "parse: too many arguments"};
        }
    }

    auto raw = readInput(source);
    if (!raw) return raw.error();

    auto records = PorcelainParser::parse(Utf8::sanitize(raw.value()));
    if (!records) return records.error();

    BlameRenderer::renderAll(std::cout, records.value(), style);
    return {};
}

}
