#include "cli/commands/BlameCommand.hpp"

#include <filesystem>
#include <iostream>

#include "cli/BlameRenderer.hpp"
#include "core/BlameRunner.hpp"
#include "core/PorcelainParser.hpp"
#include "util/Logger.hpp"
#include "util/ParseUtils.hpp"

namespace fs = std::filesystem;

namespace blamer {

Expected<void> BlameCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    BlameRenderer::Style style = BlameRenderer::Style::Full;
    std::string target;

    for (const auto& arg : args) {
        if (arg == "--oneline") {
            style = BlameRenderer::Style::Oneline;
        } else if (ParseUtils::startsWith(arg, "-")) {
            return Error{ErrorCode::InvalidArgs, "unknown option: " + arg};
        } else if (target.empty()) {
            target = arg;
        } else {
            return Error{ErrorCode::InvalidArgs, "only one file can be blamed at a time"};
        }
    }

    if (target.empty()) {
        return Error{ErrorCode::InvalidArgs, "missing args <FILE_PATH>"};
    }

    BlameRunner runner(ctx.gitExecutable);
    auto output = runner.run(fs::path(target));
    if (!output) return output.error();

    auto records = PorcelainParser::parse(output.value());
    if (!records) return records.error();

    Logger::instance().debug("Blamed " + std::to_string(records.value().size()) + " line(s) of " + target);
    BlameRenderer::renderAll(std::cout, records.value(), style);
    return {};
}

}
