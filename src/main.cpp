// CLI entry: dispatches to blame, parse and help through the command registry.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"
#include "cli/commands/BlameCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ParseCommand.hpp"
#include "util/Logger.hpp"

using namespace blamer;

static void registerCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("blame", [] { return std::make_unique<BlameCommand>(); });
    f.registerCreator("parse", [] { return std::make_unique<ParseCommand>(); });
}

int main(int argc, char** argv) {
    registerCommands();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx = AppContext::fromEnvironment();
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        invoker.invoke(*cmd, ctx, {});
        return 1;
    }
    std::string cmdName = args.front();
    args.erase(args.begin());
    if (!CommandFactory::instance().contains(cmdName)) {
        Logger::instance().error("Unknown command: " + cmdName);
        auto help = CommandFactory::instance().create("help");
        invoker.invoke(*help, ctx, {});
        return 1;
    }
    auto cmd = CommandFactory::instance().create(cmdName);
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
