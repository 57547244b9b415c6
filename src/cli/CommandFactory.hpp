#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace blamer {

/**
 * @brief Registry of blamer subcommands by name
 *
 * main() registers a creator per command; the help command walks the
 * registry to print the command list.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);
    std::unique_ptr<ICommand> create(const std::string& name) const;
    bool contains(const std::string& name) const;

    /// One fresh instance of every registered command, sorted by name
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

}
