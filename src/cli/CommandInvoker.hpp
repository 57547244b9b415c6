#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace blamer {

/**
 * @brief Runs a command and reports its failure through the Logger
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
