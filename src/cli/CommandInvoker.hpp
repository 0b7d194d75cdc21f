#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace idemzip {

/**
 * @brief Runs a command, logging its failure and how long it took
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
