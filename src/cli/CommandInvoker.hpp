#pragma once

#include <vector>

#include "cli/ICommand.hpp"

namespace hashflow {

/// Runs a command, logging its duration and any error it returns
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args);
};

}
