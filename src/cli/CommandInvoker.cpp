#include "cli/CommandInvoker.hpp"

#include <chrono>

#include "util/Logger.hpp"

namespace hashflow {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    log.debug(std::string("Executing command: ") + cmd.name());

    auto started = std::chrono::steady_clock::now();
    auto res = cmd.execute(ctx, args);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    log.debug(std::string(cmd.name()) + " took " + std::to_string(elapsed.count()) + " ms");

    if (!res) {
        log.error(std::string(cmd.name()) + ": " + res.error().message);
        return res;
    }
    return {};
}

}
