// Command-line host for the streaming hash engine.

#include <iostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"

using namespace hashflow;

int main(int argc, char** argv) {
    CommandFactory::registerBuiltins();
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    AppContext ctx{};
    CommandInvoker invoker;
    if (args.empty()) {
        auto cmd = CommandFactory::instance().create("help");
        return invoker.invoke(*cmd, ctx, {}) ? 0 : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = CommandFactory::instance().create(cmdName);
    if (!cmd) {
        // Bare file arguments mean "hash them"
        cmd = CommandFactory::instance().create("hash");
        args.insert(args.begin(), cmdName);
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
