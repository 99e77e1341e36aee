#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace hashflow {

namespace {

void printCommandDetail(std::ostream& out, const ICommand& cmd) {
    out << "NAME:\n" << cmd.helpNameLine() << "\n\n";
    out << "SYNOPSIS:\n" << cmd.helpSynopsis() << "\n\n";
    out << "DESCRIPTION:\n" << cmd.helpDescription() << "\n\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        out << "OPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            out << "  " << opt << "\n      " << desc << "\n";
        }
        out << "\n";
    }
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (!args.empty()) {
        const std::string& topic = args.front();
        auto cmd = CommandFactory::instance().create(topic);
        if (cmd) {
            printCommandDetail(*ctx.out, *cmd);
            return {};
        }
        *ctx.err << "Unknown help topic: " << topic << "\n\n";
    }

    *ctx.out << "usage: hashflow <command> [<args>]\n\n";
    *ctx.out << "Commands:\n";
    for (const auto& c : CommandFactory::instance().listCommands()) {
        *ctx.out << "  " << c->name() << "\t" << c->description() << "\n";
    }
    *ctx.out << "\nSee 'hashflow help <command>' for details.\n";
    return {};
}

}
