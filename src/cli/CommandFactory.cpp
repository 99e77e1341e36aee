#include "cli/CommandFactory.hpp"

#include "cli/commands/HashCommand.hpp"
#include "cli/commands/HelpCommand.hpp"

namespace hashflow {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerBuiltins() {
    auto& f = instance();
    f.registerCreator("hash", [] { return std::make_unique<HashCommand>(); });
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

bool CommandFactory::has(const std::string& name) const {
    return creators.count(name) > 0;
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

std::vector<std::unique_ptr<ICommand>> CommandFactory::listCommands() const {
    std::vector<std::unique_ptr<ICommand>> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    return out;
}

}
