#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"

namespace hashflow {

/**
 * @brief Name -> command creator registry
 *
 * main() and the tests call registerBuiltins() once; HelpCommand walks the
 * registry to print the command list.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();

    /// Register "hash" and "help"
    static void registerBuiltins();

    void registerCreator(const std::string& name, Creator creator);
    bool has(const std::string& name) const;
    std::unique_ptr<ICommand> create(const std::string& name) const;

    /// One fresh instance per registered command, sorted by name
    std::vector<std::unique_ptr<ICommand>> listCommands() const;

private:
    CommandFactory() = default;
    std::map<std::string, Creator> creators;  // Ordered, so listings are sorted
};

}
