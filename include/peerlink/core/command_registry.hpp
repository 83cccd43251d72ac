#pragma once

#include "peerlink/core/command_handler.hpp"
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace peerlink::core {

// Commands in the order they are listed by print_help.
class CommandRegistry {
public:
    explicit CommandRegistry(const Config& config);

    void add(std::string name, std::unique_ptr<CommandHandler> handler);

    // args[0] is the command name.
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const { return find(command) != nullptr; }

    void print_help(std::ostream& out) const;

private:
    CommandHandler* find(const std::string& command) const;

    std::vector<std::pair<std::string, std::unique_ptr<CommandHandler>>> commands_;
};

}
