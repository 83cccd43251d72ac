#include "peerlink/core/command_registry.hpp"
#include <algorithm>
#include <iomanip>

namespace peerlink::core {

CommandRegistry::CommandRegistry(const Config& config) {
    add("serve", std::make_unique<ServeCommandHandler>(config));
    add("send", std::make_unique<SendCommandHandler>(config));
    add("pending", std::make_unique<PendingCommandHandler>(config));
    add("history", std::make_unique<HistoryCommandHandler>(config));
    add("peers", std::make_unique<PeersCommandHandler>(config));
}

void CommandRegistry::add(std::string name, std::unique_ptr<CommandHandler> handler) {
    auto it = std::find_if(commands_.begin(), commands_.end(),
                           [&](const auto& entry) { return entry.first == name; });
    if (it != commands_.end()) {
        it->second = std::move(handler);
        return;
    }
    commands_.emplace_back(std::move(name), std::move(handler));
}

CommandHandler* CommandRegistry::find(const std::string& command) const {
    for (const auto& [name, handler] : commands_) {
        if (name == command) {
            return handler.get();
        }
    }
    return nullptr;
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto* handler = find(command);
    if (!handler) {
        return CommandResult::error("Unknown command: " + command);
    }
    return handler->execute(args);
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";
    for (const auto& [name, handler] : commands_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n"
            << "  " << std::setw(10) << "" << handler->get_usage() << "\n";
    }
}

}
