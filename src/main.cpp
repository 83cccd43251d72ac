#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include "peerlink/core/logger.hpp"
#include "peerlink/core/config.hpp"
#include "peerlink/core/cli.hpp"
#include "peerlink/core/utils.hpp"
#include "peerlink/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    peerlink::core::CommandLine command_line("peerlink");

    auto parsed = command_line.parse(argc, argv);
    if (!parsed) {
        std::cerr << "Error: " << parsed.message << "\n\n";
        command_line.print_usage(std::cerr);
        return 1;
    }

    const auto& options = command_line.options();
    if (options.help) {
        command_line.print_usage(std::cout);
        peerlink::core::CommandRegistry(peerlink::core::Config{}).print_help(std::cout);
        return 0;
    }

    if (options.version) {
        command_line.print_version(std::cout);
        return 0;
    }

    peerlink::core::Config config;
    config.set_defaults();

    auto config_file = peerlink::core::utils::FileUtils::expand_home(options.config_file);
    if (std::filesystem::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read " << config_file.string() << "\n";
            return 1;
        }
    } else if (options.config_given) {
        std::cerr << "Error: " << config_file.string() << " does not exist\n";
        return 1;
    }
    command_line.apply_overrides(config);

    peerlink::core::Logger::initialize(peerlink::core::LogOptions::from_config(config));

    LOG_INFO("PeerLink starting up");

    peerlink::core::CommandRegistry command_registry(config);

    const auto& args = command_line.command();
    if (args.empty()) {
        command_line.print_usage(std::cout);
        command_registry.print_help(std::cout);
        peerlink::core::Logger::shutdown();
        return 0;
    }

    const std::string& command = args[0];
    auto result = command_registry.execute_command(command, args);

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help(std::cout);
        }
    } else if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    peerlink::core::Logger::shutdown();
    return result.exit_code;
}
