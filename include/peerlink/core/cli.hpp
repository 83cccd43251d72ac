#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/core/result.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace peerlink::core {

constexpr const char* DEFAULT_CONFIG_FILE = "~/.peerlink.conf";

// Options accepted in front of the command name.
struct GlobalOptions {
    std::string config_file = DEFAULT_CONFIG_FILE;
    bool config_given = false;
    std::optional<std::string> node_name;
    std::optional<std::uint16_t> listen_port;
    std::optional<std::string> save_directory;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

// peerlink [options] <command> [args...]
//
// Options use the getopt forms "-p 4000", "-p4000", "--port 4000" and
// "--port=4000". Everything from the command name on is handed to the
// command untouched; "--" ends the options early.
class CommandLine {
public:
    explicit CommandLine(std::string program_name);

    Result parse(int argc, char* argv[]);

    const GlobalOptions& options() const { return options_; }

    // Command name followed by its arguments; empty when none was given.
    const std::vector<std::string>& command() const { return command_; }

    // Writes --name, --port, --save-dir and --verbose over the loaded config.
    void apply_overrides(Config& config) const;

    void print_usage(std::ostream& out) const;
    void print_version(std::ostream& out) const;

private:
    struct OptionSpec {
        char short_name;
        const char* long_name;
        const char* value_name;     // nullptr for flags
        const char* description;
    };

    static const std::vector<OptionSpec>& specs();
    static const OptionSpec* find_long(const std::string& name);
    static const OptionSpec* find_short(char name);

    Result assign(const OptionSpec& spec, const std::string& value);

    std::string program_name_;
    GlobalOptions options_;
    std::vector<std::string> command_;
};

}
