#include "peerlink/core/cli.hpp"
#include "peerlink/core/utils.hpp"
#include <iomanip>

namespace peerlink::core {

CommandLine::CommandLine(std::string program_name)
    : program_name_(std::move(program_name)) {
}

const std::vector<CommandLine::OptionSpec>& CommandLine::specs() {
    static const std::vector<OptionSpec> table = {
        {'h', "help",     nullptr, "Show this help message"},
        {'V', "version",  nullptr, "Show version information"},
        {'c', "config",   "file",  "Configuration file (default ~/.peerlink.conf)"},
        {'n', "name",     "name",  "Node name announced to peers (node.name)"},
        {'p', "port",     "port",  "Listen port (listen.port)"},
        {'d', "save-dir", "dir",   "Directory for received files (storage.save_directory)"},
        {'v', "verbose",  nullptr, "Log at debug level"},
    };
    return table;
}

const CommandLine::OptionSpec* CommandLine::find_long(const std::string& name) {
    for (const auto& spec : specs()) {
        if (name == spec.long_name) {
            return &spec;
        }
    }
    return nullptr;
}

const CommandLine::OptionSpec* CommandLine::find_short(char name) {
    for (const auto& spec : specs()) {
        if (spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

Result CommandLine::parse(int argc, char* argv[]) {
    options_ = GlobalOptions{};
    command_.clear();

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            ++i;
            break;
        }

        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            auto name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            const auto* spec = find_long(name);
            if (!spec) {
                return Result(ErrorCode::INVALID_ARGUMENT, "Unknown option --" + name);
            }

            if (!spec->value_name) {
                if (eq != std::string::npos) {
                    return Result(ErrorCode::INVALID_ARGUMENT, "Option --" + name + " takes no value");
                }
                auto assigned = assign(*spec, "");
                if (!assigned) {
                    return assigned;
                }
                continue;
            }

            std::string value;
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                return Result(ErrorCode::INVALID_ARGUMENT, "Option --" + name + " needs a " + spec->value_name);
            }

            auto assigned = assign(*spec, value);
            if (!assigned) {
                return assigned;
            }
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            // Clustered short flags; a value option takes the rest of the word.
            for (std::size_t j = 1; j < arg.size(); ++j) {
                const auto* spec = find_short(arg[j]);
                if (!spec) {
                    return Result(ErrorCode::INVALID_ARGUMENT, std::string("Unknown option -") + arg[j]);
                }

                if (!spec->value_name) {
                    auto assigned = assign(*spec, "");
                    if (!assigned) {
                        return assigned;
                    }
                    continue;
                }

                std::string value;
                if (j + 1 < arg.size()) {
                    value = arg.substr(j + 1);
                } else if (i + 1 < argc) {
                    value = argv[++i];
                } else {
                    return Result(ErrorCode::INVALID_ARGUMENT,
                                  std::string("Option -") + arg[j] + " needs a " + spec->value_name);
                }

                auto assigned = assign(*spec, value);
                if (!assigned) {
                    return assigned;
                }
                break;
            }
            continue;
        }

        break;  // command name
    }

    for (; i < argc; ++i) {
        command_.emplace_back(argv[i]);
    }
    return Result();
}

Result CommandLine::assign(const OptionSpec& spec, const std::string& value) {
    std::string name = spec.long_name;

    if (name == "help") {
        options_.help = true;
    } else if (name == "version") {
        options_.version = true;
    } else if (name == "verbose") {
        options_.verbose = true;
    } else if (name == "config") {
        options_.config_file = value;
        options_.config_given = true;
    } else if (name == "name") {
        auto trimmed = utils::StringUtils::trim(value);
        if (trimmed.empty()) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Node name must not be empty");
        }
        options_.node_name = trimmed;
    } else if (name == "port") {
        try {
            std::size_t used = 0;
            unsigned long port = std::stoul(value, &used);
            if (used != value.size() || port > 65535) {
                return Result(ErrorCode::INVALID_ARGUMENT, "Invalid port '" + value + "'");
            }
            options_.listen_port = static_cast<std::uint16_t>(port);
        } catch (const std::exception&) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Invalid port '" + value + "'");
        }
    } else if (name == "save-dir") {
        if (value.empty()) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Save directory must not be empty");
        }
        options_.save_directory = value;
    }
    return Result();
}

void CommandLine::apply_overrides(Config& config) const {
    if (options_.node_name) {
        config.set("node.name", *options_.node_name);
    }
    if (options_.listen_port) {
        config.set("listen.port", std::to_string(*options_.listen_port));
    }
    if (options_.save_directory) {
        config.set("storage.save_directory", *options_.save_directory);
    }
    if (options_.verbose) {
        config.set("log.level", "debug");
    }
}

void CommandLine::print_usage(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& spec : specs()) {
        std::string form = std::string("-") + spec.short_name + ", --" + spec.long_name;
        if (spec.value_name) {
            form += std::string(" <") + spec.value_name + ">";
        }
        out << "  " << std::left << std::setw(28) << form << spec.description << "\n";
    }
}

void CommandLine::print_version(std::ostream& out) const {
    out << program_name_ << " version 1.0.0\n";
}

}
