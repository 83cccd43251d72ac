#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <utility>
#include <vector>

namespace peerlink::core {

namespace {

constexpr const char* CONSOLE_PATTERN = "%H:%M:%S.%e %^%-5l%$ %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v";

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}

std::shared_ptr<spdlog::logger> Logger::logger_;

LogOptions LogOptions::from_config(const Config& config) {
    LogOptions options;
    options.file = config.get_string("log.file", options.file);
    options.level = Logger::parse_level(config.get_string("log.level", "info"), options.level);
    options.max_file_bytes = config.get_uint64("log.max_file_bytes", options.max_file_bytes);
    options.max_files = config.get_uint64("log.max_files", options.max_files);
    options.console = config.get_bool("log.console", options.console);
    return options;
}

void Logger::initialize(const std::string& log_file, LogLevel level) {
    LogOptions options;
    options.file = log_file;
    options.level = level;
    initialize(options);
}

void Logger::initialize(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (options.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(to_spdlog(options.level));
        console->set_pattern(CONSOLE_PATTERN);
        sinks.push_back(std::move(console));
    }

    // The file keeps everything the logger lets through.
    if (!options.file.empty()) {
        auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file, options.max_file_bytes, options.max_files);
        rotating->set_level(spdlog::level::trace);
        rotating->set_pattern(FILE_PATTERN);
        sinks.push_back(std::move(rotating));
    }

    logger_ = std::make_shared<spdlog::logger>("peerlink", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(options.level));
    logger_->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger_);

    LOG_DEBUG("Logging at {} to {}", spdlog::level::to_string_view(to_spdlog(options.level)),
              options.file.empty() ? "console" : options.file);
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }

    logger_->flush();
    logger_.reset();

    // LOG_ macros used after shutdown go to a bare console logger.
    spdlog::set_default_logger(
        std::make_shared<spdlog::logger>("", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    static const std::pair<const char*, LogLevel> names[] = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"critical", LogLevel::Critical},
        {"off", LogLevel::Off},
    };

    auto wanted = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    for (const auto& [text, level] : names) {
        if (wanted == text) {
            return level;
        }
    }
    return fallback;
}

}
