#include "peerlink/engine/engine_settings.hpp"
#include "peerlink/core/utils.hpp"
#include <limits>

namespace peerlink::engine {

using core::ErrorCode;
using core::Result;

namespace {

std::chrono::milliseconds millis(const core::Config& config, const std::string& key, std::chrono::milliseconds fallback) {
    auto value = config.get_as<std::uint64_t>(key);
    if (!value) {
        if (config.has(key)) {
            LOG_WARN("Ignoring malformed {}", key);
        }
        return fallback;
    }
    return std::chrono::milliseconds(*value);
}

template<typename T>
T number(const core::Config& config, const std::string& key, T fallback) {
    auto value = config.get_as<std::uint64_t>(key);
    if (!value || *value > std::numeric_limits<T>::max()) {
        if (config.has(key)) {
            LOG_WARN("Ignoring malformed {}", key);
        }
        return fallback;
    }
    return static_cast<T>(*value);
}

}

EngineSettings EngineSettings::from_config(const core::Config& config) {
    EngineSettings settings;

    settings.node_name = config.get_string("node.name", settings.node_name);
    settings.listen_address = config.get_string("listen.address", settings.listen_address);
    settings.listen_port = number<std::uint16_t>(config, "listen.port", settings.listen_port);

    settings.save_directory = core::utils::FileUtils::expand_home(
        config.get_string("storage.save_directory", settings.save_directory.string()));
    settings.data_directory = core::utils::FileUtils::expand_home(
        config.get_string("storage.data_directory", settings.data_directory.string()));

    auto& protocol = settings.protocol;
    protocol.chunk_size = number<std::uint32_t>(config, "transfer.chunk_size", protocol.chunk_size);
    protocol.window_bytes = number<std::uint64_t>(config, "transfer.window_bytes", protocol.window_bytes);
    protocol.ack_timeout = millis(config, "transfer.ack_timeout_ms", protocol.ack_timeout);
    protocol.max_chunk_retries = number<unsigned>(config, "transfer.max_chunk_retries", protocol.max_chunk_retries);
    protocol.start_timeout = millis(config, "transfer.start_timeout_ms", protocol.start_timeout);
    protocol.complete_timeout = millis(config, "transfer.complete_timeout_ms", protocol.complete_timeout);
    protocol.durable_writes = config.get_bool("transfer.durable_writes", protocol.durable_writes);

    if (auto name = config.get("transfer.checksum")) {
        if (auto algorithm = network::parse_checksum_algorithm(*name)) {
            protocol.checksum = *algorithm;
        } else {
            LOG_WARN("Unknown transfer.checksum '{}', using {}", *name, network::to_string(protocol.checksum));
        }
    }

    settings.progress_interval = millis(config, "transfer.progress_interval_ms", settings.progress_interval);
    settings.auto_requeue_failed = config.get_bool("transfer.auto_requeue_failed", settings.auto_requeue_failed);

    auto& connection = settings.connection;
    connection.connect_timeout = millis(config, "connection.connect_timeout_ms", connection.connect_timeout);
    connection.heartbeat_interval = millis(config, "connection.heartbeat_interval_ms", connection.heartbeat_interval);
    connection.idle_timeout = millis(config, "connection.idle_timeout_ms", connection.idle_timeout);
    connection.reconnect.initial_delay = millis(config, "reconnect.initial_delay_ms", connection.reconnect.initial_delay);
    connection.reconnect.max_delay = millis(config, "reconnect.max_delay_ms", connection.reconnect.max_delay);
    connection.reconnect.window = millis(config, "reconnect.window_ms", connection.reconnect.window);

    settings.io_threads = number<unsigned>(config, "network.io_threads", settings.io_threads);

    settings.log_level = core::Logger::parse_level(config.get_string("log.level", "info"), settings.log_level);
    settings.log_file = config.get_string("log.file", settings.log_file);

    connection.local_name = settings.node_name;
    connection.listen_port = settings.listen_port;
    return settings;
}

Result EngineSettings::validate() const {
    if (node_name.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "node.name must not be empty");
    }
    if (protocol.chunk_size == 0 || protocol.chunk_size > network::MAX_PAYLOAD_SIZE / 2) {
        return Result(ErrorCode::INVALID_ARGUMENT,
                      "transfer.chunk_size must be between 1 and " + std::to_string(network::MAX_PAYLOAD_SIZE / 2));
    }
    if (protocol.window_bytes < protocol.chunk_size) {
        return Result(ErrorCode::INVALID_ARGUMENT, "transfer.window_bytes must hold at least one chunk");
    }
    if (protocol.ack_timeout.count() <= 0 || protocol.start_timeout.count() <= 0 ||
        protocol.complete_timeout.count() <= 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "transfer timeouts must be positive");
    }
    if (connection.heartbeat_interval.count() <= 0 || connection.idle_timeout <= connection.heartbeat_interval) {
        return Result(ErrorCode::INVALID_ARGUMENT,
                      "connection.idle_timeout_ms must exceed connection.heartbeat_interval_ms");
    }
    if (connection.reconnect.initial_delay.count() <= 0 ||
        connection.reconnect.max_delay < connection.reconnect.initial_delay) {
        return Result(ErrorCode::INVALID_ARGUMENT, "reconnect delays are inconsistent");
    }
    if (io_threads == 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "network.io_threads must be at least 1");
    }
    if (save_directory.empty() || data_directory.empty()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "storage directories must be set");
    }
    return Result();
}

}
