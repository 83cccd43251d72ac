#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/result.hpp"
#include "peerlink/network/connection_manager.hpp"
#include "peerlink/transfer/transfer_protocol.hpp"
#include <filesystem>
#include <string>
#include <chrono>

namespace peerlink::engine {

struct EngineSettings {
    std::string node_name = "peerlink";
    std::string listen_address = "0.0.0.0";
    std::uint16_t listen_port = network::DEFAULT_PORT;

    std::filesystem::path save_directory = "./received";
    std::filesystem::path data_directory = "./.peerlink";

    transfer::ProtocolSettings protocol;
    std::chrono::milliseconds progress_interval{250};
    bool auto_requeue_failed = false;

    network::ConnectionSettings connection;
    unsigned io_threads = 2;

    core::LogLevel log_level = core::LogLevel::Info;
    std::string log_file = "peerlink.log";

    std::filesystem::path database_path() const { return data_directory / "peerlink.db"; }

    // Rejects out-of-range values (zero chunk size, empty node name, ...).
    core::Result validate() const;

    // Keys missing from `config` keep their defaults; malformed values are
    // logged and ignored.
    static EngineSettings from_config(const core::Config& config);
};

}
