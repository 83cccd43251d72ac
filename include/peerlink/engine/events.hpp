#pragma once

#include "peerlink/network/connection_manager.hpp"
#include "peerlink/transfer/transfer_job.hpp"
#include <string>
#include <variant>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace peerlink::engine {

struct ConnectionStateChanged {
    std::string peer;
    network::ConnectionState state;
    network::DisconnectReason reason;
};

struct TransferProgress {
    std::string job_id;         // hex
    std::string peer;
    transfer::Direction direction;
    std::string filename;
    std::uint64_t bytes_done;
    std::uint64_t total_bytes;
    std::uint64_t rate_bps;
    std::chrono::milliseconds eta;

    double percent() const {
        return total_bytes == 0 ? 100.0 : 100.0 * static_cast<double>(bytes_done) / static_cast<double>(total_bytes);
    }
};

// A job reached COMPLETED, FAILED or CANCELLED.
struct TransferTerminal {
    std::string job_id;
    std::string peer;
    transfer::Direction direction;
    std::string filename;
    std::filesystem::path path;
    transfer::JobStatus status;
    network::ReasonCode reason;
};

using Event = std::variant<ConnectionStateChanged, TransferProgress, TransferTerminal>;

// One line, for logs and the command line.
std::string describe(const Event& event);

}
