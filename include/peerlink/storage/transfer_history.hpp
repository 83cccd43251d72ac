#pragma once

#include "peerlink/storage/database.hpp"
#include "peerlink/storage/resume_ledger.hpp"
#include "peerlink/network/protocol.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace peerlink::storage {

enum class HistoryStatus : std::uint8_t {
    COMPLETED = 0,
    FAILED    = 1,
    CANCELLED = 2
};

const char* to_string(HistoryStatus status);

struct HistoryEntry {
    network::JobId job_id{};
    Direction direction = Direction::OUTGOING;
    std::string peer;
    std::string filename;
    std::uint64_t size = 0;
    HistoryStatus status = HistoryStatus::COMPLETED;
    network::ReasonCode reason = network::ReasonCode::NONE;
    std::string checksum;       // hex BLAKE2b-256 of the whole file, empty unless completed
    std::chrono::system_clock::time_point finished_at;
};

// Archive of jobs that reached a terminal status. One row per job id; a
// retried job overwrites its earlier failure.
class TransferHistory {
public:
    explicit TransferHistory(Database& database);

    core::Result initialize();

    core::Result archive(const HistoryEntry& entry);
    std::optional<HistoryEntry> find(const network::JobId& job_id);
    std::vector<HistoryEntry> recent(std::size_t limit = 50);

private:
    Database& db_;
};

}
