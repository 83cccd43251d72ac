#pragma once

#include "peerlink/network/protocol.hpp"
#include "peerlink/storage/resume_ledger.hpp"
#include "peerlink/transfer/chunk_codec.hpp"
#include <string>
#include <chrono>
#include <filesystem>
#include <cstdint>

namespace peerlink::transfer {

using storage::Direction;

enum class JobStatus {
    QUEUED,
    ACTIVE,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

const char* to_string(JobStatus status);

// COMPLETED, FAILED and CANCELLED end a run of the job; only FAILED can be
// brought back (retry).
bool is_terminal(JobStatus status);

bool can_transition(JobStatus from, JobStatus to);

struct TransferJob {
    network::JobId id{};
    std::string key;
    Direction direction = Direction::OUTGOING;
    std::string peer;
    std::filesystem::path path;     // source, or final destination when incoming
    std::string filename;
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    JobStatus status = JobStatus::QUEUED;
    std::uint64_t bytes_confirmed = 0;
    network::ReasonCode failure_reason = network::ReasonCode::NONE;
    bool resumed = false;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point last_chunk_at;

    std::string id_hex() const { return network::to_hex(id); }
};

}
