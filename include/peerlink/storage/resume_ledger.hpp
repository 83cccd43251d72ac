#pragma once

#include "peerlink/storage/database.hpp"
#include "peerlink/network/protocol.hpp"
#include "peerlink/core/result.hpp"
#include <string>
#include <vector>
#include <set>
#include <chrono>
#include <filesystem>
#include <optional>

namespace peerlink::storage {

enum class Direction : std::uint8_t {
    OUTGOING = 0,
    INCOMING = 1
};

const char* to_string(Direction direction);

// Which chunks of one transfer are known to be durably written on the
// receiver. Kept by both ends: the receiver's copy is authoritative for
// resuming, the sender's copy carries the job id nonce.
struct ResumeRecord {
    network::JobId job_id{};
    std::string job_key;
    Direction direction = Direction::OUTGOING;
    std::string peer;
    std::string filename;
    std::filesystem::path path;     // source file, or final destination when incoming
    std::uint64_t total_size = 0;
    std::uint32_t chunk_size = 0;
    std::uint64_t next_sequence = 0;
    std::set<std::uint64_t> out_of_order;
    std::vector<std::uint8_t> nonce;
    std::chrono::system_clock::time_point updated_at;

    std::uint64_t total_chunks() const;
    std::uint64_t chunk_length(std::uint64_t sequence) const;
    bool is_confirmed(std::uint64_t sequence) const;
    bool is_complete() const { return next_sequence >= total_chunks(); }

    // Returns false when the sequence was already confirmed.
    bool confirm(std::uint64_t sequence);

    std::uint64_t confirmed_bytes() const;
};

// Durable map job id -> ResumeRecord. A row that cannot be decoded is logged
// and reported as absent.
class ResumeLedger {
public:
    explicit ResumeLedger(Database& database);

    core::Result initialize();

    std::optional<ResumeRecord> load(const network::JobId& job_id);
    std::optional<ResumeRecord> load_by_key(const std::string& job_key, Direction direction);
    core::Result save(const ResumeRecord& record);
    core::Result remove(const network::JobId& job_id);
    std::vector<ResumeRecord> list();

private:
    std::optional<ResumeRecord> read_row(Statement& stmt);

    Database& db_;
};

}
