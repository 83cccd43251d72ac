#include "peerlink/storage/resume_ledger.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <sqlite3.h>
#include <algorithm>

namespace peerlink::storage {

using core::ErrorCode;
using core::Result;
using core::utils::TimeUtils;

namespace {
    std::vector<std::uint8_t> encode_sequences(const std::set<std::uint64_t>& sequences) {
        std::vector<std::uint8_t> buffer;
        buffer.reserve(4 + sequences.size() * 8);

        auto count = static_cast<std::uint32_t>(sequences.size());
        for (int shift = 24; shift >= 0; shift -= 8) {
            buffer.push_back((count >> shift) & 0xFF);
        }
        for (auto seq : sequences) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                buffer.push_back((seq >> shift) & 0xFF);
            }
        }
        return buffer;
    }

    std::optional<std::set<std::uint64_t>> decode_sequences(const std::vector<std::uint8_t>& blob) {
        if (blob.size() < 4) {
            return std::nullopt;
        }

        std::uint32_t count = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            count = (count << 8) | blob[i];
        }
        if (blob.size() != 4 + static_cast<std::size_t>(count) * 8) {
            return std::nullopt;
        }

        std::set<std::uint64_t> sequences;
        for (std::uint32_t n = 0; n < count; ++n) {
            std::uint64_t seq = 0;
            for (std::size_t i = 0; i < 8; ++i) {
                seq = (seq << 8) | blob[4 + n * 8 + i];
            }
            sequences.insert(seq);
        }
        return sequences;
    }

    constexpr const char* SELECT_COLUMNS =
        "SELECT job_id, job_key, direction, peer, filename, path, total_size, chunk_size, "
        "next_sequence, out_of_order, updated_at, nonce FROM resume_records ";
}

const char* to_string(Direction direction) {
    return direction == Direction::OUTGOING ? "outgoing" : "incoming";
}

std::uint64_t ResumeRecord::total_chunks() const {
    if (chunk_size == 0) {
        return 0;
    }
    return (total_size + chunk_size - 1) / chunk_size;
}

std::uint64_t ResumeRecord::chunk_length(std::uint64_t sequence) const {
    auto offset = sequence * chunk_size;
    if (offset >= total_size) {
        return 0;
    }
    return std::min<std::uint64_t>(chunk_size, total_size - offset);
}

bool ResumeRecord::is_confirmed(std::uint64_t sequence) const {
    return sequence < next_sequence || out_of_order.count(sequence) > 0;
}

bool ResumeRecord::confirm(std::uint64_t sequence) {
    if (is_confirmed(sequence) || sequence >= total_chunks()) {
        return false;
    }

    if (sequence == next_sequence) {
        ++next_sequence;
        while (!out_of_order.empty() && *out_of_order.begin() == next_sequence) {
            out_of_order.erase(out_of_order.begin());
            ++next_sequence;
        }
    } else {
        out_of_order.insert(sequence);
    }
    return true;
}

std::uint64_t ResumeRecord::confirmed_bytes() const {
    std::uint64_t bytes = std::min<std::uint64_t>(next_sequence * chunk_size, total_size);
    for (auto seq : out_of_order) {
        bytes += chunk_length(seq);
    }
    return bytes;
}

ResumeLedger::ResumeLedger(Database& database)
    : db_(database) {
}

Result ResumeLedger::initialize() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    return db_.exec(R"(
        CREATE TABLE IF NOT EXISTS resume_records (
            job_id BLOB PRIMARY KEY,
            job_key TEXT NOT NULL,
            direction INTEGER NOT NULL,
            peer TEXT NOT NULL,
            filename TEXT NOT NULL,
            path TEXT NOT NULL,
            total_size INTEGER NOT NULL,
            chunk_size INTEGER NOT NULL,
            next_sequence INTEGER NOT NULL,
            out_of_order BLOB NOT NULL,
            updated_at INTEGER NOT NULL,
            nonce BLOB
        );
        CREATE INDEX IF NOT EXISTS idx_resume_job_key ON resume_records(job_key, direction);
    )");
}

std::optional<ResumeRecord> ResumeLedger::load(const network::JobId& job_id) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, (std::string(SELECT_COLUMNS) + "WHERE job_id = ?").c_str());
    if (!stmt.valid()) {
        return std::nullopt;
    }

    stmt.bind_blob(1, std::vector<std::uint8_t>(job_id.begin(), job_id.end()));
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_row(stmt);
}

std::optional<ResumeRecord> ResumeLedger::load_by_key(const std::string& job_key, Direction direction) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, (std::string(SELECT_COLUMNS) +
                         "WHERE job_key = ? AND direction = ? ORDER BY updated_at DESC LIMIT 1").c_str());
    if (!stmt.valid()) {
        return std::nullopt;
    }

    stmt.bind(1, job_key);
    stmt.bind(2, static_cast<std::int64_t>(direction));
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_row(stmt);
}

Result ResumeLedger::save(const ResumeRecord& record) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO resume_records
            (job_id, job_key, direction, peer, filename, path, total_size, chunk_size,
             next_sequence, out_of_order, updated_at, nonce)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.valid()) {
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    stmt.bind_blob(1, std::vector<std::uint8_t>(record.job_id.begin(), record.job_id.end()));
    stmt.bind(2, record.job_key);
    stmt.bind(3, static_cast<std::int64_t>(record.direction));
    stmt.bind(4, record.peer);
    stmt.bind(5, record.filename);
    stmt.bind(6, record.path.string());
    stmt.bind(7, static_cast<std::int64_t>(record.total_size));
    stmt.bind(8, static_cast<std::int64_t>(record.chunk_size));
    stmt.bind(9, static_cast<std::int64_t>(record.next_sequence));
    stmt.bind_blob(10, encode_sequences(record.out_of_order));
    stmt.bind(11, static_cast<std::int64_t>(TimeUtils::unix_millis(std::chrono::system_clock::now())));
    stmt.bind_blob(12, record.nonce);

    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR("Failed to save resume record {}: {}", network::to_hex(record.job_id), db_.last_error());
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    return Result();
}

Result ResumeLedger::remove(const network::JobId& job_id) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, "DELETE FROM resume_records WHERE job_id = ?");
    if (!stmt.valid()) {
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    stmt.bind_blob(1, std::vector<std::uint8_t>(job_id.begin(), job_id.end()));
    if (stmt.step() != SQLITE_DONE) {
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    return Result();
}

std::vector<ResumeRecord> ResumeLedger::list() {
    std::lock_guard<std::mutex> lock(db_.mutex());
    std::vector<ResumeRecord> records;

    Statement stmt(db_, (std::string(SELECT_COLUMNS) + "ORDER BY updated_at").c_str());
    if (!stmt.valid()) {
        return records;
    }

    while (stmt.step() == SQLITE_ROW) {
        if (auto record = read_row(stmt)) {
            records.push_back(std::move(*record));
        }
    }
    return records;
}

std::optional<ResumeRecord> ResumeLedger::read_row(Statement& stmt) {
    ResumeRecord record;

    auto id = stmt.column_blob(0);
    auto direction = stmt.column_int64(2);
    auto total_size = stmt.column_int64(6);
    auto chunk_size = stmt.column_int64(7);
    auto next_sequence = stmt.column_int64(8);
    auto out_of_order = decode_sequences(stmt.column_blob(9));

    if (id.size() != network::JOB_ID_SIZE || (direction != 0 && direction != 1) ||
        total_size < 0 || chunk_size <= 0 || chunk_size > network::MAX_PAYLOAD_SIZE ||
        next_sequence < 0 || !out_of_order) {
        LOG_WARN("Ignoring undecodable resume record (job key '{}')", stmt.column_text(1));
        return std::nullopt;
    }

    std::copy(id.begin(), id.end(), record.job_id.begin());
    record.job_key = stmt.column_text(1);
    record.direction = static_cast<Direction>(direction);
    record.peer = stmt.column_text(3);
    record.filename = stmt.column_text(4);
    record.path = stmt.column_text(5);
    record.total_size = static_cast<std::uint64_t>(total_size);
    record.chunk_size = static_cast<std::uint32_t>(chunk_size);
    record.next_sequence = static_cast<std::uint64_t>(next_sequence);
    record.out_of_order = std::move(*out_of_order);
    record.updated_at = TimeUtils::from_unix_millis(static_cast<std::uint64_t>(stmt.column_int64(10)));
    record.nonce = stmt.column_blob(11);

    auto total = record.total_chunks();
    bool consistent = record.next_sequence <= total &&
        std::all_of(record.out_of_order.begin(), record.out_of_order.end(),
                    [&](std::uint64_t seq) { return seq > record.next_sequence && seq < total; });
    if (!consistent) {
        LOG_WARN("Ignoring inconsistent resume record {}", network::to_hex(record.job_id));
        return std::nullopt;
    }

    return record;
}

}
