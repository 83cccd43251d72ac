#include "peerlink/storage/transfer_history.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <sqlite3.h>

namespace peerlink::storage {

using core::ErrorCode;
using core::Result;
using core::utils::TimeUtils;

namespace {
    constexpr const char* SELECT_COLUMNS =
        "SELECT job_id, direction, peer, filename, size, status, reason, checksum, finished_at "
        "FROM transfer_history ";

    std::optional<HistoryEntry> read_entry(Statement& stmt) {
        auto id = stmt.column_blob(0);
        auto status = stmt.column_int64(5);
        if (id.size() != network::JOB_ID_SIZE || status < 0 || status > 2) {
            LOG_WARN("Ignoring undecodable history row");
            return std::nullopt;
        }

        HistoryEntry entry;
        std::copy(id.begin(), id.end(), entry.job_id.begin());
        entry.direction = stmt.column_int64(1) == 0 ? Direction::OUTGOING : Direction::INCOMING;
        entry.peer = stmt.column_text(2);
        entry.filename = stmt.column_text(3);
        entry.size = static_cast<std::uint64_t>(stmt.column_int64(4));
        entry.status = static_cast<HistoryStatus>(status);
        entry.reason = static_cast<network::ReasonCode>(stmt.column_int64(6));
        entry.checksum = stmt.column_text(7);
        entry.finished_at = TimeUtils::from_unix_millis(static_cast<std::uint64_t>(stmt.column_int64(8)));
        return entry;
    }
}

const char* to_string(HistoryStatus status) {
    switch (status) {
        case HistoryStatus::COMPLETED: return "completed";
        case HistoryStatus::FAILED:    return "failed";
        case HistoryStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

TransferHistory::TransferHistory(Database& database)
    : db_(database) {
}

Result TransferHistory::initialize() {
    std::lock_guard<std::mutex> lock(db_.mutex());

    return db_.exec(R"(
        CREATE TABLE IF NOT EXISTS transfer_history (
            job_id BLOB PRIMARY KEY,
            direction INTEGER NOT NULL,
            peer TEXT NOT NULL,
            filename TEXT NOT NULL,
            size INTEGER NOT NULL,
            status INTEGER NOT NULL,
            reason INTEGER NOT NULL,
            checksum TEXT,
            finished_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_history_finished_at ON transfer_history(finished_at);
    )");
}

Result TransferHistory::archive(const HistoryEntry& entry) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, R"(
        INSERT OR REPLACE INTO transfer_history
            (job_id, direction, peer, filename, size, status, reason, checksum, finished_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.valid()) {
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    stmt.bind_blob(1, std::vector<std::uint8_t>(entry.job_id.begin(), entry.job_id.end()));
    stmt.bind(2, static_cast<std::int64_t>(entry.direction));
    stmt.bind(3, entry.peer);
    stmt.bind(4, entry.filename);
    stmt.bind(5, static_cast<std::int64_t>(entry.size));
    stmt.bind(6, static_cast<std::int64_t>(entry.status));
    stmt.bind(7, static_cast<std::int64_t>(entry.reason));
    stmt.bind(8, entry.checksum);
    stmt.bind(9, static_cast<std::int64_t>(TimeUtils::unix_millis(entry.finished_at)));

    if (stmt.step() != SQLITE_DONE) {
        LOG_ERROR("Failed to archive job {}: {}", network::to_hex(entry.job_id), db_.last_error());
        return Result(ErrorCode::LEDGER_ERROR, db_.last_error());
    }

    LOG_DEBUG("Archived job {} as {}", network::to_hex(entry.job_id), to_string(entry.status));
    return Result();
}

std::optional<HistoryEntry> TransferHistory::find(const network::JobId& job_id) {
    std::lock_guard<std::mutex> lock(db_.mutex());

    Statement stmt(db_, (std::string(SELECT_COLUMNS) + "WHERE job_id = ?").c_str());
    if (!stmt.valid()) {
        return std::nullopt;
    }

    stmt.bind_blob(1, std::vector<std::uint8_t>(job_id.begin(), job_id.end()));
    if (stmt.step() != SQLITE_ROW) {
        return std::nullopt;
    }
    return read_entry(stmt);
}

std::vector<HistoryEntry> TransferHistory::recent(std::size_t limit) {
    std::lock_guard<std::mutex> lock(db_.mutex());
    std::vector<HistoryEntry> entries;

    Statement stmt(db_, (std::string(SELECT_COLUMNS) + "ORDER BY finished_at DESC LIMIT ?").c_str());
    if (!stmt.valid()) {
        return entries;
    }

    stmt.bind(1, static_cast<std::int64_t>(limit));
    while (stmt.step() == SQLITE_ROW) {
        if (auto entry = read_entry(stmt)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

}
