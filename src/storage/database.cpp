#include "peerlink/storage/database.hpp"
#include "peerlink/core/logger.hpp"
#include <sqlite3.h>
#include <system_error>

namespace peerlink::storage {

Database::Database(std::filesystem::path path)
    : path_(std::move(path)), db_(nullptr) {
}

Database::~Database() {
    close();
}

core::Result Database::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (db_) {
        return core::Result();
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    int rc = open_and_configure();
    if (rc == SQLITE_NOTADB || rc == SQLITE_CORRUPT) {
        auto aside = path_;
        aside += ".corrupt";
        LOG_ERROR("Database {} is unreadable, moving it to {}", path_.string(), aside.string());

        std::filesystem::rename(path_, aside, ec);
        if (ec) {
            return core::Result(core::ErrorCode::LEDGER_ERROR,
                                "Cannot move corrupt database aside: " + ec.message());
        }
        for (const char* suffix : {"-wal", "-shm"}) {
            auto side = path_;
            side += suffix;
            std::filesystem::remove(side, ec);
        }

        rc = open_and_configure();
    }

    if (rc != SQLITE_OK) {
        return core::Result(core::ErrorCode::LEDGER_ERROR,
                            "Cannot open database " + path_.string() + ": " + sqlite3_errstr(rc));
    }

    LOG_DEBUG("Opened database {}", path_.string());
    return core::Result();
}

int Database::open_and_configure() {
    int rc = sqlite3_open_v2(path_.string().c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

    if (rc == SQLITE_OK) {
        sqlite3_busy_timeout(db_, 5000);
        // The first real read of the file happens here; a garbage file fails
        // with SQLITE_NOTADB.
        rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    }
    if (rc == SQLITE_OK) {
        rc = sqlite3_exec(db_, "PRAGMA synchronous=FULL;", nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK && db_) {
        int extended = sqlite3_errcode(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        return extended;
    }

    return rc;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

core::Result Database::exec(const std::string& sql) {
    if (!db_) {
        return core::Result(core::ErrorCode::LEDGER_ERROR, "Database not open");
    }

    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return core::Result(core::ErrorCode::LEDGER_ERROR, message);
    }

    return core::Result();
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database not open";
}

Statement::Statement(Database& db, const char* sql)
    : stmt_(nullptr) {
    if (!db.handle()) {
        return;
    }
    if (sqlite3_prepare_v2(db.handle(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare statement: {}", db.last_error());
        stmt_ = nullptr;
    }
}

Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

void Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
}

void Statement::bind_blob(int index, const std::vector<std::uint8_t>& value) {
    sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

int Statement::step() {
    return sqlite3_step(stmt_);
}

std::string Statement::column_text(int index) const {
    auto text = sqlite3_column_text(stmt_, index);
    if (!text) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, index)));
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::vector<std::uint8_t> Statement::column_blob(int index) const {
    auto data = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt_, index));
    auto size = sqlite3_column_bytes(stmt_, index);
    if (!data || size <= 0) {
        return {};
    }
    return std::vector<std::uint8_t>(data, data + size);
}

}
