#pragma once

#include "peerlink/core/result.hpp"
#include <filesystem>
#include <mutex>
#include <string>
#include <cstdint>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace peerlink::storage {

// The SQLite file shared by the resume ledger and the transfer history.
// Opened in WAL mode with synchronous=FULL; every statement is atomic, so a
// crash leaves the previous row intact.
class Database {
public:
    explicit Database(std::filesystem::path path);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // A file that is not a usable SQLite database is moved aside to
    // "<path>.corrupt" and a fresh one is created.
    core::Result open();
    void close();

    bool is_open() const { return db_ != nullptr; }
    const std::filesystem::path& path() const { return path_; }

    core::Result exec(const std::string& sql);

    sqlite3* handle() const { return db_; }
    std::mutex& mutex() { return mutex_; }

    std::string last_error() const;

private:
    int open_and_configure();

    std::filesystem::path path_;
    sqlite3* db_;
    std::mutex mutex_;
};

// Owns one prepared statement.
class Statement {
public:
    Statement(Database& db, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool valid() const { return stmt_ != nullptr; }

    void bind(int index, const std::string& value);
    void bind(int index, std::int64_t value);
    void bind_blob(int index, const std::vector<std::uint8_t>& value);

    // SQLITE_ROW, SQLITE_DONE or an error code.
    int step();

    std::string column_text(int index) const;
    std::int64_t column_int64(int index) const;
    std::vector<std::uint8_t> column_blob(int index) const;

private:
    sqlite3_stmt* stmt_;
};

}
