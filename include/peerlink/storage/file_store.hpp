#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/network/protocol.hpp"
#include <filesystem>
#include <span>
#include <string>
#include <set>
#include <mutex>
#include <cstdint>

namespace peerlink::storage {

constexpr const char* PARTIAL_SUFFIX = ".part";

// Maps an errno from a failed write to the reason reported to the sender.
network::ReasonCode reason_for_errno(int error);

// A "<destination>.part" file written at arbitrary offsets with pwrite.
class PartialFile {
public:
    PartialFile();
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    core::Result open(const std::filesystem::path& path, bool truncate);
    void close();

    // Writes all of `data` at `offset`; with `durable` the data is on disk
    // (fdatasync) before this returns.
    core::Result write_at(std::uint64_t offset, std::span<const std::uint8_t> data, bool durable);

    bool is_open() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

    // errno of the last failed open or write.
    int last_error() const { return last_error_; }

private:
    int fd_;
    int last_error_;
    std::filesystem::path path_;
};

// The save directory for incoming files.
class FileStore {
public:
    explicit FileStore(std::filesystem::path save_directory);

    core::Result prepare();

    const std::filesystem::path& save_directory() const { return save_directory_; }

    // Keeps the last path component and replaces characters that are unsafe
    // in file names. Never returns an empty name.
    static std::string sanitize_filename(const std::string& name);

    static std::filesystem::path partial_path(const std::filesystem::path& destination);

    // A destination for `filename` that collides with no existing file, no
    // partial file and no destination reserved by another running job.
    std::filesystem::path reserve_destination(const std::string& filename);
    void reserve(const std::filesystem::path& destination);
    void release(const std::filesystem::path& destination);

    // Renames the partial file into place. When something appeared at the
    // reserved destination meanwhile, a new unique name is picked and written
    // back to `destination`.
    core::Result finalize(std::filesystem::path& destination);

    static void discard(const std::filesystem::path& destination);

    std::uint64_t available_space() const;
    bool has_space_for(std::uint64_t bytes) const;

private:
    bool is_taken(const std::filesystem::path& candidate) const;

    std::filesystem::path save_directory_;
    mutable std::mutex mutex_;
    std::set<std::filesystem::path> reserved_;
};

}
