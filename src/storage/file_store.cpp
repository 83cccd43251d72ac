#include "peerlink/storage/file_store.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace peerlink::storage {

using core::ErrorCode;
using core::Result;

network::ReasonCode reason_for_errno(int error) {
    switch (error) {
        case ENOSPC:
        case EDQUOT:
        case EFBIG:
            return network::ReasonCode::DISK_FULL;
        case EACCES:
        case EPERM:
        case EROFS:
            return network::ReasonCode::PERMISSION_DENIED;
        default:
            return network::ReasonCode::WRITE_FAILED;
    }
}

PartialFile::PartialFile()
    : fd_(-1), last_error_(0) {
}

PartialFile::~PartialFile() {
    close();
}

Result PartialFile::open(const std::filesystem::path& path, bool truncate) {
    close();

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) {
        flags |= O_TRUNC;
    }

    fd_ = ::open(path.c_str(), flags, 0644);
    if (fd_ < 0) {
        last_error_ = errno;
        return Result(ErrorCode::FILE_WRITE_ERROR,
                      "Cannot open " + path.string() + ": " + std::strerror(last_error_));
    }

    path_ = path;
    return Result();
}

void PartialFile::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result PartialFile::write_at(std::uint64_t offset, std::span<const std::uint8_t> data, bool durable) {
    if (fd_ < 0) {
        return Result(ErrorCode::INVALID_STATE, "Partial file not open");
    }

    std::size_t written = 0;
    while (written < data.size()) {
        auto n = ::pwrite(fd_, data.data() + written, data.size() - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            last_error_ = errno;
            return Result(ErrorCode::FILE_WRITE_ERROR,
                          "Write to " + path_.string() + " failed: " + std::strerror(last_error_));
        }
        written += static_cast<std::size_t>(n);
    }

    if (durable && ::fdatasync(fd_) != 0) {
        last_error_ = errno;
        return Result(ErrorCode::FILE_WRITE_ERROR,
                      "fdatasync of " + path_.string() + " failed: " + std::strerror(last_error_));
    }

    return Result();
}

FileStore::FileStore(std::filesystem::path save_directory)
    : save_directory_(std::move(save_directory)) {
}

Result FileStore::prepare() {
    if (!core::utils::FileUtils::create_directories(save_directory_)) {
        return Result(ErrorCode::FILE_WRITE_ERROR, "Cannot create save directory " + save_directory_.string());
    }
    return Result();
}

std::string FileStore::sanitize_filename(const std::string& name) {
    auto base = std::filesystem::path(name).filename().string();

    std::string clean;
    clean.reserve(base.size());
    for (char c : base) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|') {
            clean.push_back('_');
        } else {
            clean.push_back(c);
        }
    }

    clean = core::utils::StringUtils::trim(clean);
    if (clean.empty() || clean == "." || clean == "..") {
        return "received_file";
    }
    return clean;
}

std::filesystem::path FileStore::partial_path(const std::filesystem::path& destination) {
    auto partial = destination;
    partial += PARTIAL_SUFFIX;
    return partial;
}

bool FileStore::is_taken(const std::filesystem::path& candidate) const {
    std::error_code ec;
    return reserved_.count(candidate) > 0 ||
           std::filesystem::exists(candidate, ec) ||
           std::filesystem::exists(partial_path(candidate), ec);
}

std::filesystem::path FileStore::reserve_destination(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto destination = core::utils::FileUtils::unique_path(
        save_directory_ / sanitize_filename(filename),
        [this](const std::filesystem::path& candidate) { return is_taken(candidate); });

    reserved_.insert(destination);
    return destination;
}

void FileStore::reserve(const std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.insert(destination);
}

void FileStore::release(const std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(destination);
}

Result FileStore::finalize(std::filesystem::path& destination) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto partial = partial_path(destination);
    std::error_code ec;

    if (std::filesystem::exists(destination, ec)) {
        auto replacement = core::utils::FileUtils::unique_path(destination,
            [this](const std::filesystem::path& candidate) {
                std::error_code exists_ec;
                return reserved_.count(candidate) > 0 || std::filesystem::exists(candidate, exists_ec);
            });
        LOG_INFO("{} appeared meanwhile, saving as {}", destination.string(), replacement.string());
        reserved_.erase(destination);
        destination = replacement;
    }

    std::filesystem::rename(partial, destination, ec);
    if (ec) {
        return Result(ErrorCode::FILE_WRITE_ERROR,
                      "Cannot move " + partial.string() + " into place: " + ec.message());
    }

    reserved_.erase(destination);
    return Result();
}

void FileStore::discard(const std::filesystem::path& destination) {
    std::error_code ec;
    std::filesystem::remove(partial_path(destination), ec);
    if (ec) {
        LOG_WARN("Failed to remove partial file for {}: {}", destination.string(), ec.message());
    }
}

std::uint64_t FileStore::available_space() const {
    std::error_code ec;
    auto info = std::filesystem::space(save_directory_, ec);
    return ec ? 0 : info.available;
}

bool FileStore::has_space_for(std::uint64_t bytes) const {
    std::error_code ec;
    auto info = std::filesystem::space(save_directory_, ec);
    if (ec) {
        LOG_WARN("Cannot query free space of {}: {}", save_directory_.string(), ec.message());
        return true;
    }
    return info.available >= bytes;
}

}
