#include "peerlink/transfer/job_identity.hpp"
#include "peerlink/crypto/hash.hpp"
#include "peerlink/crypto/random.hpp"
#include <array>
#include <chrono>
#include <stdexcept>

namespace peerlink::transfer {

using core::ErrorCode;
using core::Result;

namespace {

void append_u64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

void append_string(std::vector<std::uint8_t>& out, const std::string& value) {
    append_u64(out, value.size());
    out.insert(out.end(), value.begin(), value.end());
}

}

Result describe_source(const std::filesystem::path& path, SourceIdentity& identity) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Bad path " + path.string() + ": " + ec.message());
    }
    absolute = absolute.lexically_normal();

    auto status = std::filesystem::status(absolute, ec);
    if (ec || !std::filesystem::exists(status)) {
        return Result(ErrorCode::NOT_FOUND, "No such file: " + absolute.string());
    }
    if (!std::filesystem::is_regular_file(status)) {
        return Result(ErrorCode::INVALID_ARGUMENT, absolute.string() + " is not a regular file");
    }

    auto size = std::filesystem::file_size(absolute, ec);
    if (ec) {
        return Result(ErrorCode::FILE_READ_ERROR, "Cannot stat " + absolute.string() + ": " + ec.message());
    }
    auto mtime = std::filesystem::last_write_time(absolute, ec);
    if (ec) {
        return Result(ErrorCode::FILE_READ_ERROR, "Cannot stat " + absolute.string() + ": " + ec.message());
    }

    identity.absolute_path = absolute;
    identity.size = size;
    identity.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count();
    return Result();
}

std::string make_job_key(const std::string& peer, const SourceIdentity& source) {
    std::vector<std::uint8_t> material;
    append_string(material, peer);
    append_string(material, source.absolute_path.string());
    append_u64(material, source.size);
    append_u64(material, static_cast<std::uint64_t>(source.mtime_ns));

    auto digest = crypto::Blake2bHasher::hash(material);
    return crypto::hash_utils::to_hex(digest);
}

network::JobId make_job_id(const std::string& job_key, const std::vector<std::uint8_t>& nonce) {
    crypto::Blake2bHasher hasher(network::JOB_ID_SIZE);
    network::JobId id{};
    if (!hasher.update(job_key) || !hasher.update(nonce) || !hasher.finalize(id)) {
        throw std::runtime_error("BLAKE2b unavailable for job id derivation");
    }
    return id;
}

std::vector<std::uint8_t> make_job_nonce() {
    return crypto::SecureRandom::generate_bytes(JOB_NONCE_SIZE);
}

}
