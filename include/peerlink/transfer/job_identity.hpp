#pragma once

#include "peerlink/network/protocol.hpp"
#include "peerlink/core/result.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

namespace peerlink::transfer {

constexpr std::size_t JOB_NONCE_SIZE = 16;

// What a job key is computed from. The same unchanged file sent to the same
// peer always yields the same key.
struct SourceIdentity {
    std::filesystem::path absolute_path;
    std::uint64_t size = 0;
    std::int64_t mtime_ns = 0;
};

core::Result describe_source(const std::filesystem::path& path, SourceIdentity& identity);

// Hex BLAKE2b-256 of (peer, absolute path, size, mtime).
std::string make_job_key(const std::string& peer, const SourceIdentity& source);

// BLAKE2b-128 of (job key, nonce).
network::JobId make_job_id(const std::string& job_key, const std::vector<std::uint8_t>& nonce);

std::vector<std::uint8_t> make_job_nonce();

}
