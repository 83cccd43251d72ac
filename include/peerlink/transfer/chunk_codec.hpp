#pragma once

#include "peerlink/network/protocol.hpp"
#include "peerlink/core/result.hpp"
#include <vector>
#include <span>
#include <fstream>
#include <filesystem>
#include <cstdint>

namespace peerlink::transfer {

constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 65536;

struct Chunk {
    network::JobId job_id{};
    std::uint64_t sequence = 0;
    std::vector<std::uint8_t> payload;
    std::vector<std::uint8_t> checksum;
};

// Cuts a file of `total_size` bytes into fixed-size chunks (the last one may
// be short) and computes and checks their integrity tags. Holds no file state.
class ChunkCodec {
public:
    explicit ChunkCodec(std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE,
                        network::ChecksumAlgorithm algorithm = network::ChecksumAlgorithm::BLAKE2B_256);

    std::uint32_t chunk_size() const { return chunk_size_; }
    network::ChecksumAlgorithm algorithm() const { return algorithm_; }

    std::uint64_t chunk_count(std::uint64_t total_size) const;
    std::uint64_t chunk_offset(std::uint64_t sequence) const;
    std::uint32_t chunk_length(std::uint64_t total_size, std::uint64_t sequence) const;

    Chunk encode(const network::JobId& job_id, std::uint64_t sequence, std::vector<std::uint8_t> payload) const;
    bool verify(const Chunk& chunk) const;

    std::vector<std::uint8_t> checksum(std::span<const std::uint8_t> payload) const;
    static std::vector<std::uint8_t> checksum(network::ChecksumAlgorithm algorithm,
                                              std::span<const std::uint8_t> payload);

    static network::ChunkMessage to_message(const Chunk& chunk);
    static Chunk from_message(const network::JobId& job_id, network::ChunkMessage message);

private:
    std::uint32_t chunk_size_;
    network::ChecksumAlgorithm algorithm_;
};

// Random-access reader for the chunks of a source file.
class ChunkReader {
public:
    ChunkReader(const ChunkCodec& codec, std::uint64_t total_size);

    core::Result open(const std::filesystem::path& path);

    core::Result read(const network::JobId& job_id, std::uint64_t sequence, Chunk& chunk);

private:
    const ChunkCodec& codec_;
    std::uint64_t total_size_;
    std::ifstream file_;
    std::filesystem::path path_;
};

}
