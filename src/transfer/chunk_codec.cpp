#include "peerlink/transfer/chunk_codec.hpp"
#include "peerlink/crypto/hash.hpp"
#include <boost/crc.hpp>
#include <algorithm>
#include <stdexcept>

namespace peerlink::transfer {

using core::ErrorCode;
using core::Result;

ChunkCodec::ChunkCodec(std::uint32_t chunk_size, network::ChecksumAlgorithm algorithm)
    : chunk_size_(chunk_size), algorithm_(algorithm) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
}

std::uint64_t ChunkCodec::chunk_count(std::uint64_t total_size) const {
    return (total_size + chunk_size_ - 1) / chunk_size_;
}

std::uint64_t ChunkCodec::chunk_offset(std::uint64_t sequence) const {
    return sequence * chunk_size_;
}

std::uint32_t ChunkCodec::chunk_length(std::uint64_t total_size, std::uint64_t sequence) const {
    auto offset = chunk_offset(sequence);
    if (offset >= total_size) {
        return 0;
    }
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(chunk_size_, total_size - offset));
}

Chunk ChunkCodec::encode(const network::JobId& job_id, std::uint64_t sequence, std::vector<std::uint8_t> payload) const {
    Chunk chunk;
    chunk.job_id = job_id;
    chunk.sequence = sequence;
    chunk.checksum = checksum(payload);
    chunk.payload = std::move(payload);
    return chunk;
}

bool ChunkCodec::verify(const Chunk& chunk) const {
    return chunk.checksum == checksum(chunk.payload);
}

std::vector<std::uint8_t> ChunkCodec::checksum(std::span<const std::uint8_t> payload) const {
    return checksum(algorithm_, payload);
}

std::vector<std::uint8_t> ChunkCodec::checksum(network::ChecksumAlgorithm algorithm,
                                               std::span<const std::uint8_t> payload) {
    if (algorithm == network::ChecksumAlgorithm::CRC32) {
        boost::crc_32_type crc;
        crc.process_bytes(payload.data(), payload.size());
        auto value = crc.checksum();
        return {static_cast<std::uint8_t>(value >> 24), static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8), static_cast<std::uint8_t>(value)};
    }

    auto digest = crypto::Blake2bHasher::hash(payload);
    return std::vector<std::uint8_t>(digest.begin(), digest.end());
}

network::ChunkMessage ChunkCodec::to_message(const Chunk& chunk) {
    return network::ChunkMessage{chunk.sequence, chunk.payload, chunk.checksum};
}

Chunk ChunkCodec::from_message(const network::JobId& job_id, network::ChunkMessage message) {
    Chunk chunk;
    chunk.job_id = job_id;
    chunk.sequence = message.sequence;
    chunk.payload = std::move(message.payload);
    chunk.checksum = std::move(message.checksum);
    return chunk;
}

ChunkReader::ChunkReader(const ChunkCodec& codec, std::uint64_t total_size)
    : codec_(codec), total_size_(total_size) {
}

Result ChunkReader::open(const std::filesystem::path& path) {
    file_.open(path, std::ios::binary);
    if (!file_.is_open()) {
        return Result(ErrorCode::FILE_READ_ERROR, "Cannot open " + path.string());
    }
    path_ = path;
    return Result();
}

Result ChunkReader::read(const network::JobId& job_id, std::uint64_t sequence, Chunk& chunk) {
    auto length = codec_.chunk_length(total_size_, sequence);
    if (length == 0) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Sequence " + std::to_string(sequence) + " out of range");
    }

    std::vector<std::uint8_t> payload(length);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(codec_.chunk_offset(sequence)));
    file_.read(reinterpret_cast<char*>(payload.data()), length);

    if (static_cast<std::uint32_t>(file_.gcount()) != length) {
        return Result(ErrorCode::FILE_READ_ERROR,
                      "Short read of chunk " + std::to_string(sequence) + " from " + path_.string());
    }

    chunk = codec_.encode(job_id, sequence, std::move(payload));
    return Result();
}

}
