#pragma once

#include "peerlink/core/result.hpp"
#include <array>
#include <vector>
#include <span>
#include <string>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace peerlink::crypto {

constexpr std::size_t BLAKE2B_256_SIZE = 32;

using Blake2bHash = std::array<std::uint8_t, BLAKE2B_256_SIZE>;

// Calls sodium_init() once per process. Safe to call from any thread.
bool initialize();

// Streaming BLAKE2b (libsodium crypto_generichash) with a configurable digest
// length between 16 and 64 bytes.
class Blake2bHasher {
public:
    explicit Blake2bHasher(std::size_t digest_size = BLAKE2B_256_SIZE);
    ~Blake2bHasher();

    Blake2bHasher(const Blake2bHasher&) = delete;
    Blake2bHasher& operator=(const Blake2bHasher&) = delete;

    core::Result update(std::span<const std::uint8_t> data);
    core::Result update(const std::string& data);
    core::Result finalize(std::span<std::uint8_t> output);
    std::vector<std::uint8_t> finalize();

    static Blake2bHash hash(std::span<const std::uint8_t> data);
    static core::Result hash_file(const std::filesystem::path& file_path, Blake2bHash& output);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::size_t digest_size_;
    bool finalized_;
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);
std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string);

}

}
