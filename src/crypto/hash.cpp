#include "peerlink/crypto/hash.hpp"
#include "peerlink/core/logger.hpp"
#include <sodium.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <stdexcept>

namespace peerlink::crypto {

using core::ErrorCode;
using core::Result;

bool initialize() {
    static std::once_flag once;
    static bool ready = false;

    std::call_once(once, []() {
        ready = sodium_init() >= 0;
        if (!ready) {
            LOG_CRITICAL("libsodium initialization failed");
        }
    });

    return ready;
}

struct Blake2bHasher::Impl {
    crypto_generichash_state state;
};

Blake2bHasher::Blake2bHasher(std::size_t digest_size)
    : impl_(std::make_unique<Impl>())
    , digest_size_(digest_size)
    , finalized_(false) {
    initialize();

    if (digest_size_ < crypto_generichash_BYTES_MIN || digest_size_ > crypto_generichash_BYTES_MAX) {
        throw std::invalid_argument("Unsupported BLAKE2b digest size: " + std::to_string(digest_size));
    }

    if (crypto_generichash_init(&impl_->state, nullptr, 0, digest_size_) != 0) {
        throw std::runtime_error("Failed to initialize BLAKE2b state");
    }
}

Blake2bHasher::~Blake2bHasher() {
    sodium_memzero(&impl_->state, sizeof(impl_->state));
}

Result Blake2bHasher::update(std::span<const std::uint8_t> data) {
    if (finalized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher already finalized");
    }

    if (crypto_generichash_update(&impl_->state, data.data(), data.size()) != 0) {
        return Result(ErrorCode::INVALID_STATE, "Failed to update hash");
    }

    return Result();
}

Result Blake2bHasher::update(const std::string& data) {
    return update(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

Result Blake2bHasher::finalize(std::span<std::uint8_t> output) {
    if (finalized_) {
        return Result(ErrorCode::INVALID_STATE, "Hasher already finalized");
    }

    if (output.size() < digest_size_) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Output buffer too small");
    }

    if (crypto_generichash_final(&impl_->state, output.data(), digest_size_) != 0) {
        return Result(ErrorCode::INVALID_STATE, "Failed to finalize hash");
    }

    finalized_ = true;
    return Result();
}

std::vector<std::uint8_t> Blake2bHasher::finalize() {
    std::vector<std::uint8_t> digest(digest_size_);
    auto result = finalize(std::span(digest));
    if (!result) {
        throw std::runtime_error("Failed to finalize hash: " + result.message);
    }
    return digest;
}

Blake2bHash Blake2bHasher::hash(std::span<const std::uint8_t> data) {
    initialize();
    Blake2bHash result;
    crypto_generichash(result.data(), result.size(), data.data(), data.size(), nullptr, 0);
    return result;
}

Result Blake2bHasher::hash_file(const std::filesystem::path& file_path, Blake2bHash& output) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        return Result(ErrorCode::FILE_READ_ERROR, "Cannot open file for hashing: " + file_path.string());
    }

    Blake2bHasher hasher;

    constexpr std::size_t buffer_size = 65536;
    std::vector<std::uint8_t> buffer(buffer_size);

    while (file.good()) {
        file.read(reinterpret_cast<char*>(buffer.data()), buffer_size);
        auto bytes_read = static_cast<std::size_t>(file.gcount());

        if (bytes_read > 0) {
            auto result = hasher.update(std::span(buffer.data(), bytes_read));
            if (!result) {
                return result;
            }
        }
    }

    if (file.bad()) {
        return Result(ErrorCode::FILE_READ_ERROR, "Read error while hashing: " + file_path.string());
    }

    return hasher.finalize(std::span(output));
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::optional<std::vector<std::uint8_t>> from_hex(const std::string& hex_string) {
    if (hex_string.size() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex_string.size() / 2);

    for (std::size_t i = 0; i < hex_string.size(); i += 2) {
        int high = nibble(hex_string[i]);
        int low = nibble(hex_string[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return bytes;
}

}

}
