#include "peerlink/crypto/random.hpp"
#include "peerlink/crypto/hash.hpp"
#include <sodium.h>
#include <stdexcept>

namespace peerlink::crypto {

core::Result SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return core::Result(core::ErrorCode::INVALID_STATE, "libsodium not initialized");
    }
    if (output.empty()) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Output buffer is empty");
    }

    randombytes_buf(output.data(), output.size());
    return core::Result();
}

std::vector<std::uint8_t> SecureRandom::generate_bytes(std::size_t count) {
    std::vector<std::uint8_t> result(count);
    auto generated = generate_bytes(std::span<std::uint8_t>(result));
    if (!generated) {
        throw std::runtime_error("Failed to generate random bytes: " + generated.message);
    }
    return result;
}

}
