#pragma once

#include "peerlink/core/result.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::crypto {

// libsodium randombytes. initialize() from hash.hpp is called on first use.
class SecureRandom {
public:
    static core::Result generate_bytes(std::span<std::uint8_t> output);
    static std::vector<std::uint8_t> generate_bytes(std::size_t count);
};

}
