#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/network/connection_manager.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink::engine {

// Known peers by name. Seeded from "peer.<name>=host:port" entries and
// extended with peers that introduce themselves through HELLO.
class PeerDirectory {
public:
    PeerDirectory() = default;

    PeerDirectory(const PeerDirectory&) = delete;
    PeerDirectory& operator=(const PeerDirectory&) = delete;

    // Adds every valid peer entry of `config`. Returns how many were added.
    std::size_t load(const core::Config& config);

    // "host:port", "[v6addr]:port" or a bare host (default port).
    static std::optional<network::Peer> parse_address(const std::string& name, const std::string& address);

    void add(network::Peer peer);
    std::optional<network::Peer> find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<network::Peer> list() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, network::Peer> peers_;
};

}
