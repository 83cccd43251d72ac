#include "peerlink/engine/peer_directory.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"

namespace peerlink::engine {

std::size_t PeerDirectory::load(const core::Config& config) {
    std::size_t added = 0;
    for (const auto& [name, address] : config.get_section("peer.")) {
        auto peer = parse_address(name, address);
        if (!peer) {
            LOG_WARN("Ignoring peer '{}' with address '{}'", name, address);
            continue;
        }
        add(std::move(*peer));
        ++added;
    }
    return added;
}

std::optional<network::Peer> PeerDirectory::parse_address(const std::string& name, const std::string& address) {
    auto trimmed = core::utils::StringUtils::trim(address);
    if (name.empty() || trimmed.empty()) {
        return std::nullopt;
    }

    network::Peer peer;
    peer.name = name;

    std::string port_text;
    if (trimmed.front() == '[') {
        auto close = trimmed.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        peer.host = trimmed.substr(1, close - 1);
        if (close + 1 < trimmed.size()) {
            if (trimmed[close + 1] != ':') {
                return std::nullopt;
            }
            port_text = trimmed.substr(close + 2);
        }
    } else {
        auto colon = trimmed.rfind(':');
        if (colon != std::string::npos && trimmed.find(':') == colon) {
            peer.host = trimmed.substr(0, colon);
            port_text = trimmed.substr(colon + 1);
        } else {
            peer.host = trimmed;
        }
    }

    if (peer.host.empty()) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        try {
            std::size_t used = 0;
            unsigned long port = std::stoul(port_text, &used);
            if (used != port_text.size() || port == 0 || port > 65535) {
                return std::nullopt;
            }
            peer.port = static_cast<std::uint16_t>(port);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    return peer;
}

void PeerDirectory::add(network::Peer peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto name = peer.name;
    peers_[name] = std::move(peer);
}

std::optional<network::Peer> PeerDirectory::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = peers_.find(name);
    if (it == peers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PeerDirectory::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.count(name) > 0;
}

std::vector<network::Peer> PeerDirectory::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<network::Peer> result;
    for (const auto& [_, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

}
