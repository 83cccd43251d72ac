#include "peerlink/engine/events.hpp"
#include "peerlink/core/utils.hpp"
#include <fmt/format.h>

namespace peerlink::engine {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

}

std::string describe(const Event& event) {
    using core::utils::StringUtils;

    return std::visit(overloaded{
        [](const ConnectionStateChanged& e) {
            if (e.reason == network::DisconnectReason::NONE) {
                return fmt::format("peer {} {}", e.peer, network::to_string(e.state));
            }
            return fmt::format("peer {} {} ({})", e.peer, network::to_string(e.state), network::to_string(e.reason));
        },
        [](const TransferProgress& e) {
            return fmt::format("{} {} {:.1f}% {}/{} at {}/s, eta {}",
                               e.job_id.substr(0, 8), e.filename, e.percent(),
                               StringUtils::format_bytes(e.bytes_done), StringUtils::format_bytes(e.total_bytes),
                               StringUtils::format_bytes(e.rate_bps), StringUtils::format_duration(e.eta));
        },
        [](const TransferTerminal& e) {
            if (e.reason == network::ReasonCode::NONE) {
                return fmt::format("{} {} {} {}", e.job_id.substr(0, 8), storage::to_string(e.direction),
                                   e.filename, transfer::to_string(e.status));
            }
            return fmt::format("{} {} {} {} ({})", e.job_id.substr(0, 8), storage::to_string(e.direction),
                               e.filename, transfer::to_string(e.status), network::to_string(e.reason));
        }
    }, event);
}

}
