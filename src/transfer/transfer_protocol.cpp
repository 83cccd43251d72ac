#include "peerlink/transfer/transfer_protocol.hpp"
#include "peerlink/core/logger.hpp"

namespace peerlink::transfer {

const char* to_string(ProtocolState state) {
    switch (state) {
        case ProtocolState::INIT:       return "INIT";
        case ProtocolState::STREAMING:  return "STREAMING";
        case ProtocolState::COMPLETING: return "COMPLETING";
        case ProtocolState::RETRYING:   return "RETRYING";
        case ProtocolState::ABORTED:    return "ABORTED";
        case ProtocolState::DONE:       return "DONE";
    }
    return "UNKNOWN";
}

TransferProtocol::TransferProtocol(TransferJob job, network::FrameSink& sink, const ProtocolSettings& settings)
    : job_(std::move(job))
    , sink_(sink)
    , settings_(settings)
    , codec_(job_.chunk_size == 0 ? settings.chunk_size : job_.chunk_size, settings.checksum)
    , state_(ProtocolState::INIT)
    , reason_(network::ReasonCode::NONE) {
}

ProtocolState TransferProtocol::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

network::ReasonCode TransferProtocol::failure_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return reason_;
}

TransferJob TransferProtocol::job() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return job_;
}

void TransferProtocol::set_state(ProtocolState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != state) {
        LOG_TRACE("Job {} {} -> {}", job_.id_hex(), to_string(state_), to_string(state));
        state_ = state;
    }
}

void TransferProtocol::set_failure(network::ReasonCode reason) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    reason_ = reason;
}

void TransferProtocol::report_progress(std::uint64_t bytes_confirmed) {
    TransferJob snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (bytes_confirmed > job_.bytes_confirmed) {
            job_.bytes_confirmed = bytes_confirmed;
            job_.last_chunk_at = std::chrono::system_clock::now();
        }
        snapshot = job_;
    }

    if (progress_callback_) {
        progress_callback_(snapshot, bytes_confirmed);
    }
}

}
