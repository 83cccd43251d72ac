#pragma once

#include "peerlink/network/frame.hpp"
#include "peerlink/transfer/transfer_job.hpp"
#include "peerlink/transfer/chunk_codec.hpp"
#include <chrono>
#include <functional>
#include <mutex>

namespace peerlink::transfer {

enum class ProtocolState {
    INIT,
    STREAMING,
    COMPLETING,
    RETRYING,
    ABORTED,
    DONE
};

const char* to_string(ProtocolState state);

struct ProtocolSettings {
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    network::ChecksumAlgorithm checksum = network::ChecksumAlgorithm::BLAKE2B_256;
    std::uint64_t window_bytes = 1024 * 1024;
    std::chrono::milliseconds ack_timeout{5000};
    unsigned max_chunk_retries = 3;
    std::chrono::milliseconds start_timeout{10000};
    std::chrono::milliseconds complete_timeout{30000};
    bool durable_writes = true;
};

// Called for every newly confirmed chunk with the job's confirmed byte count.
using ProgressCallback = std::function<void(const TransferJob& job, std::uint64_t bytes_confirmed)>;

// Drives one job through INIT -> STREAMING -> (COMPLETING | RETRYING |
// ABORTED) -> DONE over a FrameSink. Subclasses implement the two sides.
class TransferProtocol : public network::FrameHandler {
public:
    TransferProtocol(TransferJob job, network::FrameSink& sink, const ProtocolSettings& settings);
    ~TransferProtocol() override = default;

    ProtocolState state() const;
    network::ReasonCode failure_reason() const;
    TransferJob job() const;

    void set_progress_callback(ProgressCallback callback) { progress_callback_ = std::move(callback); }

protected:
    void set_state(ProtocolState state);
    void set_failure(network::ReasonCode reason);

    template<network::MessagePayload T>
    core::Result send(const T& message) {
        return sink_.send_frame(network::Frame::make(job_.id, message));
    }

    void report_progress(std::uint64_t bytes_confirmed);

    TransferJob job_;
    network::FrameSink& sink_;
    ProtocolSettings settings_;
    ChunkCodec codec_;

    mutable std::mutex state_mutex_;

private:
    ProtocolState state_;
    network::ReasonCode reason_;
    ProgressCallback progress_callback_;
};

}
