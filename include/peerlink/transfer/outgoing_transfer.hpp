#pragma once

#include "peerlink/transfer/transfer_protocol.hpp"
#include "peerlink/storage/resume_ledger.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <optional>

namespace peerlink::transfer {

enum class TransferOutcome {
    COMPLETED,
    FAILED,
    CANCELLED,
    PAUSED,
    INTERRUPTED     // connection lost, job should go back to the queue
};

const char* to_string(TransferOutcome outcome);

// Sending side of one job. run() blocks the calling worker thread until the
// job leaves the STREAMING/COMPLETING states; frames for the job are handed
// in from the connection's strand through on_frame().
class OutgoingTransfer : public TransferProtocol {
public:
    OutgoingTransfer(TransferJob job, network::FrameSink& sink, const ProtocolSettings& settings);

    TransferOutcome run();

    // Pause or cancel. Observed between chunks; the peer gets FILE_ABORT
    // with `reason`.
    void request_stop(network::ReasonCode reason);

    void on_frame(const network::Frame& frame) override;
    void on_connection_lost() override;

    // Chunks the receiver confirmed so far, including those it already had.
    storage::ResumeRecord progress() const;

    // Hex BLAKE2b-256 of the file once the receiver confirmed it.
    std::string whole_file_checksum() const;

    std::uint64_t chunks_sent() const;
    std::uint64_t retransmissions() const;

private:
    using Clock = std::chrono::steady_clock;

    enum class Wake {
        FRAME,
        TIMEOUT,
        STOPPED,
        LOST
    };

    struct InFlight {
        std::uint32_t length;
        Clock::time_point sent_at;
        unsigned retransmissions;
    };

    Wake wait(Clock::time_point deadline, network::Frame& frame);

    std::optional<TransferOutcome> negotiate(std::deque<std::uint64_t>& pending);
    std::optional<TransferOutcome> stream(ChunkReader& reader, std::deque<std::uint64_t>& pending);
    TransferOutcome complete();

    // Returns false when the chunk could not be read or sent; the outcome
    // is stored in `outcome`.
    bool send_chunk(ChunkReader& reader, std::uint64_t sequence, TransferOutcome& outcome);
    std::optional<TransferOutcome> retransmit(ChunkReader& reader, std::uint64_t sequence, const char* why);

    TransferOutcome fail(network::ReasonCode reason, bool notify_peer);
    TransferOutcome stopped(network::ReasonCode reason);
    TransferOutcome aborted_by_peer(network::ReasonCode reason);
    TransferOutcome interrupted();

    std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<network::Frame> inbox_;
    bool connection_lost_;
    std::optional<network::ReasonCode> stop_request_;

    mutable std::mutex progress_mutex_;
    storage::ResumeRecord progress_;
    std::map<std::uint64_t, InFlight> in_flight_;
    std::uint64_t in_flight_bytes_;
    std::uint64_t chunks_sent_;
    std::uint64_t retransmissions_;
    std::string whole_file_checksum_;
};

}
