#pragma once

#include "peerlink/transfer/transfer_protocol.hpp"
#include "peerlink/transfer/transfer_queue.hpp"
#include "peerlink/storage/resume_ledger.hpp"
#include "peerlink/storage/transfer_history.hpp"
#include "peerlink/storage/file_store.hpp"
#include <memory>
#include <optional>

namespace peerlink::transfer {

// Receiver-side state shared by all incoming jobs of an engine.
struct IncomingContext {
    storage::ResumeLedger& ledger;
    storage::TransferHistory& history;
    storage::FileStore& store;
    TransferQueue& queue;
};

// Receiving side of one job. Created when a FILE_START for an unknown job
// arrives and driven entirely by frames on the connection's strand. Every
// chunk is written and recorded in the ledger before it is acknowledged.
class IncomingTransfer : public TransferProtocol {
public:
    // `status` is the job's status after the handler let go of it: a
    // terminal status, PAUSED, or QUEUED when the job was interrupted or
    // never started.
    using FinishCallback = std::function<void(const TransferJob& job, JobStatus status, network::ReasonCode reason)>;

    IncomingTransfer(const network::JobId& id, std::string peer, network::FrameSink& sink,
                     const ProtocolSettings& settings, IncomingContext context);
    ~IncomingTransfer() override;

    void on_finished(FinishCallback callback) { finish_callback_ = std::move(callback); }

    void on_frame(const network::Frame& frame) override;
    void on_connection_lost() override;

    // Local cancel: tells the sender, then deletes the partial file and
    // the resume record.
    void cancel();

    bool finished() const;

private:
    void handle_start(const network::FileStartMessage& offer);
    void handle_chunk(network::ChunkMessage message);
    void handle_complete(const network::FileCompleteMessage& message);
    void handle_abort(network::ReasonCode reason);

    core::Result open_partial(const network::FileStartMessage& offer, bool resume);
    core::Result reply_start();

    void reject(network::ReasonCode reason);
    void fail(network::ReasonCode reason, bool notify_peer);
    void discard();
    void archive(storage::HistoryStatus status, network::ReasonCode reason, const std::string& checksum);

    // Records the final status; the callback runs from flush_finish() once
    // mutex_ is released.
    void finish(JobStatus status, network::ReasonCode reason);
    void flush_finish();

    struct PendingFinish {
        TransferJob job;
        JobStatus status;
        network::ReasonCode reason;
    };

    IncomingContext context_;
    mutable std::mutex mutex_;
    storage::ResumeRecord record_;
    storage::PartialFile partial_;
    bool activated_;
    bool finished_;
    FinishCallback finish_callback_;
    std::optional<PendingFinish> pending_finish_;
};

}
