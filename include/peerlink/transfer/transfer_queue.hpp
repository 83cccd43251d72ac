#pragma once

#include "peerlink/transfer/transfer_job.hpp"
#include "peerlink/core/result.hpp"
#include <map>
#include <deque>
#include <vector>
#include <mutex>
#include <optional>
#include <functional>

namespace peerlink::transfer {

// Jobs per peer. Queued jobs leave in FIFO order, except that interrupted
// or resumed work goes ahead of brand-new jobs. At most one job per
// (peer, direction) is ACTIVE.
class TransferQueue {
public:
    // Called, outside the queue's lock, whenever a job of `peer` becomes QUEUED.
    using RunnableCallback = std::function<void(const std::string& peer)>;

    TransferQueue() = default;

    TransferQueue(const TransferQueue&) = delete;
    TransferQueue& operator=(const TransferQueue&) = delete;

    void on_runnable(RunnableCallback callback);

    // Rejects a job whose key or id matches a job that is still queued,
    // active or paused.
    core::Result enqueue(TransferJob job);

    // Marks the next queued job of `peer` ACTIVE and returns it, unless a job
    // of that direction is already active.
    std::optional<TransferJob> dequeue_next(const std::string& peer, Direction direction = Direction::OUTGOING);

    // Incoming side: inserts or revives `job` and makes it the peer's active
    // incoming job.
    core::Result activate(TransferJob job);

    core::Result pause(const network::JobId& id);
    core::Result resume(const network::JobId& id);
    core::Result cancel(const network::JobId& id);
    core::Result retry(const network::JobId& id);

    // Active job whose connection dropped: back to the front of the queue.
    core::Result requeue_interrupted(const network::JobId& id);

    core::Result mark_completed(const network::JobId& id);
    core::Result mark_failed(const network::JobId& id, network::ReasonCode reason);

    // Never lowers bytes_confirmed.
    core::Result update_progress(const network::JobId& id, std::uint64_t bytes_confirmed);

    // Active first, then queued in dispatch order, then the rest by age.
    std::vector<TransferJob> list(const std::string& peer) const;
    std::vector<TransferJob> list() const;

    std::optional<TransferJob> find(const network::JobId& id) const;
    std::optional<TransferJob> find_by_key(const std::string& key, Direction direction) const;

    bool has_queued(const std::string& peer, Direction direction = Direction::OUTGOING) const;
    std::optional<TransferJob> active_job(const std::string& peer, Direction direction) const;

    // Forgets a finished job. Outgoing FAILED jobs are kept for retry.
    core::Result remove(const network::JobId& id);

    std::size_t size() const;

private:
    using Lock = std::unique_lock<std::mutex>;

    struct Entry {
        TransferJob job;
        std::uint64_t order;
    };

    core::Result transition(Lock& lock, const network::JobId& id, JobStatus next, bool front = false);
    void push_queued(Entry& entry, bool front);
    void remove_queued(const TransferJob& job);
    void notify(Lock& lock, const std::string& peer);

    mutable std::mutex mutex_;
    std::map<network::JobId, Entry> jobs_;
    std::map<std::string, std::deque<network::JobId>> queued_;
    std::uint64_t next_order_ = 0;
    std::vector<RunnableCallback> callbacks_;
};

}
