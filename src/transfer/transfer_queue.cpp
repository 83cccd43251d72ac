#include "peerlink/transfer/transfer_queue.hpp"
#include "peerlink/core/logger.hpp"
#include <algorithm>

namespace peerlink::transfer {

using core::ErrorCode;
using core::Result;

namespace {
    bool is_live(JobStatus status) {
        return status == JobStatus::QUEUED || status == JobStatus::ACTIVE || status == JobStatus::PAUSED;
    }
}

void TransferQueue::on_runnable(RunnableCallback callback) {
    Lock lock(mutex_);
    callbacks_.push_back(std::move(callback));
}

Result TransferQueue::enqueue(TransferJob job) {
    Lock lock(mutex_);

    for (const auto& [id, entry] : jobs_) {
        if (!is_live(entry.job.status)) {
            continue;
        }
        if (id == job.id || (entry.job.key == job.key && entry.job.direction == job.direction)) {
            return Result(ErrorCode::DUPLICATE_JOB,
                          job.filename + " is already " + to_string(entry.job.status) + " for " + entry.job.peer);
        }
    }

    job.status = JobStatus::QUEUED;
    if (job.created_at == std::chrono::system_clock::time_point{}) {
        job.created_at = std::chrono::system_clock::now();
    }

    auto peer = job.peer;
    auto id = job.id;
    LOG_DEBUG("Queued job {} ({}) for '{}'", job.id_hex(), job.filename, peer);

    auto& entry = jobs_[id];
    entry = Entry{std::move(job), next_order_++};
    push_queued(entry, entry.job.resumed);

    notify(lock, peer);
    return Result();
}

std::optional<TransferJob> TransferQueue::dequeue_next(const std::string& peer, Direction direction) {
    Lock lock(mutex_);

    for (const auto& [_, entry] : jobs_) {
        if (entry.job.peer == peer && entry.job.direction == direction && entry.job.status == JobStatus::ACTIVE) {
            return std::nullopt;
        }
    }

    auto queue_it = queued_.find(peer);
    if (queue_it == queued_.end()) {
        return std::nullopt;
    }

    auto& order = queue_it->second;
    for (auto it = order.begin(); it != order.end(); ++it) {
        auto& job = jobs_.at(*it).job;
        if (job.direction != direction) {
            continue;
        }

        order.erase(it);
        job.status = JobStatus::ACTIVE;
        LOG_DEBUG("Job {} ({}) is now active", job.id_hex(), job.filename);
        return job;
    }

    return std::nullopt;
}

Result TransferQueue::activate(TransferJob job) {
    Lock lock(mutex_);

    for (const auto& [id, entry] : jobs_) {
        if (id != job.id && entry.job.peer == job.peer && entry.job.direction == job.direction &&
            entry.job.status == JobStatus::ACTIVE) {
            return Result(ErrorCode::INVALID_STATE,
                          "Job " + entry.job.id_hex() + " is already active for " + job.peer);
        }
    }

    auto it = jobs_.find(job.id);
    if (it == jobs_.end()) {
        job.status = JobStatus::ACTIVE;
        if (job.created_at == std::chrono::system_clock::time_point{}) {
            job.created_at = std::chrono::system_clock::now();
        }
        auto id = job.id;
        jobs_[id] = Entry{std::move(job), next_order_++};
        return Result();
    }

    auto& existing = it->second.job;
    if (existing.status == JobStatus::ACTIVE) {
        return Result();
    }
    if (existing.status == JobStatus::PAUSED || existing.status == JobStatus::FAILED) {
        existing.status = JobStatus::QUEUED;
    }
    if (existing.status == JobStatus::QUEUED) {
        remove_queued(existing);
        existing.status = JobStatus::ACTIVE;
        existing.resumed = existing.resumed || job.resumed;
        existing.bytes_confirmed = std::max(existing.bytes_confirmed, job.bytes_confirmed);
        existing.failure_reason = network::ReasonCode::NONE;
        return Result();
    }

    // Completed or cancelled earlier: a new run of the same id.
    job.status = JobStatus::ACTIVE;
    it->second = Entry{std::move(job), next_order_++};
    return Result();
}

Result TransferQueue::pause(const network::JobId& id) {
    Lock lock(mutex_);
    return transition(lock, id, JobStatus::PAUSED);
}

Result TransferQueue::resume(const network::JobId& id) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }
    if (it->second.job.status != JobStatus::PAUSED) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Job is ") + to_string(it->second.job.status) + ", not paused");
    }

    bool has_progress = it->second.job.bytes_confirmed > 0;
    it->second.job.resumed = it->second.job.resumed || has_progress;
    return transition(lock, id, JobStatus::QUEUED, has_progress);
}

Result TransferQueue::cancel(const network::JobId& id) {
    Lock lock(mutex_);
    return transition(lock, id, JobStatus::CANCELLED);
}

Result TransferQueue::retry(const network::JobId& id) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }
    if (it->second.job.status != JobStatus::FAILED) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Job is ") + to_string(it->second.job.status) + ", not failed");
    }

    auto& job = it->second.job;
    job.failure_reason = network::ReasonCode::NONE;
    bool has_progress = job.bytes_confirmed > 0;
    job.resumed = job.resumed || has_progress;
    return transition(lock, id, JobStatus::QUEUED, has_progress);
}

Result TransferQueue::requeue_interrupted(const network::JobId& id) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }
    if (it->second.job.status != JobStatus::ACTIVE) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Job is ") + to_string(it->second.job.status) + ", not active");
    }

    it->second.job.resumed = true;
    return transition(lock, id, JobStatus::QUEUED, true);
}

Result TransferQueue::mark_completed(const network::JobId& id) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end() && can_transition(it->second.job.status, JobStatus::COMPLETED)) {
        it->second.job.bytes_confirmed = it->second.job.total_size;
    }
    return transition(lock, id, JobStatus::COMPLETED);
}

Result TransferQueue::mark_failed(const network::JobId& id, network::ReasonCode reason) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it != jobs_.end() && can_transition(it->second.job.status, JobStatus::FAILED)) {
        it->second.job.failure_reason = reason;
    }
    return transition(lock, id, JobStatus::FAILED);
}

Result TransferQueue::update_progress(const network::JobId& id, std::uint64_t bytes_confirmed) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }

    auto& job = it->second.job;
    if (bytes_confirmed > job.bytes_confirmed) {
        job.bytes_confirmed = std::min(bytes_confirmed, job.total_size);
        job.last_chunk_at = std::chrono::system_clock::now();
    }
    return Result();
}

std::vector<TransferJob> TransferQueue::list(const std::string& peer) const {
    Lock lock(mutex_);
    std::vector<TransferJob> result;

    for (const auto& [_, entry] : jobs_) {
        if (entry.job.peer == peer && entry.job.status == JobStatus::ACTIVE) {
            result.push_back(entry.job);
        }
    }

    auto queue_it = queued_.find(peer);
    if (queue_it != queued_.end()) {
        for (const auto& id : queue_it->second) {
            result.push_back(jobs_.at(id).job);
        }
    }

    std::vector<const Entry*> rest;
    for (const auto& [_, entry] : jobs_) {
        if (entry.job.peer == peer && entry.job.status != JobStatus::ACTIVE &&
            entry.job.status != JobStatus::QUEUED) {
            rest.push_back(&entry);
        }
    }
    std::sort(rest.begin(), rest.end(), [](const Entry* a, const Entry* b) { return a->order < b->order; });
    for (const auto* entry : rest) {
        result.push_back(entry->job);
    }

    return result;
}

std::vector<TransferJob> TransferQueue::list() const {
    Lock lock(mutex_);
    std::vector<const Entry*> entries;
    for (const auto& [_, entry] : jobs_) {
        entries.push_back(&entry);
    }
    std::sort(entries.begin(), entries.end(), [](const Entry* a, const Entry* b) { return a->order < b->order; });

    std::vector<TransferJob> result;
    result.reserve(entries.size());
    for (const auto* entry : entries) {
        result.push_back(entry->job);
    }
    return result;
}

std::optional<TransferJob> TransferQueue::find(const network::JobId& id) const {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second.job;
}

std::optional<TransferJob> TransferQueue::find_by_key(const std::string& key, Direction direction) const {
    Lock lock(mutex_);
    const Entry* newest = nullptr;
    for (const auto& [_, entry] : jobs_) {
        if (entry.job.key == key && entry.job.direction == direction &&
            (!newest || entry.order > newest->order)) {
            newest = &entry;
        }
    }
    if (!newest) {
        return std::nullopt;
    }
    return newest->job;
}

bool TransferQueue::has_queued(const std::string& peer, Direction direction) const {
    Lock lock(mutex_);
    auto queue_it = queued_.find(peer);
    if (queue_it == queued_.end()) {
        return false;
    }
    return std::any_of(queue_it->second.begin(), queue_it->second.end(),
                       [&](const network::JobId& id) { return jobs_.at(id).job.direction == direction; });
}

std::optional<TransferJob> TransferQueue::active_job(const std::string& peer, Direction direction) const {
    Lock lock(mutex_);
    for (const auto& [_, entry] : jobs_) {
        if (entry.job.peer == peer && entry.job.direction == direction && entry.job.status == JobStatus::ACTIVE) {
            return entry.job;
        }
    }
    return std::nullopt;
}

Result TransferQueue::remove(const network::JobId& id) {
    Lock lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }

    const auto& job = it->second.job;
    bool retryable = job.status == JobStatus::FAILED && job.direction == Direction::OUTGOING;
    if (!is_terminal(job.status) || retryable) {
        return Result(ErrorCode::INVALID_STATE,
                      "Job " + network::to_hex(id) + " is " + to_string(job.status) + " and stays queued");
    }
    jobs_.erase(it);
    return Result();
}

std::size_t TransferQueue::size() const {
    Lock lock(mutex_);
    return jobs_.size();
}

Result TransferQueue::transition(Lock& lock, const network::JobId& id, JobStatus next, bool front) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return Result(ErrorCode::NOT_FOUND, "No job " + network::to_hex(id));
    }

    auto& entry = it->second;
    auto current = entry.job.status;
    if (!can_transition(current, next)) {
        return Result(ErrorCode::INVALID_STATE,
                      std::string("Job cannot go from ") + to_string(current) + " to " + to_string(next));
    }

    if (current == JobStatus::QUEUED) {
        remove_queued(entry.job);
    }

    entry.job.status = next;
    LOG_DEBUG("Job {} {} -> {}", entry.job.id_hex(), to_string(current), to_string(next));

    if (next == JobStatus::QUEUED) {
        push_queued(entry, front);
        notify(lock, entry.job.peer);
    }

    return Result();
}

void TransferQueue::push_queued(Entry& entry, bool front) {
    auto& order = queued_[entry.job.peer];
    if (front) {
        order.push_front(entry.job.id);
    } else {
        order.push_back(entry.job.id);
    }
}

void TransferQueue::remove_queued(const TransferJob& job) {
    auto queue_it = queued_.find(job.peer);
    if (queue_it == queued_.end()) {
        return;
    }
    auto& order = queue_it->second;
    order.erase(std::remove(order.begin(), order.end(), job.id), order.end());
}

void TransferQueue::notify(Lock& lock, const std::string& peer) {
    auto callbacks = callbacks_;
    auto peer_name = peer;
    lock.unlock();
    for (auto& callback : callbacks) {
        callback(peer_name);
    }
}

}
