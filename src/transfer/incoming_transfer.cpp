#include "peerlink/transfer/incoming_transfer.hpp"
#include "peerlink/crypto/hash.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <algorithm>

namespace peerlink::transfer {

using network::ReasonCode;

IncomingTransfer::IncomingTransfer(const network::JobId& id, std::string peer, network::FrameSink& sink,
                                   const ProtocolSettings& settings, IncomingContext context)
    : TransferProtocol(TransferJob{}, sink, settings)
    , context_(context)
    , activated_(false)
    , finished_(false) {
    job_.id = id;
    job_.key = network::to_hex(id);
    job_.direction = Direction::INCOMING;
    job_.peer = std::move(peer);
}

IncomingTransfer::~IncomingTransfer() {
    if (!finished_ && !job_.path.empty()) {
        context_.store.release(job_.path);
    }
}

bool IncomingTransfer::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_;
}

void IncomingTransfer::on_frame(const network::Frame& frame) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (finished_) {
        LOG_DEBUG("Job {} already finished, dropping {}", job_.id_hex(), network::to_string(frame.type()));
        return;
    }

    switch (frame.type()) {
        case network::MessageType::FILE_START:
            handle_start(frame.decode<network::FileStartMessage>());
            break;
        case network::MessageType::CHUNK:
            handle_chunk(frame.decode<network::ChunkMessage>());
            break;
        case network::MessageType::FILE_COMPLETE:
            handle_complete(frame.decode<network::FileCompleteMessage>());
            break;
        case network::MessageType::FILE_ABORT:
            handle_abort(frame.decode<network::FileAbortMessage>().reason);
            break;
        default:
            LOG_DEBUG("Unexpected {} for incoming job {}", network::to_string(frame.type()), job_.id_hex());
            break;
    }

    lock.unlock();
    flush_finish();
}

void IncomingTransfer::on_connection_lost() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }

    partial_.close();
    if (activated_) {
        if (auto requeued = context_.queue.requeue_interrupted(job_.id); !requeued) {
            LOG_WARN("Cannot requeue job {}: {}", job_.id_hex(), requeued.message);
        }
        LOG_INFO("Connection lost during job {}, {} bytes kept for resume",
                 job_.id_hex(), record_.confirmed_bytes());
    }
    finish(JobStatus::QUEUED, ReasonCode::NONE);

    lock.unlock();
    flush_finish();
}

void IncomingTransfer::cancel() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (finished_) {
        return;
    }

    set_state(ProtocolState::ABORTED);
    if (!send(network::FileAbortMessage{ReasonCode::CANCELLED})) {
        LOG_DEBUG("Sender of job {} not reachable for the cancel notice", job_.id_hex());
    }
    partial_.close();
    discard();
    if (activated_) {
        if (auto cancelled = context_.queue.cancel(job_.id); !cancelled) {
            LOG_WARN("Cannot cancel job {}: {}", job_.id_hex(), cancelled.message);
        }
        archive(storage::HistoryStatus::CANCELLED, ReasonCode::CANCELLED, "");
    }
    finish(JobStatus::CANCELLED, ReasonCode::CANCELLED);

    lock.unlock();
    flush_finish();
}

void IncomingTransfer::handle_start(const network::FileStartMessage& offer) {
    if (activated_) {
        // Repeated offer: answer with where we are.
        if (!reply_start()) {
            LOG_DEBUG("Could not answer repeated offer for job {}", job_.id_hex());
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        job_.filename = storage::FileStore::sanitize_filename(offer.filename);
        job_.total_size = offer.total_size;
        job_.chunk_size = offer.chunk_size;
        job_.created_at = std::chrono::system_clock::now();
    }
    codec_ = ChunkCodec(offer.chunk_size, offer.checksum_algo);

    if (auto done = context_.history.find(job_.id);
        done && done->status == storage::HistoryStatus::COMPLETED && done->direction == Direction::INCOMING) {
        auto digest = crypto::hash_utils::from_hex(done->checksum);
        if (digest) {
            LOG_INFO("Job {} ({}) was already received, confirming", job_.id_hex(), done->filename);
            if (!send(network::FileCompleteMessage{*digest})) {
                LOG_DEBUG("Could not confirm job {}", job_.id_hex());
            }
            set_state(ProtocolState::DONE);
            finish(JobStatus::QUEUED, ReasonCode::NONE);
            return;
        }
    }

    auto existing = context_.ledger.load(job_.id);
    bool resumable = existing && existing->direction == Direction::INCOMING &&
                     existing->total_size == offer.total_size && existing->chunk_size == offer.chunk_size &&
                     std::filesystem::exists(storage::FileStore::partial_path(existing->path));

    std::filesystem::path destination;
    if (resumable) {
        destination = existing->path;
        context_.store.reserve(destination);
        record_ = *existing;
    } else {
        if (existing) {
            LOG_INFO("Stale resume record for job {} dropped", job_.id_hex());
            storage::FileStore::discard(existing->path);
            if (auto removed = context_.ledger.remove(job_.id); !removed) {
                LOG_WARN("Cannot drop resume record of job {}: {}", job_.id_hex(), removed.message);
            }
        }
        destination = context_.store.reserve_destination(offer.filename);

        record_ = storage::ResumeRecord{};
        record_.job_id = job_.id;
        record_.job_key = job_.key;
        record_.direction = Direction::INCOMING;
        record_.peer = job_.peer;
        record_.filename = destination.filename().string();
        record_.path = destination;
        record_.total_size = offer.total_size;
        record_.chunk_size = offer.chunk_size;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        job_.path = destination;
        job_.filename = destination.filename().string();
        job_.bytes_confirmed = record_.confirmed_bytes();
        job_.resumed = resumable && (record_.next_sequence > 0 || !record_.out_of_order.empty());
    }

    auto activated = context_.queue.activate(job_);
    if (!activated) {
        LOG_WARN("Rejecting job {} from {}: {}", job_.id_hex(), job_.peer, activated.message);
        reject(ReasonCode::REJECTED);
        return;
    }
    activated_ = true;

    auto opened = open_partial(offer, resumable);
    if (!opened) {
        LOG_ERROR("Cannot receive {} into {}: {}", offer.filename, destination.string(), opened.message);
        return;
    }

    if (!reply_start()) {
        LOG_DEBUG("Offer answer for job {} not sent, waiting for reconnect", job_.id_hex());
        return;
    }

    set_state(ProtocolState::STREAMING);
    if (job_.resumed) {
        LOG_INFO("Resuming {} from {} at chunk {} ({} of {})", job_.filename, job_.peer, record_.next_sequence,
                 core::utils::StringUtils::format_bytes(record_.confirmed_bytes()),
                 core::utils::StringUtils::format_bytes(record_.total_size));
    } else {
        LOG_INFO("Receiving {} ({}) from {}", job_.filename,
                 core::utils::StringUtils::format_bytes(record_.total_size), job_.peer);
    }
    report_progress(record_.confirmed_bytes());
}

core::Result IncomingTransfer::open_partial(const network::FileStartMessage& offer, bool resume) {
    auto part = storage::FileStore::partial_path(job_.path);

    if (resume) {
        auto opened = partial_.open(part, false);
        if (!opened) {
            fail(storage::reason_for_errno(partial_.last_error()), true);
        }
        return opened;
    }

    if (!context_.store.has_space_for(offer.total_size)) {
        fail(ReasonCode::DISK_FULL, true);
        return core::Result(core::ErrorCode::FILE_WRITE_ERROR, "Not enough space in " +
                            context_.store.save_directory().string());
    }

    auto opened = partial_.open(part, true);
    if (!opened) {
        fail(storage::reason_for_errno(partial_.last_error()), true);
        return opened;
    }

    record_.updated_at = std::chrono::system_clock::now();
    auto saved = context_.ledger.save(record_);
    if (!saved) {
        fail(ReasonCode::WRITE_FAILED, true);
        return saved;
    }
    return core::Result();
}

core::Result IncomingTransfer::reply_start() {
    network::FileStartMessage reply;
    reply.filename = job_.filename;
    reply.total_size = record_.total_size;
    reply.chunk_size = record_.chunk_size;
    reply.checksum_algo = codec_.algorithm();
    reply.resume_from_seq = record_.next_sequence;
    reply.confirmed_beyond.assign(record_.out_of_order.begin(), record_.out_of_order.end());
    return send(reply);
}

void IncomingTransfer::handle_chunk(network::ChunkMessage message) {
    if (!activated_ || state() != ProtocolState::STREAMING) {
        LOG_DEBUG("Chunk {} for job {} outside streaming", message.sequence, job_.id_hex());
        return;
    }

    if (message.sequence >= record_.total_chunks()) {
        throw network::ProtocolError("Chunk " + std::to_string(message.sequence) + " beyond the end of job " +
                                     job_.id_hex());
    }

    auto chunk = ChunkCodec::from_message(job_.id, std::move(message));
    std::uint64_t sequence = chunk.sequence;

    if (chunk.payload.size() != codec_.chunk_length(record_.total_size, sequence) || !codec_.verify(chunk)) {
        LOG_WARN("Chunk {} of job {} failed verification", sequence, job_.id_hex());
        if (!send(network::ChunkAckMessage{sequence, network::AckStatus::CHECKSUM_MISMATCH})) {
            LOG_DEBUG("Could not report bad chunk {} of job {}", sequence, job_.id_hex());
        }
        return;
    }

    if (!record_.is_confirmed(sequence)) {
        auto written = partial_.write_at(codec_.chunk_offset(sequence), chunk.payload, settings_.durable_writes);
        if (!written) {
            LOG_ERROR("Writing chunk {} of job {} failed: {}", sequence, job_.id_hex(), written.message);
            fail(storage::reason_for_errno(partial_.last_error()), true);
            return;
        }

        record_.confirm(sequence);
        record_.updated_at = std::chrono::system_clock::now();
        auto saved = context_.ledger.save(record_);
        if (!saved) {
            LOG_ERROR("Cannot record chunk {} of job {}: {}", sequence, job_.id_hex(), saved.message);
            fail(ReasonCode::WRITE_FAILED, true);
            return;
        }
    } else {
        LOG_TRACE("Duplicate chunk {} of job {}", sequence, job_.id_hex());
    }

    if (!send(network::ChunkAckMessage{sequence, network::AckStatus::OK})) {
        LOG_DEBUG("Ack for chunk {} of job {} not sent", sequence, job_.id_hex());
    }

    auto confirmed = record_.confirmed_bytes();
    if (auto updated = context_.queue.update_progress(job_.id, confirmed); !updated) {
        LOG_DEBUG("Progress of job {} not recorded: {}", job_.id_hex(), updated.message);
    }
    report_progress(confirmed);
}

void IncomingTransfer::handle_complete(const network::FileCompleteMessage& message) {
    if (!activated_) {
        LOG_DEBUG("FILE_COMPLETE for job {} before its offer", job_.id_hex());
        return;
    }

    set_state(ProtocolState::COMPLETING);
    if (!record_.is_complete()) {
        LOG_ERROR("Sender finished job {} with {} of {} chunks confirmed",
                  job_.id_hex(), record_.next_sequence, record_.total_chunks());
        fail(ReasonCode::PROTOCOL_ERROR, true);
        return;
    }

    partial_.close();
    auto part = storage::FileStore::partial_path(job_.path);

    std::error_code ec;
    auto on_disk = std::filesystem::file_size(part, ec);
    crypto::Blake2bHash digest{};
    bool matches = false;
    if (!ec && on_disk == record_.total_size) {
        auto hashed = crypto::Blake2bHasher::hash_file(part, digest);
        if (!hashed) {
            LOG_ERROR("Cannot hash {}: {}", part.string(), hashed.message);
            fail(ReasonCode::READ_FAILED, true);
            return;
        }
        matches = std::equal(digest.begin(), digest.end(),
                             message.whole_file_checksum.begin(), message.whole_file_checksum.end());
    }

    if (!matches) {
        LOG_ERROR("Whole-file checksum of job {} does not match, discarding {}", job_.id_hex(), part.string());
        set_state(ProtocolState::ABORTED);
        if (!send(network::FileAbortMessage{ReasonCode::CHECKSUM_MISMATCH})) {
            LOG_DEBUG("Could not report mismatch of job {}", job_.id_hex());
        }
        discard();
        if (auto failed = context_.queue.mark_failed(job_.id, ReasonCode::CHECKSUM_MISMATCH); !failed) {
            LOG_WARN("Cannot fail job {}: {}", job_.id_hex(), failed.message);
        }
        archive(storage::HistoryStatus::FAILED, ReasonCode::CHECKSUM_MISMATCH, "");
        finish(JobStatus::FAILED, ReasonCode::CHECKSUM_MISMATCH);
        return;
    }

    auto destination = job_.path;
    auto finalized = context_.store.finalize(destination);
    if (!finalized) {
        LOG_ERROR("Job {}: {}", job_.id_hex(), finalized.message);
        fail(ReasonCode::WRITE_FAILED, true);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        job_.path = destination;
        job_.filename = destination.filename().string();
        job_.bytes_confirmed = job_.total_size;
    }

    if (auto removed = context_.ledger.remove(job_.id); !removed) {
        LOG_WARN("Cannot drop resume record of job {}: {}", job_.id_hex(), removed.message);
    }
    archive(storage::HistoryStatus::COMPLETED, ReasonCode::NONE, crypto::hash_utils::to_hex(digest));

    if (!send(network::FileCompleteMessage{message.whole_file_checksum})) {
        LOG_DEBUG("Completion of job {} not confirmed to the sender", job_.id_hex());
    }
    if (auto completed = context_.queue.mark_completed(job_.id); !completed) {
        LOG_WARN("Cannot complete job {}: {}", job_.id_hex(), completed.message);
    }

    set_state(ProtocolState::DONE);
    LOG_INFO("Received {} from {} into {}", job_.filename, job_.peer, destination.string());
    finish(JobStatus::COMPLETED, ReasonCode::NONE);
}

void IncomingTransfer::handle_abort(ReasonCode reason) {
    set_state(ProtocolState::ABORTED);
    partial_.close();

    if (!activated_) {
        finish(JobStatus::QUEUED, reason);
        return;
    }

    LOG_INFO("Sender aborted job {}: {}", job_.id_hex(), network::to_string(reason));

    if (reason == ReasonCode::CANCELLED) {
        discard();
        if (auto cancelled = context_.queue.cancel(job_.id); !cancelled) {
            LOG_WARN("Cannot cancel job {}: {}", job_.id_hex(), cancelled.message);
        }
        archive(storage::HistoryStatus::CANCELLED, reason, "");
        finish(JobStatus::CANCELLED, reason);
        return;
    }

    if (reason == ReasonCode::PAUSED) {
        if (auto paused = context_.queue.pause(job_.id); !paused) {
            LOG_WARN("Cannot pause job {}: {}", job_.id_hex(), paused.message);
        }
        finish(JobStatus::PAUSED, reason);
        return;
    }

    // Partial data stays for a retry.
    if (auto failed = context_.queue.mark_failed(job_.id, reason); !failed) {
        LOG_WARN("Cannot fail job {}: {}", job_.id_hex(), failed.message);
    }
    archive(storage::HistoryStatus::FAILED, reason, "");
    finish(JobStatus::FAILED, reason);
}

void IncomingTransfer::reject(ReasonCode reason) {
    set_state(ProtocolState::ABORTED);
    context_.store.release(job_.path);
    if (!send(network::FileAbortMessage{reason})) {
        LOG_DEBUG("Could not reject job {}", job_.id_hex());
    }
    finish(JobStatus::QUEUED, reason);
}

void IncomingTransfer::fail(ReasonCode reason, bool notify_peer) {
    set_failure(reason);
    set_state(ProtocolState::ABORTED);
    partial_.close();
    if (notify_peer && !send(network::FileAbortMessage{reason})) {
        LOG_DEBUG("Could not report failure of job {}", job_.id_hex());
    }
    if (auto failed = context_.queue.mark_failed(job_.id, reason); !failed) {
        LOG_WARN("Cannot fail job {}: {}", job_.id_hex(), failed.message);
    }
    archive(storage::HistoryStatus::FAILED, reason, "");
    LOG_ERROR("Incoming job {} failed: {}", job_.id_hex(), network::to_string(reason));
    finish(JobStatus::FAILED, reason);
}

void IncomingTransfer::discard() {
    if (!job_.path.empty()) {
        storage::FileStore::discard(job_.path);
    }
    if (auto removed = context_.ledger.remove(job_.id); !removed) {
        LOG_WARN("Cannot drop resume record of job {}: {}", job_.id_hex(), removed.message);
    }
}

void IncomingTransfer::archive(storage::HistoryStatus status, ReasonCode reason, const std::string& checksum) {
    storage::HistoryEntry entry;
    entry.job_id = job_.id;
    entry.direction = Direction::INCOMING;
    entry.peer = job_.peer;
    entry.filename = job_.filename;
    entry.size = job_.total_size;
    entry.status = status;
    entry.reason = reason;
    entry.checksum = checksum;
    entry.finished_at = std::chrono::system_clock::now();

    if (auto archived = context_.history.archive(entry); !archived) {
        LOG_WARN("Cannot archive job {}: {}", job_.id_hex(), archived.message);
    }
}

void IncomingTransfer::finish(JobStatus status, ReasonCode reason) {
    finished_ = true;
    set_state(ProtocolState::DONE);
    if (!job_.path.empty()) {
        context_.store.release(job_.path);
    }

    TransferJob snapshot = job();
    snapshot.status = status;
    snapshot.failure_reason = reason;
    pending_finish_ = PendingFinish{std::move(snapshot), status, reason};
}

void IncomingTransfer::flush_finish() {
    std::optional<PendingFinish> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_finish_);
    }

    if (pending && finish_callback_) {
        finish_callback_(pending->job, pending->status, pending->reason);
    }
}

}
