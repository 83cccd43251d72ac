#include "peerlink/transfer/outgoing_transfer.hpp"
#include "peerlink/crypto/hash.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <algorithm>

namespace peerlink::transfer {

const char* to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::COMPLETED:   return "COMPLETED";
        case TransferOutcome::FAILED:      return "FAILED";
        case TransferOutcome::CANCELLED:   return "CANCELLED";
        case TransferOutcome::PAUSED:      return "PAUSED";
        case TransferOutcome::INTERRUPTED: return "INTERRUPTED";
    }
    return "UNKNOWN";
}

OutgoingTransfer::OutgoingTransfer(TransferJob job, network::FrameSink& sink, const ProtocolSettings& settings)
    : TransferProtocol(std::move(job), sink, settings)
    , connection_lost_(false)
    , in_flight_bytes_(0)
    , chunks_sent_(0)
    , retransmissions_(0) {
    job_.chunk_size = codec_.chunk_size();
    progress_.job_id = job_.id;
    progress_.job_key = job_.key;
    progress_.direction = Direction::OUTGOING;
    progress_.peer = job_.peer;
    progress_.filename = job_.filename;
    progress_.path = job_.path;
    progress_.total_size = job_.total_size;
    progress_.chunk_size = job_.chunk_size;
}

void OutgoingTransfer::request_stop(network::ReasonCode reason) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        if (!stop_request_) {
            stop_request_ = reason;
        }
    }
    inbox_cv_.notify_all();
}

void OutgoingTransfer::on_frame(const network::Frame& frame) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(frame);
    }
    inbox_cv_.notify_all();
}

void OutgoingTransfer::on_connection_lost() {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        connection_lost_ = true;
    }
    inbox_cv_.notify_all();
}

storage::ResumeRecord OutgoingTransfer::progress() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return progress_;
}

std::string OutgoingTransfer::whole_file_checksum() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return whole_file_checksum_;
}

std::uint64_t OutgoingTransfer::chunks_sent() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return chunks_sent_;
}

std::uint64_t OutgoingTransfer::retransmissions() const {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    return retransmissions_;
}

OutgoingTransfer::Wake OutgoingTransfer::wait(Clock::time_point deadline, network::Frame& frame) {
    std::unique_lock<std::mutex> lock(inbox_mutex_);
    bool woken = inbox_cv_.wait_until(lock, deadline, [this] {
        return stop_request_.has_value() || connection_lost_ || !inbox_.empty();
    });

    if (stop_request_) {
        return Wake::STOPPED;
    }
    if (connection_lost_) {
        return Wake::LOST;
    }
    if (!woken) {
        return Wake::TIMEOUT;
    }

    frame = std::move(inbox_.front());
    inbox_.pop_front();
    return Wake::FRAME;
}

TransferOutcome OutgoingTransfer::run() {
    set_state(ProtocolState::INIT);

    std::error_code ec;
    auto current_size = std::filesystem::file_size(job_.path, ec);
    if (ec || current_size != job_.total_size) {
        LOG_ERROR("Source {} is gone or changed size since job {} was queued", job_.path.string(), job_.id_hex());
        return fail(network::ReasonCode::READ_FAILED, true);
    }

    ChunkReader reader(codec_, job_.total_size);
    auto opened = reader.open(job_.path);
    if (!opened) {
        LOG_ERROR("Cannot read {}: {}", job_.path.string(), opened.message);
        return fail(network::ReasonCode::READ_FAILED, true);
    }

    try {
        std::deque<std::uint64_t> pending;
        if (auto outcome = negotiate(pending)) {
            return *outcome;
        }

        if (auto outcome = stream(reader, pending)) {
            return *outcome;
        }

        return complete();
    } catch (const network::ProtocolError& e) {
        LOG_ERROR("Undecodable reply for job {}: {}", job_.id_hex(), e.what());
        return fail(network::ReasonCode::PROTOCOL_ERROR, true);
    }
}

std::optional<TransferOutcome> OutgoingTransfer::negotiate(std::deque<std::uint64_t>& pending) {
    network::FileStartMessage offer;
    offer.filename = job_.filename;
    offer.total_size = job_.total_size;
    offer.chunk_size = codec_.chunk_size();
    offer.checksum_algo = codec_.algorithm();
    offer.resume_from_seq = 0;

    if (!send(offer)) {
        return interrupted();
    }
    LOG_INFO("Offered {} ({} bytes) to {} as job {}", job_.filename, job_.total_size, job_.peer, job_.id_hex());

    auto deadline = Clock::now() + settings_.start_timeout;
    while (true) {
        network::Frame frame;
        switch (wait(deadline, frame)) {
            case Wake::STOPPED:
                return stopped(*stop_request_);
            case Wake::LOST:
                return interrupted();
            case Wake::TIMEOUT:
                LOG_WARN("Peer {} did not answer FILE_START for job {}", job_.peer, job_.id_hex());
                return fail(network::ReasonCode::TIMEOUT, true);
            case Wake::FRAME:
                break;
        }

        switch (frame.type()) {
            case network::MessageType::FILE_START: {
                auto reply = frame.decode<network::FileStartMessage>();
                if (reply.total_size != job_.total_size || reply.chunk_size != codec_.chunk_size()) {
                    LOG_ERROR("Peer answered job {} with a different layout", job_.id_hex());
                    return fail(network::ReasonCode::PROTOCOL_ERROR, true);
                }

                std::uint64_t total_chunks = codec_.chunk_count(job_.total_size);
                std::uint64_t resume_from = std::min(reply.resume_from_seq, total_chunks);

                {
                    std::lock_guard<std::mutex> lock(progress_mutex_);
                    progress_.next_sequence = 0;
                    progress_.out_of_order.clear();
                    for (std::uint64_t seq = 0; seq < resume_from; ++seq) {
                        progress_.confirm(seq);
                    }
                    for (auto seq : reply.confirmed_beyond) {
                        progress_.confirm(seq);
                    }
                    for (std::uint64_t seq = resume_from; seq < total_chunks; ++seq) {
                        if (!progress_.is_confirmed(seq)) {
                            pending.push_back(seq);
                        }
                    }
                }

                if (resume_from > 0 || !reply.confirmed_beyond.empty()) {
                    {
                        std::lock_guard<std::mutex> lock(state_mutex_);
                        job_.resumed = true;
                    }
                    LOG_INFO("Resuming job {} at chunk {}, {} chunks left",
                             job_.id_hex(), resume_from, pending.size());
                }
                report_progress(progress().confirmed_bytes());
                return std::nullopt;
            }

            case network::MessageType::FILE_COMPLETE: {
                // Receiver finished this job in an earlier session.
                auto done = frame.decode<network::FileCompleteMessage>();
                crypto::Blake2bHash local;
                if (!crypto::Blake2bHasher::hash_file(job_.path, local)) {
                    return fail(network::ReasonCode::READ_FAILED, false);
                }
                if (!std::equal(local.begin(), local.end(),
                                done.whole_file_checksum.begin(), done.whole_file_checksum.end())) {
                    return fail(network::ReasonCode::CHECKSUM_MISMATCH, false);
                }
                LOG_INFO("Peer {} already has job {}", job_.peer, job_.id_hex());
                {
                    std::lock_guard<std::mutex> lock(progress_mutex_);
                    whole_file_checksum_ = crypto::hash_utils::to_hex(local);
                }
                report_progress(job_.total_size);
                set_state(ProtocolState::DONE);
                return TransferOutcome::COMPLETED;
            }

            case network::MessageType::FILE_ABORT:
                return aborted_by_peer(frame.decode<network::FileAbortMessage>().reason);

            default:
                LOG_DEBUG("Ignoring {} for job {} while negotiating", network::to_string(frame.type()), job_.id_hex());
                break;
        }
    }
}

std::optional<TransferOutcome> OutgoingTransfer::stream(ChunkReader& reader, std::deque<std::uint64_t>& pending) {
    set_state(ProtocolState::STREAMING);

    while (!pending.empty() || !in_flight_.empty()) {
        while (!pending.empty()) {
            std::uint32_t length = codec_.chunk_length(job_.total_size, pending.front());
            if (in_flight_bytes_ > 0 && in_flight_bytes_ + length > settings_.window_bytes) {
                break;
            }

            std::uint64_t sequence = pending.front();
            pending.pop_front();

            TransferOutcome outcome;
            if (!send_chunk(reader, sequence, outcome)) {
                return outcome;
            }
            in_flight_[sequence] = InFlight{length, Clock::now(), 0};
            in_flight_bytes_ += length;
        }

        auto oldest = std::min_element(in_flight_.begin(), in_flight_.end(),
            [](const auto& a, const auto& b) { return a.second.sent_at < b.second.sent_at; });
        auto deadline = oldest->second.sent_at + settings_.ack_timeout;

        network::Frame frame;
        switch (wait(deadline, frame)) {
            case Wake::STOPPED:
                return stopped(*stop_request_);
            case Wake::LOST:
                return interrupted();
            case Wake::TIMEOUT: {
                auto now = Clock::now();
                std::vector<std::uint64_t> expired;
                for (const auto& [sequence, entry] : in_flight_) {
                    if (now - entry.sent_at >= settings_.ack_timeout) {
                        expired.push_back(sequence);
                    }
                }
                for (auto sequence : expired) {
                    if (auto outcome = retransmit(reader, sequence, "ack timeout")) {
                        return outcome;
                    }
                }
                continue;
            }
            case Wake::FRAME:
                break;
        }

        switch (frame.type()) {
            case network::MessageType::CHUNK_ACK: {
                auto ack = frame.decode<network::ChunkAckMessage>();
                auto it = in_flight_.find(ack.sequence);
                if (it == in_flight_.end()) {
                    LOG_TRACE("Stale ack for chunk {} of job {}", ack.sequence, job_.id_hex());
                    break;
                }

                if (ack.status == network::AckStatus::CHECKSUM_MISMATCH) {
                    if (auto outcome = retransmit(reader, ack.sequence, "checksum mismatch")) {
                        return outcome;
                    }
                    break;
                }

                in_flight_bytes_ -= it->second.length;
                in_flight_.erase(it);

                std::uint64_t confirmed;
                {
                    std::lock_guard<std::mutex> lock(progress_mutex_);
                    progress_.confirm(ack.sequence);
                    confirmed = progress_.confirmed_bytes();
                }
                report_progress(confirmed);
                break;
            }

            case network::MessageType::FILE_ABORT:
                return aborted_by_peer(frame.decode<network::FileAbortMessage>().reason);

            default:
                LOG_DEBUG("Ignoring {} for job {} while streaming", network::to_string(frame.type()), job_.id_hex());
                break;
        }
    }

    return std::nullopt;
}

TransferOutcome OutgoingTransfer::complete() {
    set_state(ProtocolState::COMPLETING);

    crypto::Blake2bHash digest;
    auto hashed = crypto::Blake2bHasher::hash_file(job_.path, digest);
    if (!hashed) {
        LOG_ERROR("Cannot hash {}: {}", job_.path.string(), hashed.message);
        return fail(network::ReasonCode::READ_FAILED, true);
    }

    network::FileCompleteMessage done;
    done.whole_file_checksum.assign(digest.begin(), digest.end());
    if (!send(done)) {
        return interrupted();
    }

    auto deadline = Clock::now() + settings_.complete_timeout;
    while (true) {
        network::Frame frame;
        switch (wait(deadline, frame)) {
            case Wake::STOPPED:
                return stopped(*stop_request_);
            case Wake::LOST:
                return interrupted();
            case Wake::TIMEOUT:
                LOG_WARN("Peer {} did not confirm completion of job {}", job_.peer, job_.id_hex());
                return fail(network::ReasonCode::TIMEOUT, true);
            case Wake::FRAME:
                break;
        }

        if (frame.type() == network::MessageType::FILE_COMPLETE) {
            auto confirmed = frame.decode<network::FileCompleteMessage>();
            if (confirmed.whole_file_checksum != done.whole_file_checksum) {
                return fail(network::ReasonCode::CHECKSUM_MISMATCH, false);
            }
            {
                std::lock_guard<std::mutex> lock(progress_mutex_);
                whole_file_checksum_ = crypto::hash_utils::to_hex(digest);
            }
            set_state(ProtocolState::DONE);
            LOG_INFO("Job {} delivered to {} ({})", job_.id_hex(), job_.peer,
                     core::utils::StringUtils::format_bytes(job_.total_size));
            return TransferOutcome::COMPLETED;
        }

        if (frame.type() == network::MessageType::FILE_ABORT) {
            return aborted_by_peer(frame.decode<network::FileAbortMessage>().reason);
        }
    }
}

bool OutgoingTransfer::send_chunk(ChunkReader& reader, std::uint64_t sequence, TransferOutcome& outcome) {
    Chunk chunk;
    auto read = reader.read(job_.id, sequence, chunk);
    if (!read) {
        LOG_ERROR("Reading chunk {} of {} failed: {}", sequence, job_.path.string(), read.message);
        outcome = fail(network::ReasonCode::READ_FAILED, true);
        return false;
    }

    if (!sink_.send_frame(network::Frame::make(job_.id, ChunkCodec::to_message(chunk)))) {
        outcome = interrupted();
        return false;
    }

    std::lock_guard<std::mutex> lock(progress_mutex_);
    ++chunks_sent_;
    return true;
}

std::optional<TransferOutcome> OutgoingTransfer::retransmit(ChunkReader& reader, std::uint64_t sequence, const char* why) {
    auto& entry = in_flight_.at(sequence);
    if (entry.retransmissions >= settings_.max_chunk_retries) {
        LOG_ERROR("Chunk {} of job {} failed {} retransmissions ({})",
                  sequence, job_.id_hex(), entry.retransmissions, why);
        return fail(network::ReasonCode::RETRIES_EXHAUSTED, true);
    }

    set_state(ProtocolState::RETRYING);
    ++entry.retransmissions;
    LOG_WARN("Retransmitting chunk {} of job {} ({}, attempt {})", sequence, job_.id_hex(), why, entry.retransmissions);

    TransferOutcome outcome;
    if (!send_chunk(reader, sequence, outcome)) {
        return outcome;
    }
    entry.sent_at = Clock::now();
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        ++retransmissions_;
    }
    set_state(ProtocolState::STREAMING);
    return std::nullopt;
}

TransferOutcome OutgoingTransfer::fail(network::ReasonCode reason, bool notify_peer) {
    set_failure(reason);
    set_state(ProtocolState::ABORTED);
    if (notify_peer && !send(network::FileAbortMessage{reason})) {
        LOG_DEBUG("Could not tell {} about the failure of job {}", job_.peer, job_.id_hex());
    }
    set_state(ProtocolState::DONE);
    LOG_ERROR("Job {} to {} failed: {}", job_.id_hex(), job_.peer, network::to_string(reason));
    return TransferOutcome::FAILED;
}

TransferOutcome OutgoingTransfer::stopped(network::ReasonCode reason) {
    set_failure(reason);
    set_state(ProtocolState::ABORTED);
    if (!send(network::FileAbortMessage{reason})) {
        LOG_DEBUG("Peer {} not reachable, job {} stops locally", job_.peer, job_.id_hex());
    }
    set_state(ProtocolState::DONE);
    LOG_INFO("Job {} stopped: {}", job_.id_hex(), network::to_string(reason));
    return reason == network::ReasonCode::PAUSED ? TransferOutcome::PAUSED : TransferOutcome::CANCELLED;
}

TransferOutcome OutgoingTransfer::aborted_by_peer(network::ReasonCode reason) {
    set_failure(reason);
    set_state(ProtocolState::ABORTED);
    set_state(ProtocolState::DONE);
    LOG_WARN("Peer {} aborted job {}: {}", job_.peer, job_.id_hex(), network::to_string(reason));
    return reason == network::ReasonCode::CANCELLED ? TransferOutcome::CANCELLED : TransferOutcome::FAILED;
}

TransferOutcome OutgoingTransfer::interrupted() {
    set_state(ProtocolState::ABORTED);
    set_state(ProtocolState::DONE);
    LOG_INFO("Connection to {} lost during job {}", job_.peer, job_.id_hex());
    return TransferOutcome::INTERRUPTED;
}

}
