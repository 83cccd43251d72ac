#include "peerlink/engine/engine.hpp"
#include "peerlink/transfer/job_identity.hpp"
#include "peerlink/crypto/hash.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"

namespace peerlink::engine {

using core::ErrorCode;
using core::Result;
using transfer::Direction;
using transfer::JobStatus;
using transfer::TransferJob;
using network::ReasonCode;

Engine::Engine(EngineSettings settings,
               storage::ResumeLedger& ledger,
               transfer::TransferQueue& queue,
               storage::TransferHistory& history)
    : settings_(std::move(settings))
    , ledger_(ledger)
    , queue_(queue)
    , history_(history)
    , store_(settings_.save_directory)
    , running_(false)
    , lifetime_(std::make_shared<char>(0)) {
    std::weak_ptr<char> alive = lifetime_;
    queue_.on_runnable([this, alive](const std::string& peer) {
        if (auto guard = alive.lock()) {
            wake(peer);
        }
    });
}

Engine::~Engine() {
    stop();
    lifetime_.reset();
}

Result Engine::start() {
    {
        Lock lock(mutex_);
        if (running_) {
            return Result(ErrorCode::INVALID_STATE, "Engine already running");
        }
    }

    auto valid = settings_.validate();
    if (!valid) {
        return valid;
    }

    if (!crypto::initialize()) {
        return Result(ErrorCode::INVALID_STATE, "libsodium initialization failed");
    }

    auto prepared = store_.prepare();
    if (!prepared) {
        return prepared;
    }

    listener_ = std::make_unique<network::Listener>(io_context_, settings_.listen_address, settings_.listen_port);
    listener_->set_hello_handler([this](std::shared_ptr<network::Connection> connection,
                                        const network::HelloMessage& hello) {
        handle_hello(std::move(connection), hello);
    });

    auto listening = listener_->start();
    if (!listening) {
        listener_.reset();
        return listening;
    }

    settings_.connection.local_name = settings_.node_name;
    settings_.connection.listen_port = listener_->port();

    io_context_.restart();
    work_guard_.emplace(boost::asio::make_work_guard(io_context_));
    for (unsigned i = 0; i < settings_.io_threads; ++i) {
        io_threads_.emplace_back([this]() {
            io_context_.run();
        });
    }

    events_.start();

    {
        Lock lock(mutex_);
        running_ = true;
    }

    LOG_INFO("Node '{}' listening on {}:{}, saving into {}", settings_.node_name, settings_.listen_address,
             listener_->port(), store_.save_directory().string());
    return Result();
}

void Engine::stop() {
    std::vector<std::shared_ptr<PeerSession>> sessions;
    {
        Lock lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (auto& [_, session] : sessions_) {
            session->stopping = true;
            session->wake.notify_all();
            sessions.push_back(session);
        }
    }

    LOG_INFO("Stopping node '{}'", settings_.node_name);

    if (listener_) {
        listener_->stop();
    }

    for (auto& session : sessions) {
        session->manager->shutdown();

        std::shared_ptr<transfer::OutgoingTransfer> current;
        std::vector<std::shared_ptr<transfer::IncomingTransfer>> incoming;
        {
            Lock lock(mutex_);
            current = session->current;
            for (auto& [_, transfer] : session->incoming) {
                incoming.push_back(transfer);
            }
        }

        // Both are idempotent; the closing socket may deliver them as well.
        if (current) {
            current->on_connection_lost();
        }
        for (auto& transfer : incoming) {
            transfer->on_connection_lost();
        }
    }

    for (auto& session : sessions) {
        if (session->worker.joinable()) {
            session->worker.join();
        }
    }

    work_guard_.reset();
    io_context_.stop();
    for (auto& thread : io_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    io_threads_.clear();

    events_.stop();

    Lock lock(mutex_);
    sessions_.clear();
    progress_.clear();
    listener_.reset();
}

bool Engine::is_running() const {
    Lock lock(mutex_);
    return running_;
}

Result Engine::send(const std::filesystem::path& file_path, const std::string& peer, std::string& job_id) {
    if (!is_running()) {
        return Result(ErrorCode::INVALID_STATE, "Engine is not running");
    }

    transfer::SourceIdentity source;
    auto described = transfer::describe_source(file_path, source);
    if (!described) {
        return described;
    }

    auto target = resolve_peer(peer);
    if (!target) {
        return Result(ErrorCode::NOT_FOUND, "Unknown peer '" + peer + "'");
    }

    auto key = transfer::make_job_key(peer, source);

    if (auto existing = queue_.find_by_key(key, Direction::OUTGOING)) {
        job_id = existing->id_hex();
        if (existing->status == JobStatus::QUEUED || existing->status == JobStatus::ACTIVE) {
            return Result(ErrorCode::DUPLICATE_JOB, source.absolute_path.string() + " is already queued for " + peer);
        }

        if (existing->status == JobStatus::FAILED || existing->status == JobStatus::PAUSED) {
            auto revived = existing->status == JobStatus::FAILED ? queue_.retry(existing->id)
                                                                 : queue_.resume(existing->id);
            if (revived) {
                if (auto session = ensure_session(*target)) {
                    ensure_connected(*session);
                }
            }
            return revived;
        }
    }

    std::uint32_t chunk_size = settings_.protocol.chunk_size;
    std::vector<std::uint8_t> nonce;
    auto record = ledger_.load_by_key(key, Direction::OUTGOING);
    bool resumed = record && record->total_size == source.size && !record->nonce.empty() && record->chunk_size > 0;

    if (resumed) {
        nonce = record->nonce;
        chunk_size = record->chunk_size;
    } else {
        if (record) {
            if (auto removed = ledger_.remove(record->job_id); !removed) {
                LOG_WARN("Cannot drop stale record for {}: {}", source.absolute_path.string(), removed.message);
            }
        }
        nonce = transfer::make_job_nonce();
        record = storage::ResumeRecord{};
    }

    auto id = transfer::make_job_id(key, nonce);

    record->job_id = id;
    record->job_key = key;
    record->direction = Direction::OUTGOING;
    record->peer = peer;
    record->filename = source.absolute_path.filename().string();
    record->path = source.absolute_path;
    record->total_size = source.size;
    record->chunk_size = chunk_size;
    record->nonce = nonce;
    record->updated_at = std::chrono::system_clock::now();

    if (auto saved = ledger_.save(*record); !saved) {
        LOG_WARN("Job for {} will not survive a restart: {}", source.absolute_path.string(), saved.message);
    }

    TransferJob job;
    job.id = id;
    job.key = key;
    job.direction = Direction::OUTGOING;
    job.peer = peer;
    job.path = source.absolute_path;
    job.filename = record->filename;
    job.total_size = source.size;
    job.chunk_size = chunk_size;
    job.bytes_confirmed = resumed ? record->confirmed_bytes() : 0;
    job.resumed = resumed && job.bytes_confirmed > 0;
    job.created_at = std::chrono::system_clock::now();

    auto enqueued = queue_.enqueue(job);
    if (!enqueued) {
        return enqueued;
    }
    job_id = job.id_hex();

    LOG_INFO("Queued {} ({}) for {} as job {}{}", job.filename,
             core::utils::StringUtils::format_bytes(job.total_size), peer, job_id,
             resumed ? " (resuming)" : "");

    auto session = ensure_session(*target);
    if (!session) {
        return Result(ErrorCode::INVALID_STATE, "Engine is stopping");
    }
    ensure_connected(*session);
    wake(peer);
    return Result();
}

std::optional<network::JobId> Engine::parse_job_id(const std::string& job_id, Result& error) {
    auto id = network::job_id_from_hex(job_id);
    if (!id) {
        error = Result(ErrorCode::INVALID_ARGUMENT, "Malformed job id '" + job_id + "'");
    }
    return id;
}

Result Engine::cancel(const std::string& job_id) {
    Result error;
    auto id = parse_job_id(job_id, error);
    if (!id) {
        return error;
    }

    auto job = queue_.find(*id);
    if (!job) {
        return Result(ErrorCode::NOT_FOUND, "No job " + job_id);
    }
    if (job->status == JobStatus::COMPLETED || job->status == JobStatus::CANCELLED) {
        return Result(ErrorCode::INVALID_STATE, "Job " + job_id + " is " + transfer::to_string(job->status));
    }

    auto session = find_session(job->peer);

    if (job->direction == Direction::INCOMING) {
        std::shared_ptr<transfer::IncomingTransfer> running;
        if (session) {
            Lock lock(mutex_);
            auto it = session->incoming.find(*id);
            if (it != session->incoming.end()) {
                running = it->second;
            }
        }
        if (running) {
            running->cancel();
            return Result();
        }
        return cancel_idle(*job);
    }

    {
        Lock lock(mutex_);
        if (session && session->current && session->current->job().id == *id) {
            session->current->request_stop(ReasonCode::CANCELLED);
            return Result();
        }

        // Worker cannot pick the job up while the queue change is made under mutex_.
        auto cancelled = queue_.cancel(*id);
        if (!cancelled) {
            return cancelled;
        }
    }

    return cancel_idle(*job);
}

Result Engine::cancel_idle(const TransferJob& job) {
    if (job.direction == Direction::INCOMING) {
        auto cancelled = queue_.cancel(job.id);
        if (!cancelled) {
            return cancelled;
        }
        if (auto record = ledger_.load(job.id)) {
            storage::FileStore::discard(record->path);
        } else if (!job.path.empty()) {
            storage::FileStore::discard(job.path);
        }
    }

    if (auto removed = ledger_.remove(job.id); !removed) {
        LOG_WARN("Cannot drop resume record of job {}: {}", job.id_hex(), removed.message);
    }

    if (auto session = find_session(job.peer); session && session->manager->is_connected()) {
        auto notified = session->manager->send_frame(
            network::Frame::make(job.id, network::FileAbortMessage{ReasonCode::CANCELLED}));
        if (!notified) {
            LOG_DEBUG("Peer {} not told about cancelled job {}: {}", job.peer, job.id_hex(), notified.message);
        }
    }

    LOG_INFO("Cancelled job {} ({})", job.id_hex(), job.filename);
    archive(job, storage::HistoryStatus::CANCELLED, ReasonCode::CANCELLED, "");
    emit_terminal(job, JobStatus::CANCELLED, ReasonCode::CANCELLED);
    return Result();
}

Result Engine::pause(const std::string& job_id) {
    Result error;
    auto id = parse_job_id(job_id, error);
    if (!id) {
        return error;
    }

    auto job = queue_.find(*id);
    if (!job) {
        return Result(ErrorCode::NOT_FOUND, "No job " + job_id);
    }
    if (job->direction != Direction::OUTGOING) {
        return Result(ErrorCode::INVALID_STATE, "Only the sender can pause job " + job_id);
    }

    auto session = find_session(job->peer);
    Lock lock(mutex_);
    if (session && session->current && session->current->job().id == *id) {
        session->current->request_stop(ReasonCode::PAUSED);
        return Result();
    }
    return queue_.pause(*id);
}

Result Engine::resume(const std::string& job_id) {
    Result error;
    auto id = parse_job_id(job_id, error);
    if (!id) {
        return error;
    }

    auto job = queue_.find(*id);
    if (!job) {
        return Result(ErrorCode::NOT_FOUND, "No job " + job_id);
    }
    if (job->direction != Direction::OUTGOING) {
        return Result(ErrorCode::INVALID_STATE, "Only the sender can resume job " + job_id);
    }

    auto resumed = queue_.resume(*id);
    if (resumed) {
        if (auto session = find_session(job->peer)) {
            ensure_connected(*session);
        }
    }
    return resumed;
}

Result Engine::retry(const std::string& job_id) {
    Result error;
    auto id = parse_job_id(job_id, error);
    if (!id) {
        return error;
    }

    auto job = queue_.find(*id);
    if (!job) {
        return Result(ErrorCode::NOT_FOUND, "No job " + job_id);
    }
    if (job->direction != Direction::OUTGOING) {
        return Result(ErrorCode::INVALID_STATE, "Only the sender can retry job " + job_id);
    }

    auto retried = queue_.retry(*id);
    if (retried) {
        auto target = resolve_peer(job->peer);
        if (auto session = target ? ensure_session(*target) : nullptr) {
            ensure_connected(*session);
        }
    }
    return retried;
}

Result Engine::connect(const std::string& peer) {
    auto target = resolve_peer(peer);
    if (!target) {
        return Result(ErrorCode::NOT_FOUND, "Unknown peer '" + peer + "'");
    }

    auto session = ensure_session(*target);
    if (!session) {
        return Result(ErrorCode::INVALID_STATE, "Engine is not running");
    }
    session->manager->connect();
    return Result();
}

Result Engine::disconnect(const std::string& peer) {
    auto session = find_session(peer);
    if (!session) {
        return Result(ErrorCode::NOT_FOUND, "Not connected to '" + peer + "'");
    }
    session->manager->disconnect();
    return Result();
}

Result Engine::retry_connection(const std::string& peer) {
    auto target = resolve_peer(peer);
    if (!target) {
        return Result(ErrorCode::NOT_FOUND, "Unknown peer '" + peer + "'");
    }

    auto session = ensure_session(*target);
    if (!session) {
        return Result(ErrorCode::INVALID_STATE, "Engine is not running");
    }
    session->manager->retry_now();
    return Result();
}

void Engine::on_event(EventHandler handler) {
    events_.subscribe(std::move(handler));
}

bool Engine::flush_events(std::chrono::milliseconds timeout) {
    return events_.flush(timeout);
}

std::vector<TransferJob> Engine::jobs(const std::string& peer) const {
    return queue_.list(peer);
}

std::vector<TransferJob> Engine::jobs() const {
    return queue_.list();
}

std::vector<storage::HistoryEntry> Engine::history(std::size_t limit) const {
    return history_.recent(limit);
}

network::ConnectionState Engine::connection_state(const std::string& peer) const {
    auto session = find_session(peer);
    return session ? session->manager->state() : network::ConnectionState::DISCONNECTED;
}

std::uint16_t Engine::listen_port() const {
    Lock lock(mutex_);
    return listener_ ? listener_->port() : 0;
}

std::shared_ptr<Engine::PeerSession> Engine::find_session(const std::string& peer) const {
    Lock lock(mutex_);
    auto it = sessions_.find(peer);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<network::Peer> Engine::resolve_peer(const std::string& name) const {
    if (auto peer = directory_.find(name)) {
        return peer;
    }
    if (auto session = find_session(name)) {
        return session->manager->peer();
    }
    return std::nullopt;
}

std::shared_ptr<Engine::PeerSession> Engine::ensure_session(const network::Peer& peer) {
    Lock lock(mutex_);
    auto it = sessions_.find(peer.name);
    if (it != sessions_.end()) {
        return it->second;
    }
    if (!running_) {
        return nullptr;
    }

    auto session = std::make_shared<PeerSession>();
    session->name = peer.name;
    session->manager = std::make_shared<network::ConnectionManager>(io_context_, peer, settings_.connection);

    auto name = peer.name;
    session->manager->on_state_change([this, name](network::ConnectionState state, network::DisconnectReason reason) {
        handle_state(name, state, reason);
    });
    session->manager->set_incoming_factory([this, name](const network::Frame& frame) {
        return make_incoming(name, frame);
    });

    sessions_[name] = session;
    session->worker = std::thread(&Engine::worker_loop, this, session);

    LOG_DEBUG("Session for peer '{}' at {}:{}", peer.name, peer.host, peer.port);
    return session;
}

void Engine::ensure_connected(PeerSession& session) {
    if (!session.manager->is_connected() && !session.manager->is_reconnecting()) {
        session.manager->connect();
    }
}

void Engine::wake(const std::string& peer) {
    Lock lock(mutex_);
    auto it = sessions_.find(peer);
    if (it != sessions_.end()) {
        it->second->wake.notify_all();
    }
}

void Engine::worker_loop(std::shared_ptr<PeerSession> session) {
    LOG_DEBUG("Transfer worker for '{}' started", session->name);

    while (true) {
        {
            Lock lock(mutex_);
            session->wake.wait(lock, [&] {
                return session->stopping ||
                       (session->manager->is_connected() && queue_.has_queued(session->name));
            });
            if (session->stopping) {
                break;
            }
        }

        auto job = queue_.dequeue_next(session->name);
        if (!job) {
            Lock lock(mutex_);
            session->wake.wait_for(lock, std::chrono::milliseconds(100));
            continue;
        }

        run_job(*session, *job);
    }

    LOG_DEBUG("Transfer worker for '{}' stopped", session->name);
}

void Engine::run_job(PeerSession& session, const TransferJob& job) {
    auto transfer = std::make_shared<transfer::OutgoingTransfer>(job, *session.manager, settings_.protocol);
    transfer->set_progress_callback([this](const TransferJob& current, std::uint64_t bytes_confirmed) {
        on_progress(current, bytes_confirmed);
    });

    {
        Lock lock(mutex_);
        auto latest = queue_.find(job.id);
        if (session.stopping || !latest || latest->status != JobStatus::ACTIVE) {
            LOG_DEBUG("Job {} left ACTIVE before it started", job.id_hex());
            if (session.stopping && latest && latest->status == JobStatus::ACTIVE) {
                lock.unlock();
                if (auto requeued = queue_.requeue_interrupted(job.id); !requeued) {
                    LOG_WARN("Cannot requeue job {}: {}", job.id_hex(), requeued.message);
                }
            }
            return;
        }
        session.current = transfer;
    }

    LOG_INFO("Starting job {} ({}) to {}", job.id_hex(), job.filename, job.peer);
    session.manager->register_handler(job.id, transfer);

    auto outcome = transfer->run();

    session.manager->unregister_handler(job.id);
    {
        Lock lock(mutex_);
        session.current.reset();
    }

    LOG_DEBUG("Job {} ended {}", job.id_hex(), transfer::to_string(outcome));
    finish_outgoing(transfer->job(), *transfer, outcome);
}

void Engine::finish_outgoing(const TransferJob& job, const transfer::OutgoingTransfer& transfer,
                             transfer::TransferOutcome outcome) {
    auto reason = transfer.failure_reason();

    auto check = [&job](const Result& result, const char* what) {
        if (!result) {
            LOG_WARN("Job {}: cannot {}: {}", job.id_hex(), what, result.message);
        }
    };

    switch (outcome) {
        case transfer::TransferOutcome::COMPLETED:
            check(queue_.mark_completed(job.id), "mark completed");
            check(ledger_.remove(job.id), "drop resume record");
            archive(job, storage::HistoryStatus::COMPLETED, ReasonCode::NONE, transfer.whole_file_checksum());
            emit_terminal(job, JobStatus::COMPLETED, ReasonCode::NONE);
            break;

        case transfer::TransferOutcome::FAILED:
            check(queue_.mark_failed(job.id, reason), "mark failed");
            save_sender_progress(job, transfer.progress());
            archive(job, storage::HistoryStatus::FAILED, reason, "");
            emit_terminal(job, JobStatus::FAILED, reason);
            break;

        case transfer::TransferOutcome::CANCELLED:
            check(queue_.cancel(job.id), "cancel");
            check(ledger_.remove(job.id), "drop resume record");
            archive(job, storage::HistoryStatus::CANCELLED, ReasonCode::CANCELLED, "");
            emit_terminal(job, JobStatus::CANCELLED, ReasonCode::CANCELLED);
            break;

        case transfer::TransferOutcome::PAUSED:
            save_sender_progress(job, transfer.progress());
            check(queue_.pause(job.id), "pause");
            break;

        case transfer::TransferOutcome::INTERRUPTED:
            save_sender_progress(job, transfer.progress());
            check(queue_.requeue_interrupted(job.id), "requeue");
            break;
    }
}

void Engine::save_sender_progress(const TransferJob& job, const storage::ResumeRecord& progress) {
    auto record = ledger_.load(job.id);
    if (!record) {
        record = progress;
    } else {
        record->next_sequence = progress.next_sequence;
        record->out_of_order = progress.out_of_order;
    }
    record->updated_at = std::chrono::system_clock::now();

    if (auto saved = ledger_.save(*record); !saved) {
        LOG_WARN("Cannot save progress of job {}: {}", job.id_hex(), saved.message);
    }
}

void Engine::handle_hello(std::shared_ptr<network::Connection> connection, const network::HelloMessage& hello) {
    if (hello.peer_name == settings_.node_name) {
        LOG_WARN("Inbound connection from {} claims our own name '{}'", connection->remote_endpoint(), hello.peer_name);
        connection->close();
        return;
    }

    auto known = directory_.find(hello.peer_name);
    if (!known) {
        network::Peer learned;
        learned.name = hello.peer_name;
        learned.host = connection->remote_address();
        learned.port = hello.listen_port;
        LOG_INFO("New peer '{}' at {}:{}", learned.name, learned.host, learned.port);
        directory_.add(learned);
        known = learned;
    }

    auto session = ensure_session(*known);
    if (!session) {
        connection->close();
        return;
    }

    session->manager->adopt(std::move(connection), hello);
}

void Engine::handle_state(const std::string& peer, network::ConnectionState state, network::DisconnectReason reason) {
    events_.publish(ConnectionStateChanged{peer, state, reason});

    if (state != network::ConnectionState::CONNECTED) {
        return;
    }

    if (settings_.auto_requeue_failed) {
        for (const auto& job : queue_.list(peer)) {
            if (job.direction == Direction::OUTGOING && job.status == JobStatus::FAILED) {
                LOG_INFO("Requeueing failed job {} after reconnect", job.id_hex());
                if (auto retried = queue_.retry(job.id); !retried) {
                    LOG_WARN("Cannot requeue job {}: {}", job.id_hex(), retried.message);
                }
            }
        }
    }

    wake(peer);
}

std::shared_ptr<network::FrameHandler> Engine::make_incoming(const std::string& peer, const network::Frame& frame) {
    if (frame.type() == network::MessageType::FILE_ABORT) {
        handle_orphan_abort(peer, frame);
        return nullptr;
    }

    auto session = find_session(peer);
    if (!session) {
        return nullptr;
    }

    transfer::IncomingContext context{ledger_, history_, store_, queue_};
    auto transfer = std::make_shared<transfer::IncomingTransfer>(frame.job_id(), peer, *session->manager,
                                                                 settings_.protocol, context);
    transfer->set_progress_callback([this](const TransferJob& job, std::uint64_t bytes_confirmed) {
        on_progress(job, bytes_confirmed);
    });

    std::weak_ptr<network::ConnectionManager> manager = session->manager;
    std::weak_ptr<PeerSession> owner = session;
    transfer->on_finished([this, manager, owner](const TransferJob& job, JobStatus status, ReasonCode reason) {
        if (auto live = manager.lock()) {
            live->unregister_handler(job.id);
        }
        if (auto session = owner.lock()) {
            Lock lock(mutex_);
            session->incoming.erase(job.id);
        }
        if (status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED) {
            emit_terminal(job, status, reason);
        }
    });

    {
        Lock lock(mutex_);
        session->incoming[frame.job_id()] = transfer;
    }
    return transfer;
}

void Engine::handle_orphan_abort(const std::string& peer, const network::Frame& frame) {
    auto reason = frame.decode<network::FileAbortMessage>().reason;
    auto job = queue_.find(frame.job_id());

    if (reason != ReasonCode::CANCELLED || !job || job->peer != peer) {
        LOG_DEBUG("Ignoring {} abort for idle job {}", network::to_string(reason), network::to_hex(frame.job_id()));
        return;
    }

    if (job->status == JobStatus::COMPLETED || job->status == JobStatus::CANCELLED) {
        return;
    }

    LOG_INFO("Peer '{}' cancelled job {}", peer, job->id_hex());
    if (job->direction == Direction::OUTGOING) {
        Lock lock(mutex_);
        auto session = sessions_.find(peer);
        if (session != sessions_.end() && session->second->current &&
            session->second->current->job().id == job->id) {
            return;     // the running transfer sees the abort itself
        }
        auto cancelled = queue_.cancel(job->id);
        if (!cancelled) {
            return;
        }
        lock.unlock();
        if (auto removed = ledger_.remove(job->id); !removed) {
            LOG_WARN("Cannot drop resume record of job {}: {}", job->id_hex(), removed.message);
        }
        archive(*job, storage::HistoryStatus::CANCELLED, ReasonCode::CANCELLED, "");
        emit_terminal(*job, JobStatus::CANCELLED, ReasonCode::CANCELLED);
        return;
    }

    auto cancelled = queue_.cancel(job->id);
    if (!cancelled) {
        return;
    }
    if (auto record = ledger_.load(job->id)) {
        storage::FileStore::discard(record->path);
    }
    if (auto removed = ledger_.remove(job->id); !removed) {
        LOG_WARN("Cannot drop resume record of job {}: {}", job->id_hex(), removed.message);
    }
    archive(*job, storage::HistoryStatus::CANCELLED, ReasonCode::CANCELLED, "");
    emit_terminal(*job, JobStatus::CANCELLED, ReasonCode::CANCELLED);
}

void Engine::on_progress(const TransferJob& job, std::uint64_t bytes_confirmed) {
    if (job.direction == Direction::OUTGOING) {
        if (auto updated = queue_.update_progress(job.id, bytes_confirmed); !updated) {
            LOG_DEBUG("Progress of job {} not recorded: {}", job.id_hex(), updated.message);
        }
    }

    TransferProgress event;
    {
        Lock lock(mutex_);
        auto it = progress_.find(job.id);
        if (it == progress_.end()) {
            it = progress_.emplace(job.id, ProgressState{transfer::RateMeter(job.total_size, bytes_confirmed),
                                                         transfer::ProgressThrottle(settings_.progress_interval)}).first;
        }

        auto& state = it->second;
        auto now = transfer::RateMeter::Clock::now();
        state.meter.record(bytes_confirmed, now);
        if (!state.throttle.should_emit(bytes_confirmed, job.total_size, now)) {
            return;
        }

        event.job_id = job.id_hex();
        event.peer = job.peer;
        event.direction = job.direction;
        event.filename = job.filename;
        event.bytes_done = bytes_confirmed;
        event.total_bytes = job.total_size;
        event.rate_bps = state.meter.current_rate(now);
        event.eta = state.meter.eta(now);
    }

    events_.publish(std::move(event));
}

void Engine::emit_terminal(const TransferJob& job, JobStatus status, ReasonCode reason) {
    {
        Lock lock(mutex_);
        progress_.erase(job.id);
    }

    // The history keeps finished jobs; failed outgoing ones stay queued for retry.
    if (status != JobStatus::FAILED || job.direction == Direction::INCOMING) {
        if (auto removed = queue_.remove(job.id); !removed) {
            LOG_WARN("Job {} not dropped from the queue: {}", job.id_hex(), removed.message);
        }
    }

    TransferTerminal event;
    event.job_id = job.id_hex();
    event.peer = job.peer;
    event.direction = job.direction;
    event.filename = job.filename;
    event.path = job.path;
    event.status = status;
    event.reason = reason;

    LOG_INFO("Job {} {} {}", event.job_id, transfer::to_string(status), network::to_string(reason));
    events_.publish(std::move(event));
}

void Engine::archive(const TransferJob& job, storage::HistoryStatus status, ReasonCode reason,
                     const std::string& checksum) {
    storage::HistoryEntry entry;
    entry.job_id = job.id;
    entry.direction = job.direction;
    entry.peer = job.peer;
    entry.filename = job.filename;
    entry.size = job.total_size;
    entry.status = status;
    entry.reason = reason;
    entry.checksum = checksum;
    entry.finished_at = std::chrono::system_clock::now();

    if (auto archived = history_.archive(entry); !archived) {
        LOG_WARN("Cannot archive job {}: {}", job.id_hex(), archived.message);
    }
}

}
