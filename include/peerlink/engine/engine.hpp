#pragma once

#include "peerlink/engine/engine_settings.hpp"
#include "peerlink/engine/event_channel.hpp"
#include "peerlink/engine/peer_directory.hpp"
#include "peerlink/network/connection_manager.hpp"
#include "peerlink/network/listener.hpp"
#include "peerlink/storage/file_store.hpp"
#include "peerlink/storage/resume_ledger.hpp"
#include "peerlink/storage/transfer_history.hpp"
#include "peerlink/transfer/incoming_transfer.hpp"
#include "peerlink/transfer/outgoing_transfer.hpp"
#include "peerlink/transfer/rate_meter.hpp"
#include "peerlink/transfer/transfer_queue.hpp"
#include <boost/asio.hpp>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace peerlink::engine {

// Entry point for the UI: queues files for peers, owns one ConnectionManager
// and one transfer worker per peer, accepts inbound peers and reports
// everything that happens through typed events.
class Engine {
public:
    using EventHandler = EventChannel::Handler;

    Engine(EngineSettings settings,
           storage::ResumeLedger& ledger,
           transfer::TransferQueue& queue,
           storage::TransferHistory& history);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    core::Result start();
    void stop();
    bool is_running() const;

    PeerDirectory& peers() { return directory_; }

    // Queues `file_path` for `peer` and returns at once. Sending the same
    // unchanged file again resumes the earlier job instead of starting over.
    core::Result send(const std::filesystem::path& file_path, const std::string& peer, std::string& job_id);

    core::Result cancel(const std::string& job_id);
    core::Result pause(const std::string& job_id);
    core::Result resume(const std::string& job_id);
    core::Result retry(const std::string& job_id);

    core::Result connect(const std::string& peer);
    core::Result disconnect(const std::string& peer);
    core::Result retry_connection(const std::string& peer);

    // Handlers run on the event dispatcher thread, in publication order.
    void on_event(EventHandler handler);
    bool flush_events(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    std::vector<transfer::TransferJob> jobs(const std::string& peer) const;
    std::vector<transfer::TransferJob> jobs() const;
    std::vector<storage::HistoryEntry> history(std::size_t limit = 50) const;

    network::ConnectionState connection_state(const std::string& peer) const;
    std::uint16_t listen_port() const;
    const EngineSettings& settings() const { return settings_; }

private:
    using Lock = std::unique_lock<std::mutex>;

    struct PeerSession {
        std::string name;
        std::shared_ptr<network::ConnectionManager> manager;
        std::thread worker;
        std::condition_variable wake;       // waits on Engine::mutex_
        std::shared_ptr<transfer::OutgoingTransfer> current;
        std::map<network::JobId, std::shared_ptr<transfer::IncomingTransfer>> incoming;
        bool stopping = false;
    };

    struct ProgressState {
        transfer::RateMeter meter;
        transfer::ProgressThrottle throttle;
    };

    std::shared_ptr<PeerSession> ensure_session(const network::Peer& peer);
    std::shared_ptr<PeerSession> find_session(const std::string& peer) const;
    std::optional<network::Peer> resolve_peer(const std::string& name) const;
    void ensure_connected(PeerSession& session);
    void wake(const std::string& peer);

    void worker_loop(std::shared_ptr<PeerSession> session);
    void run_job(PeerSession& session, const transfer::TransferJob& job);
    void finish_outgoing(const transfer::TransferJob& job, const transfer::OutgoingTransfer& transfer,
                         transfer::TransferOutcome outcome);
    void save_sender_progress(const transfer::TransferJob& job, const storage::ResumeRecord& progress);

    void handle_hello(std::shared_ptr<network::Connection> connection, const network::HelloMessage& hello);
    void handle_state(const std::string& peer, network::ConnectionState state, network::DisconnectReason reason);
    std::shared_ptr<network::FrameHandler> make_incoming(const std::string& peer, const network::Frame& frame);
    void handle_orphan_abort(const std::string& peer, const network::Frame& frame);

    // Cancels a job that no protocol instance is running.
    core::Result cancel_idle(const transfer::TransferJob& job);

    void on_progress(const transfer::TransferJob& job, std::uint64_t bytes_confirmed);
    void emit_terminal(const transfer::TransferJob& job, transfer::JobStatus status, network::ReasonCode reason);
    void archive(const transfer::TransferJob& job, storage::HistoryStatus status, network::ReasonCode reason,
                 const std::string& checksum);

    static std::optional<network::JobId> parse_job_id(const std::string& job_id, core::Result& error);

    EngineSettings settings_;
    storage::ResumeLedger& ledger_;
    transfer::TransferQueue& queue_;
    storage::TransferHistory& history_;
    storage::FileStore store_;
    PeerDirectory directory_;
    EventChannel events_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> io_threads_;
    std::unique_ptr<network::Listener> listener_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<PeerSession>> sessions_;
    std::map<network::JobId, ProgressState> progress_;
    bool running_;
    std::shared_ptr<char> lifetime_;
};

}
