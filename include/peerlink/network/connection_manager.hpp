#pragma once

#include "peerlink/network/connection.hpp"
#include "peerlink/network/frame.hpp"
#include "peerlink/core/result.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <functional>
#include <chrono>
#include <mutex>
#include <map>
#include <vector>
#include <atomic>

namespace peerlink::network {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

const char* to_string(ConnectionState state);

enum class DisconnectReason {
    NONE,
    USER_REQUESTED,
    CONNECT_FAILED,
    CONNECTION_LOST,
    PROTOCOL_ERROR,
    IDLE_TIMEOUT,
    RECONNECT_EXHAUSTED
};

const char* to_string(DisconnectReason reason);

struct Peer {
    std::string name;
    std::string host;
    std::uint16_t port = DEFAULT_PORT;
};

struct ReconnectPolicy {
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds window{180000};
    unsigned multiplier = 2;

    std::chrono::milliseconds next_delay(std::chrono::milliseconds current) const;
};

struct ConnectionSettings {
    std::string local_name;
    std::uint16_t listen_port = DEFAULT_PORT;
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds heartbeat_interval{15000};
    std::chrono::milliseconds idle_timeout{60000};
    ReconnectPolicy reconnect;
};

// Owns the single socket to one peer and runs its state machine:
//
//   DISCONNECTED --connect()--> CONNECTING --established--> CONNECTED
//   CONNECTING --refused/timeout--> DISCONNECTED
//   CONNECTED --error/peer close/idle--> DISCONNECTED (+ reconnect cycle)
//
// Frames are demultiplexed by job id to registered FrameHandlers. State
// callbacks are delivered in order on the manager's strand; frame handlers run
// on the socket's strand.
class ConnectionManager : public FrameSink, public std::enable_shared_from_this<ConnectionManager> {
public:
    using StateCallback = std::function<void(ConnectionState, DisconnectReason)>;
    using FrameCallback = std::function<void(const Frame&)>;
    using IncomingFactory = std::function<std::shared_ptr<FrameHandler>(const Frame&)>;

    ConnectionManager(boost::asio::io_context& io_context, Peer peer, ConnectionSettings settings);
    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void connect();
    void disconnect();

    // Resets the backoff and attempts immediately, even after the window ran out.
    void retry_now();

    // Inbound role. Returns false when the connection lost the tie-break and
    // was closed.
    bool adopt(std::shared_ptr<Connection> connection, const HelloMessage& hello);

    core::Result send_frame(Frame frame) override;

    void on_state_change(StateCallback callback);
    void on_frame_received(FrameCallback callback);

    void register_handler(const JobId& job_id, std::shared_ptr<FrameHandler> handler);
    void unregister_handler(const JobId& job_id);
    bool has_handler(const JobId& job_id) const;

    // Consulted for FILE_START and FILE_ABORT frames whose job id has no handler.
    void set_incoming_factory(IncomingFactory factory);

    // Stops timers and closes the socket without emitting a reconnect cycle.
    void shutdown();

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state() == ConnectionState::CONNECTED; }
    bool is_reconnecting() const;
    Peer peer() const;
    const std::string& peer_name() const { return peer_name_; }

private:
    using Lock = std::unique_lock<std::mutex>;

    void start_attempt(Lock& lock);
    void handle_connect_result(std::uint64_t generation,
                               const boost::system::error_code& ec,
                               std::shared_ptr<Connection> connection);
    void install(Lock& lock, std::shared_ptr<Connection> connection);
    void handle_closed(const std::shared_ptr<Connection>& connection, CloseReason reason);
    void handle_frame(const std::weak_ptr<Connection>& connection, const Frame& frame);
    void dispatch_job_frame(const Frame& frame);

    void begin_reconnect(Lock& lock);
    void schedule_reconnect(Lock& lock);
    void arm_reconnect_timer(Lock& lock);
    void on_reconnect_timer(std::uint64_t generation);

    void arm_heartbeat(Lock& lock);
    void on_heartbeat_tick(std::uint64_t generation);

    void transition(Lock& lock, ConnectionState next, DisconnectReason reason);

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    const std::string peer_name_;
    ConnectionSettings settings_;

    mutable std::mutex mutex_;
    Peer peer_;
    std::atomic<ConnectionState> state_;
    std::shared_ptr<Connection> connection_;
    const Connection* idle_closed_;
    bool attempt_in_flight_;
    std::uint64_t attempt_generation_;
    bool reconnecting_;
    bool user_disconnected_;
    bool stopped_;
    std::chrono::steady_clock::time_point window_start_;
    std::chrono::milliseconds current_delay_;

    boost::asio::steady_timer reconnect_timer_;
    std::uint64_t reconnect_generation_;
    boost::asio::steady_timer heartbeat_timer_;
    std::uint64_t heartbeat_generation_;

    std::vector<StateCallback> state_callbacks_;
    std::vector<FrameCallback> frame_callbacks_;
    std::map<JobId, std::shared_ptr<FrameHandler>> handlers_;
    IncomingFactory incoming_factory_;
};

}
