#include "peerlink/network/connection_manager.hpp"
#include "peerlink/core/logger.hpp"
#include "peerlink/core/utils.hpp"
#include <algorithm>

namespace peerlink::network {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "disconnected";
        case ConnectionState::CONNECTING:   return "connecting";
        case ConnectionState::CONNECTED:    return "connected";
    }
    return "unknown";
}

const char* to_string(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::NONE:                return "none";
        case DisconnectReason::USER_REQUESTED:      return "user requested";
        case DisconnectReason::CONNECT_FAILED:      return "connect failed";
        case DisconnectReason::CONNECTION_LOST:     return "connection lost";
        case DisconnectReason::PROTOCOL_ERROR:      return "protocol error";
        case DisconnectReason::IDLE_TIMEOUT:        return "idle timeout";
        case DisconnectReason::RECONNECT_EXHAUSTED: return "reconnect exhausted";
    }
    return "unknown";
}

std::chrono::milliseconds ReconnectPolicy::next_delay(std::chrono::milliseconds current) const {
    return std::min<std::chrono::milliseconds>(current * multiplier, max_delay);
}

ConnectionManager::ConnectionManager(boost::asio::io_context& io_context, Peer peer, ConnectionSettings settings)
    : io_context_(io_context)
    , strand_(boost::asio::make_strand(io_context))
    , peer_name_(peer.name)
    , settings_(std::move(settings))
    , peer_(std::move(peer))
    , state_(ConnectionState::DISCONNECTED)
    , idle_closed_(nullptr)
    , attempt_in_flight_(false)
    , attempt_generation_(0)
    , reconnecting_(false)
    , user_disconnected_(false)
    , stopped_(false)
    , current_delay_(settings_.reconnect.initial_delay)
    , reconnect_timer_(strand_)
    , reconnect_generation_(0)
    , heartbeat_timer_(strand_)
    , heartbeat_generation_(0) {
}

ConnectionManager::~ConnectionManager() {
    LOG_DEBUG("Connection manager for '{}' destroyed", peer_name_);
}

void ConnectionManager::connect() {
    Lock lock(mutex_);
    if (stopped_) {
        return;
    }

    user_disconnected_ = false;

    if (state_ != ConnectionState::DISCONNECTED || attempt_in_flight_ || reconnecting_) {
        LOG_DEBUG("connect() to '{}' ignored, state {}", peer_name_, to_string(state_.load()));
        return;
    }

    start_attempt(lock);
}

void ConnectionManager::disconnect() {
    Lock lock(mutex_);
    user_disconnected_ = true;
    reconnecting_ = false;
    ++reconnect_generation_;
    reconnect_timer_.cancel();

    if (attempt_in_flight_) {
        ++attempt_generation_;
        attempt_in_flight_ = false;
    }

    auto connection = connection_;
    if (!connection) {
        if (state_ != ConnectionState::DISCONNECTED) {
            transition(lock, ConnectionState::DISCONNECTED, DisconnectReason::USER_REQUESTED);
        }
        return;
    }

    lock.unlock();
    LOG_INFO("Disconnecting from '{}'", peer_name_);
    connection->close();
}

void ConnectionManager::retry_now() {
    Lock lock(mutex_);
    if (stopped_) {
        return;
    }

    user_disconnected_ = false;
    if (state_ == ConnectionState::CONNECTED) {
        return;
    }

    LOG_INFO("Manual reconnect to '{}'", peer_name_);

    reconnecting_ = true;
    window_start_ = std::chrono::steady_clock::now();
    current_delay_ = settings_.reconnect.initial_delay;
    ++reconnect_generation_;
    reconnect_timer_.cancel();

    if (!attempt_in_flight_) {
        start_attempt(lock);
    }
}

bool ConnectionManager::adopt(std::shared_ptr<Connection> connection, const HelloMessage& hello) {
    Lock lock(mutex_);

    if (stopped_ || user_disconnected_) {
        LOG_INFO("Refusing inbound connection from '{}': disconnected by user", hello.peer_name);
        lock.unlock();
        connection->close();
        return false;
    }

    if (peer_.host.empty()) {
        peer_.host = connection->remote_address();
    }
    if (hello.listen_port != 0) {
        peer_.port = hello.listen_port;
    }

    // Simultaneous connects: both ends keep the socket initiated by the peer
    // whose name sorts first.
    bool prefer_ours = settings_.local_name < peer_name_;

    if (connection_ && connection_->is_open()) {
        auto existing = connection_;
        if (existing->initiated_locally() && prefer_ours) {
            LOG_INFO("Keeping outbound connection to '{}', closing inbound duplicate", peer_name_);
            lock.unlock();
            connection->close();
            return false;
        }

        LOG_INFO("Inbound connection from '{}' replaces {}", peer_name_, existing->remote_endpoint());
        std::vector<std::shared_ptr<FrameHandler>> interrupted;
        for (auto& [_, handler] : handlers_) {
            interrupted.push_back(handler);
        }
        install(lock, connection);
        lock.unlock();

        // handle_closed ignores the old socket once it is no longer current,
        // so its jobs are interrupted here.
        existing->close();
        for (auto& handler : interrupted) {
            handler->on_connection_lost();
        }
        return true;
    }

    if (attempt_in_flight_) {
        if (prefer_ours) {
            LOG_INFO("Outbound attempt to '{}' in flight, closing inbound duplicate", peer_name_);
            lock.unlock();
            connection->close();
            return false;
        }
        ++attempt_generation_;
        attempt_in_flight_ = false;
    }

    install(lock, connection);
    return true;
}

core::Result ConnectionManager::send_frame(Frame frame) {
    std::shared_ptr<Connection> connection;
    {
        Lock lock(mutex_);
        if (state_ == ConnectionState::CONNECTED) {
            connection = connection_;
        }
    }

    if (!connection) {
        return core::Result(core::ErrorCode::NOT_CONNECTED, "Not connected to " + peer_name_);
    }

    if (!connection->send_frame(std::move(frame))) {
        return core::Result(core::ErrorCode::NOT_CONNECTED, "Connection to " + peer_name_ + " is closing");
    }

    return core::Result();
}

void ConnectionManager::on_state_change(StateCallback callback) {
    Lock lock(mutex_);
    state_callbacks_.push_back(std::move(callback));
}

void ConnectionManager::on_frame_received(FrameCallback callback) {
    Lock lock(mutex_);
    frame_callbacks_.push_back(std::move(callback));
}

void ConnectionManager::register_handler(const JobId& job_id, std::shared_ptr<FrameHandler> handler) {
    Lock lock(mutex_);
    handlers_[job_id] = std::move(handler);
}

void ConnectionManager::unregister_handler(const JobId& job_id) {
    Lock lock(mutex_);
    handlers_.erase(job_id);
}

bool ConnectionManager::has_handler(const JobId& job_id) const {
    Lock lock(mutex_);
    return handlers_.count(job_id) > 0;
}

void ConnectionManager::set_incoming_factory(IncomingFactory factory) {
    Lock lock(mutex_);
    incoming_factory_ = std::move(factory);
}

void ConnectionManager::shutdown() {
    Lock lock(mutex_);
    if (stopped_) {
        return;
    }

    stopped_ = true;
    reconnecting_ = false;
    ++reconnect_generation_;
    ++heartbeat_generation_;
    ++attempt_generation_;
    attempt_in_flight_ = false;
    reconnect_timer_.cancel();
    heartbeat_timer_.cancel();

    auto connection = connection_;
    lock.unlock();

    if (connection) {
        connection->close();
    }
}

bool ConnectionManager::is_reconnecting() const {
    Lock lock(mutex_);
    return reconnecting_;
}

Peer ConnectionManager::peer() const {
    Lock lock(mutex_);
    return peer_;
}

void ConnectionManager::start_attempt(Lock& lock) {
    attempt_in_flight_ = true;
    auto generation = ++attempt_generation_;
    auto host = peer_.host;
    auto port = peer_.port;

    transition(lock, ConnectionState::CONNECTING, DisconnectReason::NONE);

    LOG_INFO("Connecting to '{}' at {}:{}", peer_name_, host, port);

    std::weak_ptr<ConnectionManager> weak = shared_from_this();
    async_connect(io_context_, host, port, settings_.connect_timeout,
        [weak, generation](const boost::system::error_code& ec, std::shared_ptr<Connection> connection) {
            if (auto self = weak.lock()) {
                self->handle_connect_result(generation, ec, std::move(connection));
            } else if (connection) {
                connection->close();
            }
        });
}

void ConnectionManager::handle_connect_result(std::uint64_t generation,
                                              const boost::system::error_code& ec,
                                              std::shared_ptr<Connection> connection) {
    Lock lock(mutex_);

    if (generation != attempt_generation_ || stopped_ || user_disconnected_) {
        if (connection) {
            LOG_DEBUG("Discarding superseded outbound connection to '{}'", peer_name_);
            lock.unlock();
            connection->close();
        }
        return;
    }

    attempt_in_flight_ = false;

    if (ec) {
        LOG_WARN("Connection to '{}' failed: {}", peer_name_, ec.message());

        if (state_ == ConnectionState::CONNECTED) {
            return;
        }
        if (reconnecting_) {
            schedule_reconnect(lock);
        } else {
            transition(lock, ConnectionState::DISCONNECTED, DisconnectReason::CONNECT_FAILED);
        }
        return;
    }

    if (connection_ && connection_->is_open()) {
        // An inbound connection was adopted while we were connecting.
        LOG_DEBUG("Already connected to '{}', dropping outbound socket", peer_name_);
        lock.unlock();
        connection->close();
        return;
    }

    install(lock, std::move(connection));
}

void ConnectionManager::install(Lock& lock, std::shared_ptr<Connection> connection) {
    connection_ = connection;
    idle_closed_ = nullptr;
    reconnecting_ = false;
    ++reconnect_generation_;
    reconnect_timer_.cancel();

    std::weak_ptr<ConnectionManager> weak_self = shared_from_this();
    std::weak_ptr<Connection> weak_connection = connection;

    connection->set_handlers(
        [weak_self, weak_connection](Frame frame) {
            if (auto self = weak_self.lock()) {
                self->handle_frame(weak_connection, frame);
            }
        },
        [weak_self](std::shared_ptr<Connection> closed, CloseReason reason) {
            if (auto self = weak_self.lock()) {
                self->handle_closed(closed, reason);
            }
        });

    if (connection->initiated_locally()) {
        connection->start();
        connection->send_message(CONNECTION_JOB_ID, HelloMessage{settings_.local_name, settings_.listen_port});
    }

    LOG_INFO("Connected to '{}' via {}", peer_name_, connection->remote_endpoint());

    if (state_ != ConnectionState::CONNECTED) {
        transition(lock, ConnectionState::CONNECTED, DisconnectReason::NONE);
    }

    arm_heartbeat(lock);
}

void ConnectionManager::handle_closed(const std::shared_ptr<Connection>& connection, CloseReason reason) {
    std::vector<std::shared_ptr<FrameHandler>> affected;
    {
        Lock lock(mutex_);
        if (connection != connection_) {
            return;
        }

        connection_.reset();
        ++heartbeat_generation_;
        heartbeat_timer_.cancel();

        for (auto& [_, handler] : handlers_) {
            affected.push_back(handler);
        }

        if (user_disconnected_ || stopped_) {
            transition(lock, ConnectionState::DISCONNECTED, DisconnectReason::USER_REQUESTED);
        } else {
            auto why = DisconnectReason::CONNECTION_LOST;
            if (reason == CloseReason::PROTOCOL_ERROR) {
                why = DisconnectReason::PROTOCOL_ERROR;
            } else if (connection.get() == idle_closed_) {
                why = DisconnectReason::IDLE_TIMEOUT;
            }

            LOG_WARN("Connection to '{}' lost ({})", peer_name_, to_string(why));
            transition(lock, ConnectionState::DISCONNECTED, why);
            begin_reconnect(lock);
        }
        idle_closed_ = nullptr;
    }

    for (auto& handler : affected) {
        handler->on_connection_lost();
    }
}

void ConnectionManager::handle_frame(const std::weak_ptr<Connection>& connection, const Frame& frame) {
    std::vector<FrameCallback> observers;
    {
        Lock lock(mutex_);
        if (connection.lock() != connection_) {
            return;
        }
        observers = frame_callbacks_;
    }

    for (auto& observer : observers) {
        observer(frame);
    }

    switch (frame.type()) {
        case MessageType::HELLO:
            frame.decode<HelloMessage>();
            LOG_DEBUG("Ignoring repeated HELLO from '{}'", peer_name_);
            return;
        case MessageType::HEARTBEAT:
            frame.decode<HeartbeatMessage>();
            return;
        default:
            dispatch_job_frame(frame);
    }
}

void ConnectionManager::dispatch_job_frame(const Frame& frame) {
    if (frame.job_id() == CONNECTION_JOB_ID) {
        throw ProtocolError(std::string(to_string(frame.type())) + " without a job id");
    }

    std::shared_ptr<FrameHandler> handler;
    IncomingFactory factory;
    {
        Lock lock(mutex_);
        auto it = handlers_.find(frame.job_id());
        if (it != handlers_.end()) {
            handler = it->second;
        } else {
            factory = incoming_factory_;
        }
    }

    if (!handler && factory &&
        (frame.type() == MessageType::FILE_START || frame.type() == MessageType::FILE_ABORT)) {
        handler = factory(frame);
        if (handler) {
            register_handler(frame.job_id(), handler);
        }
    }

    if (!handler) {
        LOG_DEBUG("No handler for {} of job {} from '{}'", to_string(frame.type()), to_hex(frame.job_id()), peer_name_);
        return;
    }

    try {
        handler->on_frame(frame);
    } catch (const ProtocolError&) {
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Handler for job {} failed: {}", to_hex(frame.job_id()), e.what());
    }
}

void ConnectionManager::begin_reconnect(Lock& lock) {
    reconnecting_ = true;
    window_start_ = std::chrono::steady_clock::now();
    current_delay_ = settings_.reconnect.initial_delay;
    arm_reconnect_timer(lock);
}

void ConnectionManager::schedule_reconnect(Lock& lock) {
    current_delay_ = settings_.reconnect.next_delay(current_delay_);

    auto elapsed = std::chrono::steady_clock::now() - window_start_;
    if (elapsed + current_delay_ > settings_.reconnect.window) {
        LOG_ERROR("Giving up on '{}' after {}", peer_name_,
                  core::utils::StringUtils::format_duration(
                      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed)));
        reconnecting_ = false;
        transition(lock, ConnectionState::DISCONNECTED, DisconnectReason::RECONNECT_EXHAUSTED);
        return;
    }

    transition(lock, ConnectionState::DISCONNECTED, DisconnectReason::CONNECT_FAILED);
    arm_reconnect_timer(lock);
}

void ConnectionManager::arm_reconnect_timer(Lock&) {
    auto generation = ++reconnect_generation_;
    LOG_INFO("Reconnecting to '{}' in {} ms", peer_name_, current_delay_.count());

    std::weak_ptr<ConnectionManager> weak = shared_from_this();
    reconnect_timer_.expires_after(current_delay_);
    reconnect_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_reconnect_timer(generation);
        }
    });
}

void ConnectionManager::on_reconnect_timer(std::uint64_t generation) {
    Lock lock(mutex_);
    if (generation != reconnect_generation_ || !reconnecting_ || stopped_ ||
        state_ != ConnectionState::DISCONNECTED || attempt_in_flight_) {
        return;
    }

    start_attempt(lock);
}

void ConnectionManager::arm_heartbeat(Lock&) {
    auto tick = std::min(settings_.heartbeat_interval, settings_.idle_timeout) / 4;
    tick = std::max(tick, std::chrono::milliseconds(10));
    auto generation = ++heartbeat_generation_;

    std::weak_ptr<ConnectionManager> weak = shared_from_this();
    heartbeat_timer_.expires_after(tick);
    heartbeat_timer_.async_wait([weak, generation](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto self = weak.lock()) {
            self->on_heartbeat_tick(generation);
        }
    });
}

void ConnectionManager::on_heartbeat_tick(std::uint64_t generation) {
    Lock lock(mutex_);
    if (generation != heartbeat_generation_ || !connection_) {
        return;
    }

    auto connection = connection_;
    auto now = std::chrono::steady_clock::now();

    if (now - connection->last_receive() >= settings_.idle_timeout) {
        LOG_WARN("Nothing received from '{}' for {} ms, dropping connection",
                 peer_name_, settings_.idle_timeout.count());
        idle_closed_ = connection.get();
        lock.unlock();
        connection->close();
        return;
    }

    if (now - connection->last_send() >= settings_.heartbeat_interval) {
        HeartbeatMessage heartbeat{core::utils::TimeUtils::unix_millis(std::chrono::system_clock::now())};
        connection->send_message(CONNECTION_JOB_ID, heartbeat);
    }

    arm_heartbeat(lock);
}

void ConnectionManager::transition(Lock&, ConnectionState next, DisconnectReason reason) {
    auto previous = state_.exchange(next);
    if (previous == next && reason == DisconnectReason::NONE) {
        return;
    }

    LOG_DEBUG("'{}' {} -> {} ({})", peer_name_, to_string(previous), to_string(next), to_string(reason));

    auto callbacks = state_callbacks_;
    boost::asio::post(strand_, [callbacks = std::move(callbacks), next, reason]() {
        for (auto& callback : callbacks) {
            callback(next, reason);
        }
    });
}

}
