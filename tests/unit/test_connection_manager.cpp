#include <gtest/gtest.h>
#include "peerlink/network/connection_manager.hpp"
#include "peerlink/network/listener.hpp"
#include "support/test_support.hpp"
#include <thread>

using namespace peerlink::network;
using peerlink::test::wait_until;

namespace {

class StateLog {
public:
    void record(ConnectionState state, DisconnectReason reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(state, reason);
    }

    bool saw(ConnectionState state, DisconnectReason reason) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            if (entry.first == state && entry.second == reason) {
                return true;
            }
        }
        return false;
    }

    std::size_t count(ConnectionState state) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& entry : entries_) {
            if (entry.first == state) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<ConnectionState, DisconnectReason>> entries_;
};

class RecordingHandler : public FrameHandler {
public:
    void on_frame(const Frame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        types_.push_back(frame.type());
    }

    void on_connection_lost() override {
        lost_ = true;
    }

    std::size_t received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return types_.size();
    }

    std::atomic<bool> lost_{false};

private:
    mutable std::mutex mutex_;
    std::vector<MessageType> types_;
};

JobId make_job_id(std::uint8_t fill) {
    JobId id;
    id.fill(fill);
    return id;
}

}

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        work_.emplace(boost::asio::make_work_guard(io_context_));
        io_thread_ = std::thread([this] { io_context_.run(); });

        listener_ = std::make_unique<Listener>(io_context_, "127.0.0.1", 0, std::chrono::milliseconds(2000));
        listener_->set_hello_handler([this](std::shared_ptr<Connection> connection, const HelloMessage& hello) {
            std::shared_ptr<ConnectionManager> server;
            {
                std::lock_guard<std::mutex> lock(server_mutex_);
                if (!server_) {
                    server_ = std::make_shared<ConnectionManager>(
                        io_context_, Peer{hello.peer_name, "", hello.listen_port}, settings("bob"));
                    server_->on_state_change([this](ConnectionState state, DisconnectReason reason) {
                        server_states_.record(state, reason);
                    });
                    server_->register_handler(make_job_id(7), server_handler_);
                }
                server = server_;
                hello_name_ = hello.peer_name;
            }
            server->adopt(std::move(connection), hello);
        });
        ASSERT_TRUE(listener_->start());
        ASSERT_NE(listener_->port(), 0);
    }

    void TearDown() override {
        if (client_) {
            client_->shutdown();
        }
        if (auto server = take_server()) {
            server->shutdown();
        }
        listener_->stop();

        work_.reset();
        io_context_.stop();
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    ConnectionSettings settings(const std::string& local_name) {
        ConnectionSettings s;
        s.local_name = local_name;
        s.listen_port = 0;
        s.connect_timeout = std::chrono::milliseconds(1000);
        s.heartbeat_interval = std::chrono::milliseconds(100);
        s.idle_timeout = std::chrono::milliseconds(2000);
        s.reconnect.initial_delay = std::chrono::milliseconds(20);
        s.reconnect.max_delay = std::chrono::milliseconds(50);
        s.reconnect.window = std::chrono::milliseconds(5000);
        return s;
    }

    void make_client(std::uint16_t port, ConnectionSettings s) {
        client_ = std::make_shared<ConnectionManager>(io_context_, Peer{"bob", "127.0.0.1", port}, std::move(s));
        client_->on_state_change([this](ConnectionState state, DisconnectReason reason) {
            client_states_.record(state, reason);
        });
    }

    std::shared_ptr<ConnectionManager> server() {
        std::lock_guard<std::mutex> lock(server_mutex_);
        return server_;
    }

    std::shared_ptr<ConnectionManager> take_server() {
        std::lock_guard<std::mutex> lock(server_mutex_);
        auto server = std::move(server_);
        server_.reset();
        return server;
    }

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread io_thread_;

    std::unique_ptr<Listener> listener_;
    std::mutex server_mutex_;
    std::shared_ptr<ConnectionManager> server_;
    std::string hello_name_;
    std::shared_ptr<RecordingHandler> server_handler_ = std::make_shared<RecordingHandler>();

    std::shared_ptr<ConnectionManager> client_;
    StateLog client_states_;
    StateLog server_states_;
};

TEST_F(ConnectionManagerTest, ConnectsAndIntroducesItself) {
    make_client(listener_->port(), settings("alice"));
    client_->connect();

    ASSERT_TRUE(wait_until([this] { return client_->is_connected(); }));
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        EXPECT_EQ(hello_name_, "alice");
    }
    EXPECT_EQ(server()->peer().host, "127.0.0.1");
    EXPECT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::CONNECTED, DisconnectReason::NONE);
    }));
}

TEST_F(ConnectionManagerTest, SendWithoutConnectionFails) {
    make_client(listener_->port(), settings("alice"));

    auto result = client_->send_frame(Frame::make(make_job_id(7), FileAbortMessage{ReasonCode::CANCELLED}));
    EXPECT_EQ(result.error, peerlink::core::ErrorCode::NOT_CONNECTED);
}

TEST_F(ConnectionManagerTest, RoutesFramesByJobId) {
    make_client(listener_->port(), settings("alice"));
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    ASSERT_TRUE(client_->send_frame(Frame::make(make_job_id(7), FileAbortMessage{ReasonCode::PAUSED})));
    // No handler for this one; it is dropped.
    ASSERT_TRUE(client_->send_frame(Frame::make(make_job_id(9), ChunkAckMessage{0, AckStatus::OK})));
    ASSERT_TRUE(client_->send_frame(Frame::make(make_job_id(7), FileAbortMessage{ReasonCode::CANCELLED})));

    EXPECT_TRUE(wait_until([this] { return server_handler_->received() == 2; }));
    EXPECT_TRUE(client_->is_connected());
}

TEST_F(ConnectionManagerTest, IncomingFactoryCreatesHandlers) {
    auto created = std::make_shared<RecordingHandler>();
    std::atomic<int> factory_calls{0};

    make_client(listener_->port(), settings("alice"));
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    server()->set_incoming_factory([&](const Frame&) -> std::shared_ptr<FrameHandler> {
        ++factory_calls;
        return created;
    });

    FileStartMessage start{"a.bin", 100, 4096, ChecksumAlgorithm::CRC32, 0, {}};
    ASSERT_TRUE(client_->send_frame(Frame::make(make_job_id(3), start)));
    ASSERT_TRUE(client_->send_frame(Frame::make(make_job_id(3), ChunkAckMessage{0, AckStatus::OK})));

    ASSERT_TRUE(wait_until([&] { return created->received() == 2; }));
    EXPECT_EQ(factory_calls.load(), 1);
    EXPECT_TRUE(server()->has_handler(make_job_id(3)));
}

TEST_F(ConnectionManagerTest, RefusedConnectReportsFailure) {
    Listener closed(io_context_, "127.0.0.1", 0);
    ASSERT_TRUE(closed.start());
    auto port = closed.port();
    closed.stop();

    make_client(port, settings("alice"));
    client_->connect();

    ASSERT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::CONNECT_FAILED);
    }));
    EXPECT_FALSE(client_->is_connected());
    EXPECT_FALSE(client_->is_reconnecting());
}

TEST_F(ConnectionManagerTest, ReconnectsAfterConnectionLoss) {
    make_client(listener_->port(), settings("alice"));
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    auto handler = std::make_shared<RecordingHandler>();
    client_->register_handler(make_job_id(5), handler);

    take_server()->shutdown();

    ASSERT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::CONNECTION_LOST);
    }));
    EXPECT_TRUE(wait_until([&] { return handler->lost_.load(); }));

    // The listener is still up, so the next attempt succeeds.
    ASSERT_TRUE(wait_until([this] { return client_states_.count(ConnectionState::CONNECTED) >= 2; }));
    EXPECT_TRUE(client_->is_connected());
    EXPECT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));
}

TEST_F(ConnectionManagerTest, ReplacedInboundConnectionInterruptsJobs) {
    make_client(listener_->port(), settings("alice"));
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));
    EXPECT_FALSE(server_handler_->lost_.load());

    // alice restarts and dials again while bob still holds the old socket.
    auto restarted = std::make_shared<ConnectionManager>(
        io_context_, Peer{"bob", "127.0.0.1", listener_->port()}, settings("alice"));
    restarted->connect();

    ASSERT_TRUE(wait_until([&] { return server_handler_->lost_.load(); }));
    client_->shutdown();

    EXPECT_TRUE(wait_until([&] { return restarted->is_connected(); }));
    EXPECT_TRUE(server()->is_connected());
    EXPECT_FALSE(server_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::CONNECTION_LOST));

    restarted->shutdown();
}

TEST_F(ConnectionManagerTest, GivesUpWhenPeerNeverReturns) {
    auto s = settings("alice");
    s.reconnect.window = std::chrono::milliseconds(300);
    make_client(listener_->port(), s);
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    listener_->stop();
    take_server()->shutdown();

    ASSERT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::RECONNECT_EXHAUSTED);
    }));
    EXPECT_TRUE(client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::CONNECT_FAILED));
    EXPECT_FALSE(client_->is_reconnecting());
    EXPECT_FALSE(client_->is_connected());
}

TEST_F(ConnectionManagerTest, RetryNowAfterGivingUp) {
    auto s = settings("alice");
    s.reconnect.window = std::chrono::milliseconds(200);
    make_client(listener_->port(), s);
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return server() && server()->is_connected(); }));

    auto port = listener_->port();
    listener_->stop();
    take_server()->shutdown();
    ASSERT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::RECONNECT_EXHAUSTED);
    }));

    listener_ = std::make_unique<Listener>(io_context_, "127.0.0.1", port);
    listener_->set_hello_handler([this](std::shared_ptr<Connection> connection, const HelloMessage& hello) {
        std::shared_ptr<ConnectionManager> server;
        {
            std::lock_guard<std::mutex> lock(server_mutex_);
            server_ = std::make_shared<ConnectionManager>(
                io_context_, Peer{hello.peer_name, "", hello.listen_port}, settings("bob"));
            server = server_;
        }
        server->adopt(std::move(connection), hello);
    });
    ASSERT_TRUE(listener_->start());

    client_->retry_now();
    EXPECT_TRUE(wait_until([this] { return client_->is_connected(); }));
}

TEST_F(ConnectionManagerTest, UserDisconnectStaysDown) {
    make_client(listener_->port(), settings("alice"));
    client_->connect();
    ASSERT_TRUE(wait_until([this] { return client_->is_connected(); }));

    client_->disconnect();

    ASSERT_TRUE(wait_until([this] {
        return client_states_.saw(ConnectionState::DISCONNECTED, DisconnectReason::USER_REQUESTED);
    }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_FALSE(client_->is_connected());
    EXPECT_FALSE(client_->is_reconnecting());
    EXPECT_EQ(client_states_.count(ConnectionState::CONNECTED), 1u);
}

TEST(ReconnectPolicyTest, DoublesUpToMaximum) {
    ReconnectPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(1000);
    policy.max_delay = std::chrono::milliseconds(30000);

    auto delay = policy.initial_delay;
    std::vector<long long> delays;
    for (int i = 0; i < 7; ++i) {
        delays.push_back(delay.count());
        delay = policy.next_delay(delay);
    }

    EXPECT_EQ(delays, (std::vector<long long>{1000, 2000, 4000, 8000, 16000, 30000, 30000}));
}
