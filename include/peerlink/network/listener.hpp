#pragma once

#include "peerlink/network/connection.hpp"
#include "peerlink/core/result.hpp"
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <functional>
#include <chrono>
#include <mutex>
#include <map>
#include <atomic>

namespace peerlink::network {

constexpr std::chrono::milliseconds DEFAULT_HELLO_TIMEOUT{5000};

// Accepts inbound sockets and holds each one until it introduces itself with
// HELLO, then hands it over. Sockets that stay silent are closed.
class Listener {
public:
    using HelloHandler = std::function<void(std::shared_ptr<Connection>, const HelloMessage&)>;

    Listener(boost::asio::io_context& io_context,
             std::string address,
             std::uint16_t port,
             std::chrono::milliseconds hello_timeout = DEFAULT_HELLO_TIMEOUT);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Must be set before start(). Runs on the accepted socket's strand.
    void set_hello_handler(HelloHandler handler) { hello_handler_ = std::move(handler); }

    core::Result start();
    void stop();

    bool is_running() const { return running_; }

    // The bound port; differs from the configured one when that was 0.
    std::uint16_t port() const { return bound_port_; }

private:
    struct Pending {
        std::shared_ptr<Connection> connection;
        std::shared_ptr<boost::asio::steady_timer> timer;
    };

    void do_accept();
    void handle_new_connection(tcp::socket socket);
    void release(const std::shared_ptr<Connection>& connection);

    boost::asio::io_context& io_context_;
    std::string address_;
    std::uint16_t port_;
    std::uint16_t bound_port_;
    std::chrono::milliseconds hello_timeout_;
    tcp::acceptor acceptor_;
    std::atomic<bool> running_;
    HelloHandler hello_handler_;

    std::mutex pending_mutex_;
    std::map<Connection*, Pending> pending_;
};

}
