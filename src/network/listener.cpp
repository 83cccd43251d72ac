#include "peerlink/network/listener.hpp"
#include "peerlink/core/logger.hpp"

namespace peerlink::network {

Listener::Listener(boost::asio::io_context& io_context,
                   std::string address,
                   std::uint16_t port,
                   std::chrono::milliseconds hello_timeout)
    : io_context_(io_context)
    , address_(std::move(address))
    , port_(port)
    , bound_port_(0)
    , hello_timeout_(hello_timeout)
    , acceptor_(io_context)
    , running_(false) {
}

Listener::~Listener() {
    stop();
}

core::Result Listener::start() {
    if (running_) {
        LOG_WARN("Listener already running");
        return core::Result(core::ErrorCode::INVALID_STATE, "Listener already running");
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(address_, ec);
    if (ec) {
        return core::Result(core::ErrorCode::INVALID_ARGUMENT, "Invalid listen address: " + address_);
    }

    tcp::endpoint endpoint(address, port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);

    if (ec) {
        LOG_ERROR("Failed to listen on {}:{}: {}", address_, port_, ec.message());
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        return core::Result(core::ErrorCode::CONNECTION_REFUSED,
                            "Cannot listen on " + address_ + ":" + std::to_string(port_) + ": " + ec.message());
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    do_accept();

    LOG_INFO("Listening on {}:{}", address_, bound_port_);
    return core::Result();
}

void Listener::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Stopping listener on port {}", bound_port_);

    boost::system::error_code ec;
    acceptor_.close(ec);

    std::map<Connection*, Pending> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending.swap(pending_);
    }

    for (auto& [_, entry] : pending) {
        entry.timer->cancel();
        entry.connection->close();
    }
}

void Listener::do_accept() {
    if (!running_) {
        return;
    }

    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (!ec && running_) {
                handle_new_connection(std::move(socket));
                do_accept();
            } else if (ec != boost::asio::error::operation_aborted && running_) {
                LOG_ERROR("Accept error: {}", ec.message());
                do_accept();
            }
        });
}

void Listener::handle_new_connection(tcp::socket socket) {
    boost::system::error_code ec;
    socket.set_option(tcp::no_delay(true), ec);

    auto connection = std::make_shared<Connection>(std::move(socket), false);
    auto timer = std::make_shared<boost::asio::steady_timer>(connection->get_executor());

    LOG_INFO("Accepted connection from {}", connection->remote_endpoint());

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_[connection.get()] = Pending{connection, timer};
    }

    std::weak_ptr<Connection> weak = connection;
    timer->expires_after(hello_timeout_);
    timer->async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (auto conn = weak.lock()) {
            LOG_WARN("No HELLO from {} within timeout, closing", conn->remote_endpoint());
            release(conn);
            conn->close();
        }
    });

    connection->set_handlers(
        [this, weak, timer](Frame frame) {
            auto conn = weak.lock();
            if (!conn) {
                return;
            }

            if (frame.type() != MessageType::HELLO) {
                throw ProtocolError(std::string("Expected HELLO, got ") + to_string(frame.type()));
            }

            auto hello = frame.decode<HelloMessage>();
            timer->cancel();
            release(conn);

            LOG_INFO("Peer '{}' introduced itself from {}", hello.peer_name, conn->remote_endpoint());

            if (hello_handler_) {
                hello_handler_(conn, hello);
            } else {
                conn->close();
            }
        },
        [this, timer](std::shared_ptr<Connection> conn, CloseReason reason) {
            timer->cancel();
            release(conn);
            LOG_DEBUG("Unidentified connection {} {}", conn->remote_endpoint(), to_string(reason));
        });

    connection->start();
}

void Listener::release(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(connection.get());
}

}
