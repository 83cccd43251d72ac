#include "peerlink/network/connection.hpp"
#include "peerlink/core/logger.hpp"
#include <boost/asio/write.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/connect.hpp>

namespace peerlink::network {

const char* to_string(CloseReason reason) {
    switch (reason) {
        case CloseReason::LOCAL:          return "closed locally";
        case CloseReason::PEER_CLOSED:    return "closed by peer";
        case CloseReason::SOCKET_ERROR:   return "socket error";
        case CloseReason::PROTOCOL_ERROR: return "protocol error";
    }
    return "unknown";
}

Connection::Connection(tcp::socket socket, bool initiated_locally)
    : socket_(std::move(socket))
    , initiated_locally_(initiated_locally)
    , open_(true)
    , last_receive_(now_ticks())
    , last_send_(now_ticks())
    , write_in_progress_(false) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (!ec) {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    } else {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    }

    LOG_DEBUG("Connection {} {}", initiated_locally_ ? "to" : "from", remote_endpoint_);
}

Connection::~Connection() {
    LOG_DEBUG("Connection to {} destroyed", remote_endpoint_);
}

void Connection::start() {
    auto self = shared_from_this();
    boost::asio::dispatch(socket_.get_executor(), [this, self]() {
        do_read_header();
    });
}

void Connection::close() {
    auto self = shared_from_this();
    boost::asio::dispatch(socket_.get_executor(), [this, self]() {
        do_close(CloseReason::LOCAL);
    });
}

bool Connection::send_frame(Frame frame) {
    if (!open_) {
        LOG_DEBUG("Dropping {} for closed connection {}", to_string(frame.type()), remote_endpoint_);
        return false;
    }

    auto self = shared_from_this();
    boost::asio::post(socket_.get_executor(), [this, self, data = frame.encode()]() mutable {
        if (!open_) {
            return;
        }

        write_queue_.push_back(std::move(data));
        if (!write_in_progress_) {
            do_write();
        }
    });

    return true;
}

void Connection::set_handlers(FrameCallback on_frame, CloseCallback on_close) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    frame_callback_ = std::move(on_frame);
    close_callback_ = std::move(on_close);
}

std::string Connection::remote_address() const {
    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    return ec ? std::string("unknown") : endpoint.address().to_string();
}

std::chrono::steady_clock::time_point Connection::last_receive() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_receive_.load()));
}

std::chrono::steady_clock::time_point Connection::last_send() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_send_.load()));
}

std::int64_t Connection::now_ticks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

void Connection::do_read_header() {
    if (!open_) {
        return;
    }

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_header_buffer_),
        [this, self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            last_receive_ = now_ticks();

            MessageHeader header;
            try {
                header = MessageHeader::deserialize(read_header_buffer_);
            } catch (const ProtocolError& e) {
                LOG_ERROR("Invalid frame header from {}: {}", remote_endpoint_, e.what());
                do_close(CloseReason::PROTOCOL_ERROR);
                return;
            }

            if (header.payload_size > 0) {
                do_read_payload(header);
            } else {
                handle_frame(Frame{header, {}});
                do_read_header();
            }
        });
}

void Connection::do_read_payload(const MessageHeader& header) {
    read_payload_buffer_.resize(header.payload_size);

    auto self = shared_from_this();
    boost::asio::async_read(socket_,
        boost::asio::buffer(read_payload_buffer_),
        [this, self, header](boost::system::error_code ec, std::size_t) {
            if (ec) {
                handle_error(ec);
                return;
            }

            last_receive_ = now_ticks();
            handle_frame(Frame{header, std::move(read_payload_buffer_)});
            read_payload_buffer_.clear();
            do_read_header();
        });
}

void Connection::do_write() {
    if (write_queue_.empty() || !open_) {
        return;
    }

    write_in_progress_ = true;
    auto& message = write_queue_.front();

    auto self = shared_from_this();
    boost::asio::async_write(socket_,
        boost::asio::buffer(message),
        [this, self](boost::system::error_code ec, std::size_t) {
            write_in_progress_ = false;

            if (ec) {
                handle_error(ec);
                return;
            }

            last_send_ = now_ticks();
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            }
        });
}

void Connection::handle_frame(Frame frame) {
    if (!open_) {
        return;
    }

    LOG_TRACE("Received {} ({} bytes) from {}", to_string(frame.type()), frame.payload.size(), remote_endpoint_);

    FrameCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = frame_callback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(std::move(frame));
    } catch (const ProtocolError& e) {
        LOG_ERROR("Undecodable frame from {}: {}", remote_endpoint_, e.what());
        do_close(CloseReason::PROTOCOL_ERROR);
    }
}

void Connection::handle_error(const boost::system::error_code& error) {
    if (!open_) {
        return;
    }

    if (error == boost::asio::error::eof || error == boost::asio::error::connection_reset) {
        LOG_INFO("Connection to {} closed by peer", remote_endpoint_);
        do_close(CloseReason::PEER_CLOSED);
    } else {
        LOG_WARN("Connection error with {}: {}", remote_endpoint_, error.message());
        do_close(CloseReason::SOCKET_ERROR);
    }
}

void Connection::do_close(CloseReason reason) {
    if (!open_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Closing connection to {} ({})", remote_endpoint_, to_string(reason));

    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    write_queue_.clear();

    CloseCallback callback;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        callback = std::move(close_callback_);
        frame_callback_ = nullptr;
    }

    if (callback) {
        callback(shared_from_this(), reason);
    }
}

namespace {

struct ConnectAttempt : std::enable_shared_from_this<ConnectAttempt> {
    ConnectAttempt(boost::asio::io_context& io_context, ConnectHandler on_done)
        : strand(boost::asio::make_strand(io_context))
        , resolver(strand)
        , socket(strand)
        , timer(strand)
        , handler(std::move(on_done))
        , timed_out(false)
        , finished(false) {}

    void start(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
        auto self = shared_from_this();

        timer.expires_after(timeout);
        timer.async_wait([self](const boost::system::error_code& ec) {
            if (ec || self->finished) {
                return;
            }
            self->timed_out = true;
            self->resolver.cancel();
            boost::system::error_code ignored;
            self->socket.close(ignored);
        });

        resolver.async_resolve(host, std::to_string(port),
            [self](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                if (ec) {
                    self->finish(ec);
                    return;
                }

                boost::asio::async_connect(self->socket, results,
                    [self](const boost::system::error_code& ec, const tcp::endpoint&) {
                        if (ec) {
                            self->finish(ec);
                            return;
                        }

                        boost::system::error_code nodelay_ec;
                        self->socket.set_option(tcp::no_delay(true), nodelay_ec);

                        self->finish({}, std::make_shared<Connection>(std::move(self->socket), true));
                    });
            });
    }

    void finish(boost::system::error_code ec, std::shared_ptr<Connection> connection = nullptr) {
        if (finished) {
            return;
        }
        finished = true;
        timer.cancel();

        if (timed_out) {
            ec = boost::asio::error::timed_out;
            connection.reset();
        }

        handler(ec, std::move(connection));
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    tcp::resolver resolver;
    tcp::socket socket;
    boost::asio::steady_timer timer;
    ConnectHandler handler;
    bool timed_out;
    bool finished;
};

}

void async_connect(boost::asio::io_context& io_context,
                   const std::string& host,
                   std::uint16_t port,
                   std::chrono::milliseconds timeout,
                   ConnectHandler handler) {
    LOG_DEBUG("Connecting to {}:{}", host, port);
    auto attempt = std::make_shared<ConnectAttempt>(io_context, std::move(handler));
    attempt->start(host, port, timeout);
}

}
