#pragma once

#include "peerlink/network/protocol.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <memory>
#include <string>
#include <functional>
#include <chrono>
#include <deque>
#include <mutex>
#include <atomic>

namespace peerlink::network {

using boost::asio::ip::tcp;

enum class CloseReason {
    LOCAL,          // close() was called
    PEER_CLOSED,
    SOCKET_ERROR,
    PROTOCOL_ERROR
};

const char* to_string(CloseReason reason);

// One framed TCP socket. All socket work runs on the socket's executor, which
// is expected to be a strand; send_frame() and close() may be called from any
// thread.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using FrameCallback = std::function<void(Frame)>;
    using CloseCallback = std::function<void(std::shared_ptr<Connection>, CloseReason)>;

    explicit Connection(tcp::socket socket, bool initiated_locally = false);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void start();
    void close();

    bool send_frame(Frame frame);

    template<MessagePayload T>
    bool send_message(const JobId& job_id, const T& message) {
        return send_frame(Frame::make(job_id, message));
    }

    // Handlers are invoked on the socket's executor.
    void set_handlers(FrameCallback on_frame, CloseCallback on_close);

    bool is_open() const { return open_.load(); }
    bool initiated_locally() const { return initiated_locally_; }
    const std::string& remote_endpoint() const { return remote_endpoint_; }
    std::string remote_address() const;

    std::chrono::steady_clock::time_point last_receive() const;
    std::chrono::steady_clock::time_point last_send() const;

    tcp::socket::executor_type get_executor() { return socket_.get_executor(); }

private:
    void do_read_header();
    void do_read_payload(const MessageHeader& header);
    void do_write();
    void do_close(CloseReason reason);
    void handle_frame(Frame frame);
    void handle_error(const boost::system::error_code& error);

    static std::int64_t now_ticks();

    tcp::socket socket_;
    bool initiated_locally_;
    std::string remote_endpoint_;
    std::atomic<bool> open_;
    std::atomic<std::int64_t> last_receive_;
    std::atomic<std::int64_t> last_send_;

    std::mutex handlers_mutex_;
    FrameCallback frame_callback_;
    CloseCallback close_callback_;

    std::array<std::uint8_t, MESSAGE_HEADER_SIZE> read_header_buffer_;
    std::vector<std::uint8_t> read_payload_buffer_;

    std::deque<std::vector<std::uint8_t>> write_queue_;
    bool write_in_progress_;
};

using ConnectHandler = std::function<void(const boost::system::error_code&, std::shared_ptr<Connection>)>;

// Resolves host:port and connects a socket bound to a fresh strand. The handler
// runs exactly once, with either an open Connection (not yet started) or an error.
void async_connect(boost::asio::io_context& io_context,
                   const std::string& host,
                   std::uint16_t port,
                   std::chrono::milliseconds timeout,
                   ConnectHandler handler);

}
