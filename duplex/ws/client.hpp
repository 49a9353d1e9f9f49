#ifndef DUPLEX_WS_CLIENT_HPP
#define DUPLEX_WS_CLIENT_HPP

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/strand.hpp>

#include "../util/types.hpp"
#include "client_options.hpp"
#include "connection_context.hpp"
#include "error.hpp"
#include "frame.hpp"
#include "headers.hpp"
#include "message_assembler.hpp"
#include "write_queue.hpp"

namespace duplex::ws {

/**
 * Client side of an established WebSocket connection.
 *
 * Owns the transport for its whole lifetime, runs the read loop, answers pings
 * and performs the close handshake. Every outbound frame goes through a single
 * write queue, so concurrent send, ping and close calls never interleave on
 * the wire. All protocol state lives on one strand; callbacks are invoked from
 * it and must not block on the futures returned by this class.
 *
 * Usage:
 *   boost::asio::io_context io;
 *   co_spawn(io, [&]() -> awaitable<void> {
 *       auto ws = co_await ws::client::connect(io, "wss://server.com/path", {{"Authorization", "Bearer x"}});
 *       ws->on_message([](const std::string& data, bool binary) { ... });
 *       ws->start();
 *       co_await ws->send_async("hello");
 *   }, detached);
 *   io.run();
 */
class client : public std::enable_shared_from_this<client> {
public:
    using open_callback = std::function<void()>;
    using message_callback = std::function<void(const std::string&, bool binary)>;
    using control_callback = std::function<void(const std::vector<uint8_t>&)>;
    using close_callback = std::function<void(uint16_t code, const std::string& reason)>;
    using error_callback = std::function<void(const boost::system::error_code&, uint16_t code, const std::string& reason)>;

    /**
     * Connect to the url sending the given extra headers and build a client
     * over the resulting connection. The read loop is not started yet, so
     * callbacks can be registered before calling start().
     */
    static awaitable<std::shared_ptr<client>> connect(boost::asio::io_context& io_context,
                                                      const std::string& url,
                                                      const headers& custom = {},
                                                      const client_options& options = {});

    /**
     * Build a client over an already negotiated connection. Throws
     * system_error with error::handshake_failure, closing the transport, when
     * the context is not open.
     */
    explicit client(connection_context context, client_options options = {});

    ~client();

    client(const client&) = delete;
    client& operator=(const client&) = delete;

    // ============================================
    // Notification sink, one handler per event
    // ============================================

    void on_open(open_callback callback) { on_open_ = std::move(callback); }
    void on_message(message_callback callback) { on_message_ = std::move(callback); }
    void on_ping(control_callback callback) { on_ping_ = std::move(callback); }
    void on_pong(control_callback callback) { on_pong_ = std::move(callback); }
    void on_close(close_callback callback) { on_close_ = std::move(callback); }
    void on_error(error_callback callback) { on_error_ = std::move(callback); }

    /**
     * Notify open and start the read loop. Only the first call has effect.
     */
    void start();

    // ============================================
    // Future API, callable from any thread
    // ============================================

    /// text frame
    std::future<void> send(std::string text);

    /// binary frame
    std::future<void> send(std::vector<uint8_t> data);

    std::future<void> ping(std::vector<uint8_t> payload = {});
    std::future<void> ping(const std::string& payload);

    /**
     * Send a Close frame and release the transport, whatever the write
     * result is. Does nothing if the connection is already closed or closing.
     */
    std::future<void> close(uint16_t code = close_code::normal, std::string reason = "");

    // ============================================
    // Coroutine API
    // ============================================

    awaitable<void> send_async(std::string text);
    awaitable<void> send_async(std::vector<uint8_t> data);
    awaitable<void> ping_async(std::vector<uint8_t> payload = {});
    awaitable<void> close_async(uint16_t code = close_code::normal, std::string reason = "");

    // ============================================
    // State
    // ============================================

    ready_state get_ready_state() const { return *state_; }
    bool closed() const { return *state_ == ready_state::closed; }
    const std::string& get_url() const { return context_.url; }
    boost::asio::io_context& get_io_context() const;

private:
    awaitable<void> read_loop();
    awaitable<void> close_impl(uint16_t code, std::string reason);
    void handle_frame_error(const boost::system::error_code& ec, const std::string& what);
    void ensure_closed(uint16_t code, const std::string& reason);
    void clear_callbacks();

    client_options options_;
    connection_context context_;
    shared_ready_state state_;
    write_queue::executor_type strand_;
    std::shared_ptr<write_queue> queue_;
    message_assembler assembler_;

    std::atomic<bool> started_{false};
    bool close_sent_ = false;

    // Callbacks
    open_callback on_open_;
    message_callback on_message_;
    control_callback on_ping_;
    control_callback on_pong_;
    close_callback on_close_;
    error_callback on_error_;
};

}

#endif
