#include "client.hpp"
#include "handshake.hpp"
#include "../util/logger.hpp"

#include <boost/asio/use_future.hpp>

namespace duplex::ws {

namespace {

frame make_frame(opcode op, std::vector<uint8_t> payload) {
    frame f;
    f.op = op;
    f.fin = true;
    f.payload = std::move(payload);
    return f;
}

std::vector<uint8_t> to_bytes(const std::string& str) {
    return {str.begin(), str.end()};
}

uint16_t abrupt_close_code(const boost::system::error_code& ec) {
    if (ec == error::protocol_error) return close_code::protocol_error;
    if (ec == error::message_too_big) return close_code::message_too_big;
    return close_code::abnormal;
}

std::future<void> failed_future(error e, const std::string& what) {
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(
        boost::system::system_error(make_error_code(e), what)));
    return promise.get_future();
}

}

std::string_view to_string(ready_state state) {
    switch (state) {
        case ready_state::connecting: return "connecting";
        case ready_state::open: return "open";
        case ready_state::closing: return "closing";
        case ready_state::closed: return "closed";
    }
    return "unknown";
}

awaitable<std::shared_ptr<client>> client::connect(boost::asio::io_context& io_context,
                                                   const std::string& url,
                                                   const headers& custom,
                                                   const client_options& options) {
    auto context = co_await ws::connect(io_context, url, custom, options);
    co_return std::make_shared<client>(std::move(context), options);
}

client::client(connection_context context, client_options options)
    : options_(std::move(options))
    , context_(std::move(context))
    , state_(std::make_shared<std::atomic<ready_state>>(context_.state))
    , strand_(boost::asio::make_strand(context_.socket->get_io_context()))
    , queue_(std::make_shared<write_queue>(context_.socket, context_.mask, strand_, state_))
    , assembler_(options_.max_message_size) {
    // frames can only be exchanged once the opening handshake completed
    if (*state_ != ready_state::open) {
        LOG_ERROR("cannot create websocket client over a {} connection", to_string(*state_));
        context_.socket->close();
        *state_ = ready_state::closed;
        throw_error(error::handshake_failure, "connection is not open");
    }
    LOG_DEBUG("websocket client created for {}", context_.url);
}

client::~client() {
    if (*state_ != ready_state::closed) {
        LOG_DEBUG("releasing websocket client, closing transport");
        *state_ = ready_state::closed;
        context_.socket->close();
    }
}

boost::asio::io_context& client::get_io_context() const {
    return context_.socket->get_io_context();
}

void client::start() {
    if (started_.exchange(true)) return;

    co_spawn(strand_,
        [self = shared_from_this()]() -> awaitable<void> {
            // breaks shared_ptr cycles of callbacks capturing this client
            struct cycle_guard {
                client& ref;
                ~cycle_guard() { ref.clear_callbacks(); }
            } guard{*self};

            if (*self->state_ != ready_state::open) co_return;

            if (self->on_open_) self->on_open_();
            co_await self->read_loop();
        },
        detached);
}

awaitable<void> client::read_loop() {
    while (*state_ != ready_state::closed) {
        frame f;
        boost::system::error_code ec;
        std::string what;

        try {
            f = co_await read_frame(*context_.socket, *context_.read_buffer, options_.max_frame_size);
        } catch (const boost::system::system_error& e) {
            ec = e.code();
            what = e.what();
        }

        if (ec) {
            handle_frame_error(ec, what);
            co_return;
        }

        switch (f.op) {
            case opcode::text:
            case opcode::binary:
            case opcode::continuation: {
                std::optional<message> msg;
                try {
                    msg = assembler_.push(std::move(f));
                } catch (const boost::system::system_error& e) {
                    ec = e.code();
                    what = e.what();
                }

                if (ec) {
                    handle_frame_error(ec, what);
                    co_return;
                }

                if (msg && on_message_) {
                    on_message_(msg->data, msg->binary);
                }
                break;
            }

            case opcode::ping: {
                LOG_DEBUG("received ping frame");
                if (on_ping_) on_ping_(f.payload);

                // the read loop never waits for the pong write
                queue_->enqueue(make_frame(opcode::pong, std::move(f.payload)),
                    [](const boost::system::error_code& pong_ec) {
                        if (pong_ec) LOG_WARNING("cannot send pong frame: {}", pong_ec.message());
                    });
                break;
            }

            case opcode::pong:
                LOG_DEBUG("received pong frame");
                if (on_pong_) on_pong_(f.payload);
                break;

            case opcode::close: {
                auto [code, reason] = parse_close_payload(f.payload);
                LOG_DEBUG("received close frame. code: {}, reason: '{}'", code, reason);

                if (*state_ == ready_state::open) *state_ = ready_state::closing;

                // echo the close frame and release the transport. When we
                // started the close ourselves this is the peer's answer.
                co_await close_impl(code, reason);
                ensure_closed(code, reason);

                if (on_error_) on_error_(make_error_code(error::closed_by_peer), code, reason);
                co_return;
            }
        }
    }
}

void client::handle_frame_error(const boost::system::error_code& ec, const std::string& what) {
    // the transport was released by a local close
    if (*state_ == ready_state::closed) {
        LOG_DEBUG("websocket read loop finished");
        return;
    }

    if (ec == error::connection_error) {
        LOG_DEBUG("websocket connection lost: {}", what);
    } else {
        LOG_ERROR("closing websocket after frame error: {}", what);
    }

    auto code = abrupt_close_code(ec);
    ensure_closed(code, what);
    if (on_error_) on_error_(ec, code, what);
}

void client::ensure_closed(uint16_t code, const std::string& reason) {
    if (*state_ == ready_state::closed) return;

    context_.socket->close();
    *state_ = ready_state::closed;
    assembler_.reset();

    LOG_INFO("websocket {} closed. code: {}", context_.url, code);

    if (on_close_) on_close_(code, reason);
}

void client::clear_callbacks() {
    on_open_ = nullptr;
    on_message_ = nullptr;
    on_ping_ = nullptr;
    on_pong_ = nullptr;
    on_close_ = nullptr;
    on_error_ = nullptr;
}

awaitable<void> client::close_impl(uint16_t code, std::string reason) {
    if (*state_ == ready_state::closed || close_sent_) co_return;
    close_sent_ = true;

    if (*state_ == ready_state::open) *state_ = ready_state::closing;

    if (reason.size() > MAX_CONTROL_PAYLOAD - 2) {
        // cut on a code point boundary, never inside a multi-byte utf-8 sequence
        auto size = MAX_CONTROL_PAYLOAD - 2;
        while (size > 0 && (static_cast<uint8_t>(reason[size]) & 0xC0) == 0x80) --size;
        LOG_WARNING("close reason truncated to {} bytes", size);
        reason.resize(size);
    }

    LOG_DEBUG("sending close frame. code: {}", code);

    // 1005 is never sent on the wire, it is answered with an empty close frame
    auto payload = code == close_code::no_status ? std::vector<uint8_t>{} : make_close_payload(code, reason);

    try {
        co_await queue_->async_enqueue(make_frame(opcode::close, std::move(payload)), use_awaitable);
        LOG_DEBUG("close frame sent");
    } catch (const boost::system::system_error& e) {
        // the transport is released anyway
        LOG_WARNING("cannot send close frame: {}", e.code().message());
    }

    ensure_closed(code, reason);
}

// ============================================
// Future API
// ============================================

std::future<void> client::send(std::string text) {
    return queue_->async_enqueue(make_frame(opcode::text, to_bytes(text)), boost::asio::use_future);
}

std::future<void> client::send(std::vector<uint8_t> data) {
    return queue_->async_enqueue(make_frame(opcode::binary, std::move(data)), boost::asio::use_future);
}

std::future<void> client::ping(std::vector<uint8_t> payload) {
    if (payload.size() > MAX_CONTROL_PAYLOAD) {
        return failed_future(error::protocol_error, "ping payload too big");
    }
    return queue_->async_enqueue(make_frame(opcode::ping, std::move(payload)), boost::asio::use_future);
}

std::future<void> client::ping(const std::string& payload) {
    return ping(to_bytes(payload));
}

std::future<void> client::close(uint16_t code, std::string reason) {
    return co_spawn(strand_,
        [self = shared_from_this(), code, reason = std::move(reason)]() mutable -> awaitable<void> {
            co_await self->close_impl(code, std::move(reason));
        },
        boost::asio::use_future);
}

// ============================================
// Coroutine API
// ============================================

awaitable<void> client::send_async(std::string text) {
    co_await queue_->async_enqueue(make_frame(opcode::text, to_bytes(text)), use_awaitable);
}

awaitable<void> client::send_async(std::vector<uint8_t> data) {
    co_await queue_->async_enqueue(make_frame(opcode::binary, std::move(data)), use_awaitable);
}

awaitable<void> client::ping_async(std::vector<uint8_t> payload) {
    if (payload.size() > MAX_CONTROL_PAYLOAD) {
        throw_error(error::protocol_error, "ping payload too big");
    }
    co_await queue_->async_enqueue(make_frame(opcode::ping, std::move(payload)), use_awaitable);
}

awaitable<void> client::close_async(uint16_t code, std::string reason) {
    co_await co_spawn(strand_,
        [self = shared_from_this(), code, reason = std::move(reason)]() mutable -> awaitable<void> {
            co_await self->close_impl(code, std::move(reason));
        },
        use_awaitable);
}

}
