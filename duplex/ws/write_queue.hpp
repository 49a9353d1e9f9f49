#ifndef DUPLEX_WS_WRITE_QUEUE_HPP
#define DUPLEX_WS_WRITE_QUEUE_HPP

#include <atomic>
#include <deque>
#include <functional>
#include <memory>

#include <boost/asio/async_result.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include "../asio/sockets/socket.hpp"
#include "../util/types.hpp"
#include "connection_context.hpp"
#include "frame.hpp"

namespace duplex::ws {

/**
 * Serializes every outbound frame of a connection. Frames are written in the
 * order they were enqueued and only one write is in flight at any time. A
 * failed write completes its own entry with the error and the queue keeps
 * draining.
 *
 * All members except async_enqueue must be called from the strand.
 */
class write_queue : public std::enable_shared_from_this<write_queue> {

public:
    using executor_type = boost::asio::strand<boost::asio::io_context::executor_type>;
    using completion_handler = std::function<void(const boost::system::error_code&)>;

    write_queue(std::shared_ptr<asio::socket> socket,
                const mask_key& mask,
                executor_type executor,
                shared_ready_state state);

    /**
     * Append a frame. The handler is called with the write result, or with
     * error::already_closed without touching the transport when the
     * connection is closed.
     */
    void enqueue(frame f, completion_handler handler);

    /**
     * Thread-safe enqueue completing through an asio completion token, i.e.
     * use_awaitable or use_future. Signature: void(error_code).
     */
    template<typename CompletionToken>
    auto async_enqueue(frame f, CompletionToken&& token) {
        return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code)>(
            [self = shared_from_this()](auto handler, frame f) {
                using handler_type = std::decay_t<decltype(handler)>;
                auto shared_handler = std::make_shared<handler_type>(std::move(handler));
                boost::asio::dispatch(self->executor_, [self, f = std::move(f), shared_handler]() mutable {
                    self->enqueue(std::move(f), [shared_handler](const boost::system::error_code& ec) {
                        auto ex = boost::asio::get_associated_executor(*shared_handler);
                        boost::asio::post(ex, [shared_handler, ec]() {
                            std::move(*shared_handler)(ec);
                        });
                    });
                });
            },
            token, std::move(f));
    }

    size_t size() const { return out_queue_.size(); }
    bool writing() const { return writing_; }
    const executor_type& get_executor() const { return executor_; }

private:
    struct entry {
        frame f;
        completion_handler handler;
    };

    void process_out_queue();

    std::shared_ptr<asio::socket> socket_;
    mask_key mask_;
    executor_type executor_;
    shared_ready_state state_;
    std::deque<entry> out_queue_;
    bool writing_ = false;
};

}

#endif
