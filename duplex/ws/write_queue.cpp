#include "write_queue.hpp"
#include "error.hpp"
#include "../util/logger.hpp"

namespace duplex::ws {

write_queue::write_queue(std::shared_ptr<asio::socket> socket,
                         const mask_key& mask,
                         executor_type executor,
                         shared_ready_state state)
    : socket_(std::move(socket))
    , mask_(mask)
    , executor_(std::move(executor))
    , state_(std::move(state)) {
}

void write_queue::enqueue(frame f, completion_handler handler) {
    if (*state_ == ready_state::closed) {
        LOG_DEBUG("rejecting {} frame, socket has already been closed", to_string(f.op));
        if (handler) handler(make_error_code(error::already_closed));
        return;
    }

    LOG_TRACE("adding {} frame to websocket queue", to_string(f.op));
    out_queue_.push_back(entry{std::move(f), std::move(handler)});
    process_out_queue();
}

void write_queue::process_out_queue() {
    if (out_queue_.empty() || writing_) return;
    writing_ = true;

    co_spawn(executor_,
        [this, self = shared_from_this()]() -> awaitable<void> {
            while (!out_queue_.empty()) {
                LOG_TRACE("handling websocket write, remaining in queue: {}", out_queue_.size());

                boost::system::error_code ec;
                try {
                    co_await write_frame(*socket_, out_queue_.front().f, mask_);
                } catch (const boost::system::system_error& e) {
                    ec = e.code();
                }

                auto handler = std::move(out_queue_.front().handler);
                out_queue_.pop_front();
                if (handler) handler(ec);
            }
            writing_ = false;
        },
        detached);
}

}
