#ifndef DUPLEX_WS_CONNECTION_CONTEXT_HPP
#define DUPLEX_WS_CONNECTION_CONTEXT_HPP

#include <atomic>
#include <memory>
#include <string>
#include <boost/asio/streambuf.hpp>

#include "../asio/sockets/socket.hpp"
#include "frame.hpp"

namespace duplex::ws {

enum class ready_state : uint8_t {
    connecting = 0,
    open = 1,
    closing = 2,
    closed = 3
};

std::string_view to_string(ready_state state);

// ready state shared by a client and the queues writing on its behalf
using shared_ready_state = std::shared_ptr<std::atomic<ready_state>>;

/**
 * Everything a websocket needs once the opening handshake succeeded: the
 * transport, the bytes already received past the http response and the mask
 * used for all outbound frames.
 */
struct connection_context {
    std::shared_ptr<asio::socket> socket;
    std::unique_ptr<boost::asio::streambuf> read_buffer = std::make_unique<boost::asio::streambuf>();
    mask_key mask = generate_mask();
    ready_state state = ready_state::open;
    std::string url;
};

}

#endif
