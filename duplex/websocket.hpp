#ifndef DUPLEX_WEBSOCKET_HPP
#define DUPLEX_WEBSOCKET_HPP

// WebSocket client
#include <duplex/ws/client.hpp>             // client class, read loop and send/ping/close
#include <duplex/ws/handshake.hpp>          // connect() and the opening handshake
#include <duplex/ws/client_options.hpp>
#include <duplex/ws/headers.hpp>            // custom handshake headers
#include <duplex/ws/error.hpp>              // error codes and close codes

// Logging setup
#include <duplex/util/logger.hpp>

#endif // DUPLEX_WEBSOCKET_HPP
