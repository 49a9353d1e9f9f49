#ifndef DUPLEX_WS_HANDSHAKE_HPP
#define DUPLEX_WS_HANDSHAKE_HPP

#include <memory>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

#include "../asio/sockets/socket.hpp"
#include "../util/types.hpp"
#include "client_options.hpp"
#include "connection_context.hpp"
#include "headers.hpp"

namespace duplex::ws {

// GUID for Sec-WebSocket-Accept calculation
inline constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

// Limit for the http response header block
static constexpr size_t MAX_HEADERS_SIZE = 8*1024;

// URL components for WebSocket connections
struct url_components {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    bool secure = false;
};

/**
 * Parse a ws://, wss://, http:// or https:// url. Throws system_error with
 * error::unsupported_protocol for other schemes and error::invalid_url when
 * the url cannot be parsed.
 */
url_components parse_url(const std::string& url);

/// Random 16 byte key, base64 encoded
std::string generate_websocket_key();

/// base64(sha1(key + GUID))
std::string compute_accept_key(const std::string& key);

/**
 * Standard upgrade headers followed by the caller headers. A caller header
 * replaces a standard one with the same name.
 */
headers build_request_headers(const url_components& url, const std::string& key,
                              const headers& custom, const client_options& options);

/// Serialized http upgrade request
std::string build_request(const url_components& url, const headers& request_headers);

struct handshake_response {
    unsigned short status_code = 0;
    std::string reason;
    headers response_headers;
};

/**
 * Parse the status line and headers of an http response (without the body).
 * Throws system_error with error::handshake_failure when malformed.
 */
handshake_response parse_response(std::string_view head);

/**
 * Check status 101, the Upgrade and Connection headers and the accept key
 * for the key that was sent. Throws system_error with error::handshake_failure.
 */
void validate_response(const handshake_response& response, const std::string& sent_key);

/**
 * Run the opening handshake over an already connected socket. The socket is
 * closed before any failure propagates.
 */
awaitable<connection_context> handshake(std::shared_ptr<asio::socket> socket,
                                        const url_components& url,
                                        const headers& custom,
                                        const client_options& options = {});

/**
 * Open a plain or tls transport for the url and run the opening handshake.
 * Throws system_error with error::unsupported_protocol, error::invalid_url or
 * error::handshake_failure. No transport is left open on failure.
 */
awaitable<connection_context> connect(boost::asio::io_context& io_context,
                                      const std::string& url,
                                      const headers& custom = {},
                                      const client_options& options = {});

}

#endif
