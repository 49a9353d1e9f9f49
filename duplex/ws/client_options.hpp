#ifndef DUPLEX_WS_CLIENT_OPTIONS_HPP
#define DUPLEX_WS_CLIENT_OPTIONS_HPP

#include <chrono>
#include <cstdint>
#include <string>

namespace duplex::ws {

struct client_options {
    /// maximum time for resolving, connecting and the tls handshake
    std::chrono::seconds connect_timeout{60};

    /// inbound frames above this payload size close the connection
    uint64_t max_frame_size = 16*1024*1024;

    /// inbound messages above this size close the connection
    size_t max_message_size = 16*1024*1024;

    /// verify the server certificate and host name on wss connections
    bool verify_peer = true;

    /// additional CA bundle (PEM) used to verify the server, empty for none
    std::string ca_file;

    /// sent as User-Agent unless the caller supplies one, empty for none
    std::string user_agent = "duplex";
};

}

#endif
