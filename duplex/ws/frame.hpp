#ifndef DUPLEX_WS_FRAME_HPP
#define DUPLEX_WS_FRAME_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/streambuf.hpp>

#include "../asio/sockets/socket.hpp"
#include "../util/types.hpp"

namespace duplex::ws {

enum class opcode : uint8_t {
    continuation = 0x0,
    text = 0x1,
    binary = 0x2,
    close = 0x8,
    ping = 0x9,
    pong = 0xA
};

static constexpr int MASK_SIZE_BYTES = 4;
static constexpr size_t MAX_CONTROL_PAYLOAD = 125;

using mask_key = std::array<uint8_t, MASK_SIZE_BYTES>;

/**
 * One wire frame. The mask is only filled for inbound frames that were sent
 * masked; outbound frames are masked with the connection mask on encoding.
 */
struct frame {
    opcode op = opcode::text;
    bool fin = true;
    std::optional<mask_key> mask;
    std::vector<uint8_t> payload;
};

inline bool is_control(opcode op) {
    return static_cast<uint8_t>(op) >= 0x8;
}

std::string_view to_string(opcode op);

/// 4 random bytes used to mask every outbound frame of a connection
mask_key generate_mask();

/// xor the buffer with the mask, starting at mask offset 0
void apply_mask(uint8_t buffer[], size_t size, const mask_key& mask);

/**
 * Serialize a client frame: header, payload length (7, 16 or 64 bits), the
 * mask and the masked payload.
 */
std::vector<uint8_t> encode_frame(const frame& f, const mask_key& mask);

/**
 * Write one frame to the socket. Throws system_error with
 * error::connection_error when the transport fails.
 */
awaitable<void> write_frame(asio::socket& socket, const frame& f, const mask_key& mask);

/**
 * Read one frame, consuming bytes already buffered in read_buffer before
 * reading from the socket. Throws system_error with error::protocol_error on
 * invalid opcodes, reserved bits or fragmented/oversized control frames,
 * error::message_too_big when the payload exceeds max_payload and
 * error::connection_error on short reads or transport errors.
 */
awaitable<frame> read_frame(asio::socket& socket, boost::asio::streambuf& read_buffer, uint64_t max_payload);

/// close frame payload: 2 byte big endian code followed by the utf-8 reason
std::vector<uint8_t> make_close_payload(uint16_t code, std::string_view reason = {});

/// code and reason from a close frame payload, 1005 if no code is present
std::pair<uint16_t, std::string> parse_close_payload(const std::vector<uint8_t>& payload);

}

#endif
