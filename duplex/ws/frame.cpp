#include "frame.hpp"
#include "error.hpp"
#include "../util/logger.hpp"

#include <climits>
#include <random>

namespace duplex::ws {

namespace {

using random_bytes_engine = std::independent_bits_engine<std::default_random_engine, CHAR_BIT, unsigned char>;

// make sure the read buffer holds at least size bytes
awaitable<void> fill(asio::socket& socket, boost::asio::streambuf& read_buffer, size_t size) {
    if (read_buffer.size() >= size) co_return;

    auto missing = size - read_buffer.size();
    auto [ec, bytes] = co_await socket.read(read_buffer, missing);
    if (ec || bytes < missing) {
        LOG_DEBUG("short read while decoding frame: {}", ec ? ec.message() : "end of stream");
        throw_error(error::connection_error, ec ? ec.message() : "short read");
    }
}

awaitable<void> read_exactly(asio::socket& socket, boost::asio::streambuf& read_buffer, uint8_t out[], size_t size) {
    co_await fill(socket, read_buffer, size);
    boost::asio::buffer_copy(boost::asio::buffer(out, size), read_buffer.data());
    read_buffer.consume(size);
}

}

std::string_view to_string(opcode op) {
    switch (op) {
        case opcode::continuation: return "continuation";
        case opcode::text: return "text";
        case opcode::binary: return "binary";
        case opcode::close: return "close";
        case opcode::ping: return "ping";
        case opcode::pong: return "pong";
    }
    return "unknown";
}

mask_key generate_mask() {
    static thread_local random_bytes_engine rbe{std::random_device{}()};
    mask_key mask;
    for (auto& b : mask) {
        b = rbe();
    }
    return mask;
}

void apply_mask(uint8_t buffer[], size_t size, const mask_key& mask) {
    for (size_t i = 0; i < size; ++i) {
        buffer[i] ^= mask[i % MASK_SIZE_BYTES];
    }
}

std::vector<uint8_t> encode_frame(const frame& f, const mask_key& mask) {
    const auto size = f.payload.size();

    std::vector<uint8_t> output;
    output.reserve(14 + size);
    output.push_back((f.fin ? 0x80 : 0x00) | static_cast<uint8_t>(f.op));

    if (size <= 125) {
        output.push_back(0x80 | static_cast<uint8_t>(size));
    } else if (size <= 65535) {
        output.push_back(0x80 | 126);
        output.push_back((size >> 8) & 0xff);
        output.push_back(size & 0xff);
    } else {
        output.push_back(0x80 | 127);
        for (int i = 0; i < 8; ++i) {
            output.push_back((static_cast<uint64_t>(size) >> ((7 - i) * 8)) & 0xff);
        }
    }

    output.insert(output.end(), mask.begin(), mask.end());

    auto payload_offset = output.size();
    output.insert(output.end(), f.payload.begin(), f.payload.end());
    apply_mask(output.data() + payload_offset, size, mask);

    return output;
}

awaitable<void> write_frame(asio::socket& socket, const frame& f, const mask_key& mask) {
    auto output = encode_frame(f, mask);

    LOG_DEBUG("sending {} frame. fin: {}, payload: {}, wire: {}", to_string(f.op), f.fin, f.payload.size(), output.size());

    auto [ec, bytes] = co_await socket.write(output.data(), output.size());
    if (ec || bytes != output.size()) {
        LOG_ERROR("error while writing {} frame: {}", to_string(f.op), ec ? ec.message() : "short write");
        throw_error(error::connection_error, ec ? ec.message() : "short write");
    }
}

awaitable<frame> read_frame(asio::socket& socket, boost::asio::streambuf& read_buffer, uint64_t max_payload) {
    uint8_t header[8];

    // Read frame header (2 bytes minimum)
    co_await read_exactly(socket, read_buffer, header, 2);

    uint8_t rsv = header[0] & 0b01110000;
    if (rsv) {
        LOG_ERROR("invalid RSV parameters");
        throw_error(error::protocol_error, "reserved bits set");
    }

    frame f;
    f.fin = header[0] & 0b10000000;
    uint8_t op = header[0] & 0x0F;
    bool masked = header[1] & 0b10000000;
    uint8_t data_size = header[1] & 0x7F;

    switch (op) {
        case 0x0:
        case 0x1:
        case 0x2:
        case 0x8:
        case 0x9:
        case 0xA:
            f.op = static_cast<opcode>(op);
            break;
        default:
            LOG_ERROR("received unknown websocket opcode: {}", (int) op);
            throw_error(error::protocol_error, "unknown opcode");
    }

    if (is_control(f.op)) {
        if (!f.fin) {
            LOG_ERROR("control frame messages cannot be fragmented");
            throw_error(error::protocol_error, "fragmented control frame");
        }
        if (data_size > MAX_CONTROL_PAYLOAD) {
            LOG_ERROR("control frame payload too big: {}", data_size);
            throw_error(error::protocol_error, "control frame too big");
        }
    }

    // Determine payload length
    uint64_t payload_size = data_size;
    if (data_size == 126) {
        co_await read_exactly(socket, read_buffer, header, 2);
        payload_size = (header[0] << 8) | header[1];
    } else if (data_size == 127) {
        co_await read_exactly(socket, read_buffer, header, 8);
        if (header[0] & 0x80) {
            throw_error(error::protocol_error, "invalid 64 bit payload length");
        }
        payload_size = 0;
        for (int i = 0; i < 8; ++i) {
            payload_size = (payload_size << 8) | header[i];
        }
    }

    LOG_DEBUG("decoded frame header. fin: {}, opcode: 0x{:02X} mask: {} payload: {}", f.fin, op, masked, payload_size);

    if (payload_size > max_payload) {
        LOG_ERROR("frame payload of {} bytes exceeds the limit of {} bytes", payload_size, max_payload);
        throw_error(error::message_too_big, "frame too big");
    }

    // Read mask if present
    if (masked) {
        mask_key mask;
        co_await read_exactly(socket, read_buffer, mask.data(), mask.size());
        f.mask = mask;
    }

    f.payload.resize(payload_size);
    if (payload_size > 0) {
        co_await read_exactly(socket, read_buffer, f.payload.data(), f.payload.size());
        if (f.mask) apply_mask(f.payload.data(), f.payload.size(), *f.mask);
    }

    co_return f;
}

std::vector<uint8_t> make_close_payload(uint16_t code, std::string_view reason) {
    std::vector<uint8_t> payload;
    payload.reserve(2 + reason.size());
    payload.push_back(code >> 8);
    payload.push_back(code & 0xff);
    payload.insert(payload.end(), reason.begin(), reason.end());
    return payload;
}

std::pair<uint16_t, std::string> parse_close_payload(const std::vector<uint8_t>& payload) {
    if (payload.size() < 2) {
        return {close_code::no_status, {}};
    }
    uint16_t code = (payload[0] << 8) | payload[1];
    return {code, std::string(payload.begin() + 2, payload.end())};
}

}
