#ifndef DUPLEX_WS_MESSAGE_ASSEMBLER_HPP
#define DUPLEX_WS_MESSAGE_ASSEMBLER_HPP

#include <optional>
#include <string>
#include <vector>

#include "frame.hpp"

namespace duplex::ws {

/// A complete logical message, text when the first fragment was a text frame
struct message {
    std::string data;
    bool binary = false;
};

/**
 * Folds data frames (text, binary, continuation) into complete messages.
 */
class message_assembler {
public:
    static constexpr size_t MAX_MESSAGE_SIZE = 16*1024*1024;    // 16MB

    explicit message_assembler(size_t max_message_size = MAX_MESSAGE_SIZE);

    /**
     * Feed one data frame. Returns the message when the frame carries the fin
     * bit. Throws system_error with error::protocol_error for a continuation
     * without a started message or a new text/binary frame in the middle of a
     * fragmented one, and error::message_too_big when the accumulated payload
     * exceeds the limit.
     */
    std::optional<message> push(frame&& f);

    /// drop any partially received message
    void reset();

    bool in_progress() const { return !fragments_.empty(); }
    size_t buffered_size() const { return buffered_size_; }

private:
    size_t max_message_size_;
    std::vector<std::vector<uint8_t>> fragments_;
    opcode first_opcode_ = opcode::text;
    size_t buffered_size_ = 0;
};

}

#endif
