#include "message_assembler.hpp"
#include "error.hpp"
#include "../util/logger.hpp"

namespace duplex::ws {

message_assembler::message_assembler(size_t max_message_size)
    : max_message_size_(max_message_size) {
}

std::optional<message> message_assembler::push(frame&& f) {
    if (f.op == opcode::continuation) {
        if (fragments_.empty()) {
            LOG_ERROR("received continuation frame without a message in progress");
            throw_error(error::protocol_error, "unexpected continuation frame");
        }
    } else if (f.op == opcode::text || f.op == opcode::binary) {
        if (!fragments_.empty()) {
            LOG_ERROR("unexpected fragment type. expecting a continuation frame");
            throw_error(error::protocol_error, "expected continuation frame");
        }
        first_opcode_ = f.op;
    } else {
        throw_error(error::protocol_error, "control frame is not a message fragment");
    }

    if (buffered_size_ + f.payload.size() > max_message_size_) {
        LOG_ERROR("message size exceeds the limit of {} bytes", max_message_size_);
        reset();
        throw_error(error::message_too_big, "message too big");
    }

    buffered_size_ += f.payload.size();
    fragments_.push_back(std::move(f.payload));

    if (!f.fin) {
        LOG_TRACE("buffered fragment, total: {} bytes in {} fragments", buffered_size_, fragments_.size());
        return std::nullopt;
    }

    message msg;
    msg.binary = first_opcode_ == opcode::binary;
    msg.data.reserve(buffered_size_);
    for (const auto& fragment : fragments_) {
        msg.data.append(fragment.begin(), fragment.end());
    }

    reset();
    return msg;
}

void message_assembler::reset() {
    fragments_.clear();
    buffered_size_ = 0;
    first_opcode_ = opcode::text;
}

}
