#include "error.hpp"

namespace duplex::ws {

namespace {

class websocket_error_category : public boost::system::error_category {
public:
    const char* name() const noexcept override {
        return "duplex.websocket";
    }

    std::string message(int ev) const override {
        switch (static_cast<error>(ev)) {
            case error::unsupported_protocol:
                return "unsupported protocol";
            case error::invalid_url:
                return "invalid url";
            case error::handshake_failure:
                return "websocket handshake failure";
            case error::protocol_error:
                return "websocket protocol error";
            case error::connection_error:
                return "connection error";
            case error::already_closed:
                return "socket has already been closed";
            case error::closed_by_peer:
                return "connection closed by peer";
            case error::message_too_big:
                return "message too big";
        }
        return "unknown websocket error";
    }
};

}

const boost::system::error_category& websocket_category() noexcept {
    static const websocket_error_category category;
    return category;
}

boost::system::error_code make_error_code(error e) noexcept {
    return {static_cast<int>(e), websocket_category()};
}

void throw_error(error e, const std::string& what) {
    throw boost::system::system_error(make_error_code(e), what);
}

}
