#ifndef DUPLEX_WS_ERROR_HPP
#define DUPLEX_WS_ERROR_HPP

#include <cstdint>
#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace duplex::ws {

enum class error {
    unsupported_protocol = 1,   // url scheme is not ws, wss, http or https
    invalid_url,                // url cannot be parsed
    handshake_failure,          // transport or http upgrade failed, no connection made
    protocol_error,             // malformed or illegal frame
    connection_error,           // transport read/write failure
    already_closed,             // operation attempted after the connection reached Closed
    closed_by_peer,             // peer sent a Close frame
    message_too_big             // frame or message above the configured limits
};

const boost::system::error_category& websocket_category() noexcept;

boost::system::error_code make_error_code(error e) noexcept;

/// throw the given error as a boost::system::system_error
[[noreturn]] void throw_error(error e, const std::string& what = "");

/**
 * Close status codes carried in Close frames.
 */
namespace close_code {
    inline constexpr uint16_t normal = 1000;
    inline constexpr uint16_t going_away = 1001;
    inline constexpr uint16_t protocol_error = 1002;
    inline constexpr uint16_t unsupported_data = 1003;
    inline constexpr uint16_t no_status = 1005;
    inline constexpr uint16_t abnormal = 1006;
    inline constexpr uint16_t invalid_payload = 1007;
    inline constexpr uint16_t policy_violation = 1008;
    inline constexpr uint16_t message_too_big = 1009;
    inline constexpr uint16_t internal_error = 1011;
}

}

namespace boost::system {
    template<>
    struct is_error_code_enum<duplex::ws::error> : std::true_type {};
}

#endif
