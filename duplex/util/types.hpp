#ifndef DUPLEX_TYPES_HPP
#define DUPLEX_TYPES_HPP

#include <cstddef>
#include <tuple>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

namespace duplex {

    // Awaitable type alias
    template<typename T = void>
    using awaitable = boost::asio::awaitable<T>;

    // Import commonly used awaitable utilities
    using boost::asio::use_awaitable;
    using boost::asio::co_spawn;
    using boost::asio::detached;

    // For error handling without exceptions (returns tuple<error_code, result>)
    constexpr auto use_nothrow_awaitable =
        boost::asio::as_tuple(boost::asio::use_awaitable);

    // Result of a socket read/write: error and transferred bytes
    using io_result = std::tuple<boost::system::error_code, std::size_t>;

}

#endif
