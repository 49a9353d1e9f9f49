#ifndef DUPLEX_ASIO_SOCKET_HPP
#define DUPLEX_ASIO_SOCKET_HPP

#include <atomic>
#include <chrono>
#include <mutex>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>

#include "../../util/types.hpp"

namespace duplex::asio {

/**
 * Byte-stream transport used by the websocket engine. Implementations report
 * transport failures through the returned error codes and never throw from
 * read or write operations.
 */
class socket : private boost::asio::noncopyable {

public:
    // constructors and destructors
    socket(const std::string &context, boost::asio::io_context &io_context);
    virtual ~socket();

    // socket control
    virtual awaitable<boost::system::error_code> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::seconds timeout) = 0;
    virtual void close() = 0;
    virtual void cancel() = 0;
    virtual bool requires_handshake() const;
    virtual awaitable<boost::system::error_code> handshake(const std::string &host = "");

    // read operations
    virtual awaitable<io_result> read(boost::asio::streambuf &buffer, size_t size) = 0;
    virtual awaitable<io_result> read_until(boost::asio::streambuf &buffer, std::string_view delim) = 0;

    // write operations
    virtual awaitable<io_result> write(const uint8_t buffer[], size_t size) = 0;
    virtual awaitable<io_result> write(std::string_view str) = 0;

    // some getters to check the state
    virtual bool is_open() const = 0;
    virtual bool is_secure() const = 0;
    virtual std::string get_remote_ip() const = 0;
    virtual std::string get_remote_port() const = 0;

    // other methods
    boost::asio::io_context &get_io_context() const;
    const std::string& get_context() const;

    // number of live sockets created under the given context name
    static unsigned long live_count(const std::string& context);

protected:
    std::string context_;
    boost::asio::io_context &io_context_;
    static std::atomic<unsigned long> connections;
    static std::map<std::string, unsigned long> context_count;
    static std::mutex mutex_;
};

}

#endif
