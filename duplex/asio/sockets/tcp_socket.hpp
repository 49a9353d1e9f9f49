#ifndef DUPLEX_ASIO_TCP_SOCKET_HPP
#define DUPLEX_ASIO_TCP_SOCKET_HPP

#include <memory>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/steady_timer.hpp>

#include "../../util/logger.hpp"
#include "socket.hpp"

namespace duplex::asio {

class tcp_socket : public socket {

public:
    // constructors and destructors
    tcp_socket(const std::string &context, boost::asio::io_context &io_context);
    tcp_socket(const std::string &context, boost::asio::ip::tcp::socket&& socket);
    ~tcp_socket() override;

    // socket control
    awaitable<boost::system::error_code> connect(
        const std::string &host,
        const std::string &port,
        std::chrono::seconds timeout) override;
    void close() override;
    void cancel() override;

    // read operations
    awaitable<io_result> read(boost::asio::streambuf &buffer, size_t size) override;
    awaitable<io_result> read_until(boost::asio::streambuf &buffer, std::string_view delim) override;

    // write operations
    awaitable<io_result> write(const uint8_t buffer[], size_t size) override;
    awaitable<io_result> write(std::string_view str) override;

    // some getters to check the state
    bool is_open() const override;
    bool is_secure() const override;
    std::string get_remote_ip() const override;
    std::string get_remote_port() const override;

    // other methods
    void enable_tcp_no_delay();
    virtual boost::asio::ip::tcp::socket &get_socket();

protected:
    boost::asio::ip::tcp::socket socket_;
};

}

#endif
