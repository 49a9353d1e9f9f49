#include "tcp_socket.hpp"

namespace duplex::asio {

tcp_socket::tcp_socket(const std::string& context, boost::asio::io_context& io_context)
    : socket(context, io_context), socket_(io_context) {
}

tcp_socket::tcp_socket(const std::string& context, boost::asio::ip::tcp::socket&& sock)
    : socket(context, static_cast<boost::asio::io_context&>(sock.get_executor().context())), socket_(std::move(sock)) {
}

tcp_socket::~tcp_socket() {
    LOG_TRACE("releasing tcp connection");
    close();
}

void tcp_socket::close() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    socket_.close(ec);
    LOG_TRACE("closing tcp socket result: {}", ec.message());
}

void tcp_socket::cancel() {
    boost::system::error_code ec;
    socket_.cancel(ec);
}

awaitable<boost::system::error_code> tcp_socket::connect(
    const std::string& host,
    const std::string& port,
    std::chrono::seconds timeout)
{
    close();

    // The deadline covers resolve, connect and the tls handshake. When it
    // expires first it cancels whatever operation is pending.
    struct deadline_state {
        bool expired = false;
        bool finished = false;
    };
    auto deadline = std::make_shared<deadline_state>();
    auto resolver = std::make_shared<boost::asio::ip::tcp::resolver>(io_context_);
    auto timer = std::make_shared<boost::asio::steady_timer>(io_context_);
    timer->expires_after(timeout);
    timer->async_wait([this, timer, resolver, deadline](const boost::system::error_code& e) {
        if (e || deadline->finished) return;
        deadline->expired = true;
        resolver->cancel();
        cancel();
    });

    auto finish = [&](boost::system::error_code ec) {
        deadline->finished = true;
        timer->cancel();
        if (ec && deadline->expired) ec = boost::asio::error::timed_out;
        return ec;
    };

    // Resolve host
    auto [ec_resolve, endpoints] = co_await resolver->async_resolve(
        host, port, use_nothrow_awaitable);

    if (ec_resolve || deadline->expired) {
        auto ec = finish(ec_resolve ? ec_resolve : boost::system::error_code(boost::asio::error::operation_aborted));
        LOG_ERROR("cannot resolve {}:{}: {}", host, port, ec.message());
        co_return ec;
    }

    auto [ec_connect, endpoint] = co_await boost::asio::async_connect(
        socket_, endpoints, use_nothrow_awaitable);

    if (ec_connect || deadline->expired) {
        auto ec = finish(ec_connect ? ec_connect : boost::system::error_code(boost::asio::error::operation_aborted));
        LOG_ERROR("cannot connect to {}:{}: {}", host, port, ec.message());
        close();
        co_return ec;
    }

    LOG_DEBUG("connected to {}:{}", endpoint.address().to_string(), endpoint.port());

    // Run handshake if required (for SSL sockets)
    if (requires_handshake()) {
        auto hs_ec = co_await handshake(host);
        if (hs_ec || deadline->expired) {
            auto ec = finish(hs_ec ? hs_ec : boost::system::error_code(boost::asio::error::operation_aborted));
            LOG_ERROR("tls handshake with {} failed: {}", host, ec.message());
            close();
            co_return ec;
        }
    }

    co_return finish(boost::system::error_code{});
}

boost::asio::ip::tcp::socket& tcp_socket::get_socket() {
    return socket_;
}

std::string tcp_socket::get_remote_ip() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return remote_ep.address().to_string();
    }
    return "0.0.0.0";
}

std::string tcp_socket::get_remote_port() const {
    boost::system::error_code ec;
    auto remote_ep = socket_.remote_endpoint(ec);
    if (!ec) {
        return std::to_string(remote_ep.port());
    }
    return "0";
}

awaitable<io_result> tcp_socket::read(boost::asio::streambuf& buffer, size_t size) {
    co_return co_await boost::asio::async_read(
        socket_,
        buffer,
        boost::asio::transfer_exactly(size),
        use_nothrow_awaitable);
}

awaitable<io_result> tcp_socket::read_until(boost::asio::streambuf& buffer, std::string_view delim) {
    co_return co_await boost::asio::async_read_until(
        socket_,
        buffer,
        std::string(delim),
        use_nothrow_awaitable);
}

awaitable<io_result> tcp_socket::write(const uint8_t buffer[], size_t size) {
    co_return co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(buffer, size),
        use_nothrow_awaitable);
}

awaitable<io_result> tcp_socket::write(std::string_view str) {
    co_return co_await boost::asio::async_write(
        socket_,
        boost::asio::buffer(str.data(), str.size()),
        use_nothrow_awaitable);
}

void tcp_socket::enable_tcp_no_delay() {
    boost::system::error_code ec;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        LOG_WARNING("cannot enable TCP_NODELAY: {}", ec.message());
    }
}

bool tcp_socket::is_open() const {
    return socket_.is_open();
}

bool tcp_socket::is_secure() const {
    return false;
}

}
