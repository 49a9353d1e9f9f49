#include <catch2/catch_test_macros.hpp>
#include <duplex/websocket.hpp>
#include "../fixtures/frame_helpers.hpp"
#include "../fixtures/io_helpers.hpp"

#include <boost/asio/use_future.hpp>
#include <algorithm>
#include <mutex>
#include <thread>

using namespace duplex;
using namespace duplex::test;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

// Minimal websocket server on the loopback interface. Echoes data frames,
// answers pings, echoes close frames and reacts to a few commands:
//   "ping-me"  -> sends a ping, the client pong is reported back as "pong:<payload>"
//   "close-me" -> starts the close handshake with 1000 "server bye"
// Requests for /forbidden are rejected with 403.
class WebSocketTestServer {
public:
    WebSocketTestServer()
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port_ = acceptor_.local_endpoint().port();
        co_spawn(io_, accept_loop(), detached);
        thread_ = std::thread([this] { io_.run(); });
    }

    ~WebSocketTestServer() {
        io_.stop();
        if (thread_.joinable()) thread_.join();
    }

    std::string url(const std::string& path = "/ws") const {
        return "ws://127.0.0.1:" + std::to_string(port_) + path;
    }

    ws::headers last_request_headers() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_headers_;
    }

    std::vector<uint16_t> received_close_codes() {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_codes_;
    }

private:
    awaitable<void> accept_loop() {
        for (;;) {
            auto [ec, sock] = co_await acceptor_.async_accept(use_nothrow_awaitable);
            if (ec) co_return;
            co_spawn(io_, session(std::move(sock)), detached);
        }
    }

    static awaitable<void> read_exactly(tcp::socket& sock, boost::asio::streambuf& buffer, uint8_t out[], size_t size) {
        if (buffer.size() < size) {
            co_await boost::asio::async_read(sock, buffer, boost::asio::transfer_exactly(size - buffer.size()), use_awaitable);
        }
        boost::asio::buffer_copy(boost::asio::buffer(out, size), buffer.data());
        buffer.consume(size);
    }

    static awaitable<ws::frame> read_client_frame(tcp::socket& sock, boost::asio::streambuf& buffer) {
        uint8_t header[8];
        co_await read_exactly(sock, buffer, header, 2);

        ws::frame f;
        f.fin = header[0] & 0x80;
        f.op = static_cast<ws::opcode>(header[0] & 0x0F);
        bool masked = header[1] & 0x80;
        uint64_t size = header[1] & 0x7F;
        if (size == 126) {
            co_await read_exactly(sock, buffer, header, 2);
            size = (header[0] << 8) | header[1];
        } else if (size == 127) {
            co_await read_exactly(sock, buffer, header, 8);
            size = 0;
            for (int i = 0; i < 8; ++i) size = (size << 8) | header[i];
        }

        ws::mask_key mask{};
        if (masked) co_await read_exactly(sock, buffer, mask.data(), mask.size());

        f.payload.resize(size);
        if (size > 0) co_await read_exactly(sock, buffer, f.payload.data(), size);
        if (masked) {
            f.mask = mask;
            ws::apply_mask(f.payload.data(), f.payload.size(), mask);
        }
        co_return f;
    }

    static awaitable<void> send(tcp::socket& sock, ws::opcode op, const std::vector<uint8_t>& payload) {
        auto wire = server_frame(op, payload);
        co_await boost::asio::async_write(sock, boost::asio::buffer(wire), use_awaitable);
    }

    awaitable<void> session(tcp::socket sock) {
        try {
            boost::asio::streambuf buffer;
            auto size = co_await boost::asio::async_read_until(sock, buffer, "\r\n\r\n", use_awaitable);
            std::string head(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_begin(buffer.data()) + size);
            buffer.consume(size);

            ws::headers request_headers;
            std::string request_line = head.substr(0, head.find("\r\n"));
            size_t start = request_line.size() + 2;
            while (start < head.size()) {
                auto end = head.find("\r\n", start);
                auto line = head.substr(start, end - start);
                start = end + 2;
                auto colon = line.find(':');
                if (colon == std::string::npos) continue;
                auto value = line.substr(colon + 1);
                value.erase(0, value.find_first_not_of(' '));
                request_headers.set_header(line.substr(0, colon), value);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                last_request_headers_ = request_headers;
            }

            if (request_line.find(" /forbidden ") != std::string::npos) {
                co_await boost::asio::async_write(sock,
                    boost::asio::buffer(std::string("HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n")), use_awaitable);
                co_return;
            }

            std::string response = "HTTP/1.1 101 Switching Protocols\r\n"
                                   "Upgrade: websocket\r\n"
                                   "Connection: Upgrade\r\n"
                                   "Sec-WebSocket-Accept: " +
                                   ws::compute_accept_key(request_headers.get_header("Sec-WebSocket-Key")) + "\r\n\r\n";
            co_await boost::asio::async_write(sock, boost::asio::buffer(response), use_awaitable);

            bool close_sent = false;
            for (;;) {
                auto f = co_await read_client_frame(sock, buffer);
                if (!f.mask) co_return;

                switch (f.op) {
                    case ws::opcode::text: {
                        auto payload = text(f.payload);
                        if (payload == "ping-me") {
                            co_await send(sock, ws::opcode::ping, bytes("srv"));
                        } else if (payload == "close-me") {
                            close_sent = true;
                            co_await send(sock, ws::opcode::close, ws::make_close_payload(1000, "server bye"));
                        } else {
                            co_await send(sock, ws::opcode::text, f.payload);
                        }
                        break;
                    }
                    case ws::opcode::binary:
                        co_await send(sock, ws::opcode::binary, f.payload);
                        break;
                    case ws::opcode::ping:
                        co_await send(sock, ws::opcode::pong, f.payload);
                        break;
                    case ws::opcode::pong:
                        co_await send(sock, ws::opcode::text, bytes("pong:" + text(f.payload)));
                        break;
                    case ws::opcode::close: {
                        {
                            std::lock_guard<std::mutex> lock(mutex_);
                            close_codes_.push_back(ws::parse_close_payload(f.payload).first);
                        }
                        if (!close_sent) co_await send(sock, ws::opcode::close, f.payload);
                        co_return;
                    }
                    default:
                        break;
                }
            }
        } catch (const boost::system::system_error&) {
            // client went away
        }
    }

    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::thread thread_;
    std::mutex mutex_;
    ws::headers last_request_headers_;
    std::vector<uint16_t> close_codes_;
};

struct ClientIntegrationFixture {
    WebSocketTestServer server;
    boost::asio::io_context io;
    std::shared_ptr<ws::client> client;
    std::vector<std::string> events;
    boost::system::error_code last_error;

    ~ClientIntegrationFixture() {
        if (client && !client->closed()) {
            auto closed = client->close();
            run_until(io, [&] { return is_ready(closed); });
        }
        io.restart();
        io.run_for(1s);
    }

    std::shared_ptr<ws::client> connect(const std::string& url, const ws::headers& custom = {}) {
        auto future = co_spawn(io, ws::client::connect(io, url, custom), boost::asio::use_future);
        REQUIRE(run_until(io, [&] { return is_ready(future); }));
        return future.get();
    }

    void open(const ws::headers& custom = {}) {
        client = connect(server.url(), custom);
        client->on_open([this] { events.push_back("open"); });
        client->on_message([this](const std::string& data, bool binary) {
            events.push_back(std::string(binary ? "binary:" : "text:") + data);
        });
        client->on_ping([this](const std::vector<uint8_t>& payload) { events.push_back("ping:" + text(payload)); });
        client->on_pong([this](const std::vector<uint8_t>& payload) { events.push_back("pong:" + text(payload)); });
        client->on_close([this](uint16_t code, const std::string& reason) {
            events.push_back("close:" + std::to_string(code) + ":" + reason);
        });
        client->on_error([this](const boost::system::error_code& ec, uint16_t, const std::string&) {
            last_error = ec;
            events.push_back("error");
        });
        client->start();
        REQUIRE(wait_event("open"));
    }

    bool wait_event(const std::string& event) {
        return run_until(io, [&] { return std::find(events.begin(), events.end(), event) != events.end(); });
    }

    ws::error connect_error(const std::string& url) {
        try {
            connect(url);
        } catch (const boost::system::system_error& e) {
            REQUIRE(e.code().category() == ws::websocket_category());
            return static_cast<ws::error>(e.code().value());
        }
        FAIL("connection did not fail");
        return ws::error::protocol_error;
    }
};

}

TEST_CASE_METHOD(ClientIntegrationFixture, "WebSocket client against a loopback server", "[client][integration]") {

    SECTION("custom headers are sent with the upgrade request") {
        open({{"Authorization", "Bearer token"}, {"X-Client", "duplex-test"}});

        auto received = server.last_request_headers();
        REQUIRE(received.get_header("Authorization") == "Bearer token");
        REQUIRE(received.get_header("X-Client") == "duplex-test");
        REQUIRE(received.get_header("Sec-WebSocket-Version") == "13");
        REQUIRE(client->get_ready_state() == ws::ready_state::open);
    }

    SECTION("text and binary echo") {
        open();

        auto sent = client->send(std::string("hello"));
        REQUIRE(wait_event("text:hello"));
        REQUIRE_NOTHROW(sent.get());

        client->send(std::vector<uint8_t>{'b', 'i', 'n'});
        REQUIRE(wait_event("binary:bin"));
    }

    SECTION("large message echo") {
        open();

        std::string large(100000, 'x');
        client->send(large);
        REQUIRE(wait_event("text:" + large));
    }

    SECTION("server ping is answered automatically") {
        open();

        client->send(std::string("ping-me"));
        REQUIRE(wait_event("text:pong:srv"));
        REQUIRE(std::find(events.begin(), events.end(), "ping:srv") != events.end());
    }

    SECTION("client ping gets a pong") {
        open();

        client->ping(std::string("hb"));
        REQUIRE(wait_event("pong:hb"));
    }

    SECTION("server initiated close") {
        open();

        client->send(std::string("close-me"));
        REQUIRE(wait_event("close:1000:server bye"));
        REQUIRE(wait_event("error"));
        REQUIRE(last_error == ws::error::closed_by_peer);
        REQUIRE(client->closed());

        REQUIRE(run_until(io, [&] { return !server.received_close_codes().empty(); }));
        REQUIRE(server.received_close_codes().front() == 1000);
    }

    SECTION("client initiated close") {
        open();

        auto closed = client->close(ws::close_code::going_away, "leaving");
        REQUIRE(run_until(io, [&] { return is_ready(closed); }));
        REQUIRE_NOTHROW(closed.get());
        REQUIRE(client->closed());
        REQUIRE(wait_event("close:1001:leaving"));

        REQUIRE(run_until(io, [&] { return !server.received_close_codes().empty(); }));
        REQUIRE(server.received_close_codes().front() == 1001);

        auto late = client->send(std::string("late"));
        REQUIRE(run_until(io, [&] { return is_ready(late); }));
        REQUIRE_THROWS_AS(late.get(), boost::system::system_error);
    }
}

TEST_CASE_METHOD(ClientIntegrationFixture, "WebSocket client connection failures", "[client][integration]") {

    SECTION("rejected upgrade") {
        REQUIRE(connect_error(server.url("/forbidden")) == ws::error::handshake_failure);
    }

    SECTION("nothing listening") {
        uint16_t port;
        {
            tcp::acceptor probe(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
            port = probe.local_endpoint().port();
        }
        REQUIRE(connect_error("ws://127.0.0.1:" + std::to_string(port) + "/") == ws::error::handshake_failure);
    }

    SECTION("unsupported scheme") {
        REQUIRE(connect_error("ftp://127.0.0.1/") == ws::error::unsupported_protocol);
    }

    SECTION("invalid url") {
        REQUIRE(connect_error("127.0.0.1:80") == ws::error::invalid_url);
    }
}
