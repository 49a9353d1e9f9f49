#include <iostream>
#include <thread>
#include <duplex/websocket.hpp>

using namespace duplex;

int main(int argc, char* argv[]) {
    std::cout << "WebSocket Client Example\n" << std::endl;

    // Default to public echo server
    std::string url = "wss://echo.websocket.org";
    if (argc > 1) {
        url = argv[1];
    }

    logging::enable();

    boost::asio::io_context io_context;

    // Custom headers are sent verbatim with the upgrade request
    ws::headers custom{
        {"Authorization", "Bearer example-token"},
        {"X-Client", "duplex-example"}
    };

    co_spawn(io_context, [&]() -> awaitable<void> {
        std::cout << "Connecting to " << url << "..." << std::endl;

        std::shared_ptr<ws::client> client;
        try {
            client = co_await ws::client::connect(io_context, url, custom);
        } catch (const boost::system::system_error& e) {
            std::cerr << "Failed to connect: " << e.what() << std::endl;
            co_return;
        }

        auto received = std::make_shared<int>(0);

        client->on_open([] {
            std::cout << "Connected!\n" << std::endl;
        });

        client->on_message([client, received](const std::string& data, bool binary) {
            std::cout << "Received: " << (binary ? "<" + std::to_string(data.size()) + " bytes>" : data) << std::endl;
            if (++*received == 4) {
                std::cout << "\nClosing connection..." << std::endl;
                client->close(ws::close_code::normal, "bye");
            }
        });

        client->on_pong([](const std::vector<uint8_t>& payload) {
            std::cout << "Pong: " << std::string(payload.begin(), payload.end()) << std::endl;
        });

        client->on_close([](uint16_t code, const std::string& reason) {
            std::cout << "Closed. code: " << code << " reason: " << reason << std::endl;
        });

        client->on_error([](const boost::system::error_code& ec, uint16_t code, const std::string& reason) {
            std::cout << "Error: " << ec.message() << " (" << code << " " << reason << ")" << std::endl;
        });

        client->start();

        try {
            co_await client->ping_async({'p', 'i', 'n', 'g'});
            for (int i = 1; i <= 3; ++i) {
                co_await client->send_async("Message #" + std::to_string(i));
            }
            co_await client->send_async(std::vector<uint8_t>{0x48, 0x65, 0x6c, 0x6c, 0x6f});
        } catch (const boost::system::system_error& e) {
            std::cerr << "Send failed: " << e.what() << std::endl;
        }
    }, detached);

    io_context.run();

    std::cout << "\nExample completed!" << std::endl;
    return 0;
}
