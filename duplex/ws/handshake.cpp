#include "handshake.hpp"
#include "error.hpp"
#include "../asio/sockets/tcp_socket.hpp"
#include "../asio/sockets/ssl_socket.hpp"
#include "../util/logger.hpp"

#include <array>
#include <random>
#include <regex>

#include <boost/algorithm/string.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/lexical_cast.hpp>
#include <openssl/evp.h>

namespace duplex::ws {

namespace {

std::string base64_encode(const unsigned char* data, size_t size) {
    std::string output(4 * ((size + 2) / 3), '\0');
    auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()), data, static_cast<int>(size));
    output.resize(written);
    return output;
}

bool has_token(const std::string& value, std::string_view token) {
    std::vector<std::string> tokens;
    boost::split(tokens, value, boost::is_any_of(","));
    for (auto& str : tokens) {
        boost::algorithm::trim(str);
        if (boost::iequals(str, token)) return true;
    }
    return false;
}

// ipv6 literals are written between brackets in urls and host headers
std::string authority_host(const std::string& host) {
    return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}

}

url_components parse_url(const std::string& url) {
    std::regex url_regex(R"(^([a-zA-Z][a-zA-Z0-9+.\-]*)://(\[[0-9a-fA-F:.]+\]|[^/:?#\[\]]+)(?::(\d+))?([/?].*)?$)");
    std::smatch match;

    if (!std::regex_match(url, match, url_regex)) {
        LOG_ERROR("invalid websocket url: {}", url);
        throw_error(error::invalid_url, url);
    }

    url_components result;
    result.scheme = boost::algorithm::to_lower_copy(match[1].str());

    if (result.scheme == "ws" || result.scheme == "http") {
        result.secure = false;
    } else if (result.scheme == "wss" || result.scheme == "https") {
        result.secure = true;
    } else {
        LOG_ERROR("unknown protocol supplied to connect: {}", result.scheme);
        throw_error(error::unsupported_protocol, result.scheme);
    }

    result.host = match[2].str();
    if (result.host.front() == '[') result.host = result.host.substr(1, result.host.size() - 2);
    result.port = match[3].matched ? match[3].str() : (result.secure ? "443" : "80");
    result.path = match[4].matched ? match[4].str() : "/";
    if (result.path.front() == '?') result.path.insert(0, "/");

    return result;
}

std::string generate_websocket_key() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 255);

    std::array<uint8_t, 16> bytes;
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(gen));
    }

    return base64_encode(bytes.data(), bytes.size());
}

std::string compute_accept_key(const std::string& key) {
    std::string combined = key + WS_GUID;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;
    if (!EVP_Digest(combined.data(), combined.size(), digest, &digest_size, EVP_sha1(), nullptr)) {
        throw_error(error::handshake_failure, "cannot compute accept key");
    }
    return base64_encode(digest, digest_size);
}

headers build_request_headers(const url_components& url, const std::string& key,
                              const headers& custom, const client_options& options) {
    headers result;

    bool default_port = url.port == (url.secure ? "443" : "80");
    auto host = authority_host(url.host);
    result.set_header(header::host, default_port ? host : host + ":" + url.port);
    result.set_header(header::upgrade, "websocket");
    result.set_header(header::connection, "Upgrade");
    result.set_header(header::sec_websocket_key, key);
    result.set_header(header::sec_websocket_version, "13");
    if (!options.user_agent.empty()) {
        result.set_header(header::user_agent, options.user_agent);
    }

    // caller headers win on conflicts
    result.merge(custom);
    return result;
}

std::string build_request(const url_components& url, const headers& request_headers) {
    std::string request = "GET " + url.path + " HTTP/1.1\r\n";
    for (const auto& [name, value] : request_headers.get_headers()) {
        request += name;
        request += ": ";
        request += value;
        request += "\r\n";
    }
    request += "\r\n";
    return request;
}

handshake_response parse_response(std::string_view head) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < head.size()) {
        auto end = head.find("\r\n", start);
        if (end == std::string_view::npos) end = head.size();
        lines.emplace_back(head.substr(start, end - start));
        start = end + 2;
    }

    handshake_response response;

    // HTTP/1.1 101 Switching Protocols
    if (lines.empty() || !boost::starts_with(lines[0], "HTTP/")) {
        throw_error(error::handshake_failure, "invalid status line");
    }
    auto& status_line = lines[0];
    auto first_space = status_line.find(' ');
    if (first_space == std::string::npos) {
        throw_error(error::handshake_failure, "invalid status line");
    }
    auto second_space = status_line.find(' ', first_space + 1);
    auto code = status_line.substr(first_space + 1,
        second_space == std::string::npos ? std::string::npos : second_space - first_space - 1);

    try {
        response.status_code = boost::lexical_cast<unsigned short>(code);
    } catch (const boost::bad_lexical_cast&) {
        throw_error(error::handshake_failure, "invalid status code");
    }
    if (second_space != std::string::npos) {
        response.reason = status_line.substr(second_space + 1);
    }

    for (size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.empty()) continue;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw_error(error::handshake_failure, "invalid header line");
        }
        auto name = boost::algorithm::trim_copy(line.substr(0, colon));
        auto value = boost::algorithm::trim_copy(line.substr(colon + 1));
        response.response_headers.set_header(std::move(name), std::move(value));
    }

    return response;
}

void validate_response(const handshake_response& response, const std::string& sent_key) {
    if (response.status_code != 101) {
        LOG_ERROR("websocket upgrade failed: {} {}", response.status_code, response.reason);
        throw_error(error::handshake_failure, "unexpected status code " + std::to_string(response.status_code));
    }

    const auto& hdrs = response.response_headers;

    if (!boost::iequals(hdrs.get_header(header::upgrade), "websocket")) {
        LOG_ERROR("invalid Upgrade header: '{}'", hdrs.get_header(header::upgrade));
        throw_error(error::handshake_failure, "invalid Upgrade header");
    }

    if (!has_token(hdrs.get_header(header::connection), "upgrade")) {
        LOG_ERROR("invalid Connection header: '{}'", hdrs.get_header(header::connection));
        throw_error(error::handshake_failure, "invalid Connection header");
    }

    if (hdrs.get_header(header::sec_websocket_accept) != compute_accept_key(sent_key)) {
        LOG_ERROR("invalid Sec-WebSocket-Accept key");
        throw_error(error::handshake_failure, "invalid Sec-WebSocket-Accept key");
    }
}

awaitable<connection_context> handshake(std::shared_ptr<asio::socket> socket,
                                        const url_components& url,
                                        const headers& custom,
                                        const client_options& options) {
    try {
        auto request_headers = build_request_headers(url, generate_websocket_key(), custom, options);

        // the caller may have replaced the key, validate against the one on the wire
        auto sent_key = request_headers.get_header(header::sec_websocket_key);

        auto request = build_request(url, request_headers);
        LOG_DEBUG("sending websocket upgrade request to {}:{}{}", url.host, url.port, url.path);

        auto [ec_write, written] = co_await socket->write(request);
        if (ec_write) {
            LOG_ERROR("cannot send upgrade request: {}", ec_write.message());
            throw_error(error::handshake_failure, ec_write.message());
        }

        boost::asio::streambuf response_buffer(MAX_HEADERS_SIZE);
        auto [ec_read, header_size] = co_await socket->read_until(response_buffer, "\r\n\r\n");
        if (ec_read) {
            LOG_ERROR("cannot read upgrade response: {}", ec_read.message());
            throw_error(error::handshake_failure, ec_read.message());
        }

        std::string head(boost::asio::buffers_begin(response_buffer.data()),
                         boost::asio::buffers_begin(response_buffer.data()) + header_size);
        response_buffer.consume(header_size);

        auto response = parse_response(head);
        validate_response(response, sent_key);

        connection_context context;
        context.socket = socket;
        context.url = (url.secure ? "wss://" : "ws://") + authority_host(url.host) + ":" + url.port + url.path;

        // frames sent right after the response are already in our buffer
        if (response_buffer.size() > 0) {
            auto pending = response_buffer.size();
            boost::asio::buffer_copy(context.read_buffer->prepare(pending), response_buffer.data());
            context.read_buffer->commit(pending);
            LOG_DEBUG("{} bytes received together with the upgrade response", pending);
        }

        LOG_INFO("websocket connected to {}", context.url);
        co_return context;
    } catch (const boost::system::system_error&) {
        socket->close();
        throw;
    }
}

awaitable<connection_context> connect(boost::asio::io_context& io_context,
                                      const std::string& url,
                                      const headers& custom,
                                      const client_options& options) {
    auto components = parse_url(url);

    // Create socket based on scheme
    std::shared_ptr<asio::socket> socket;
    if (components.secure) {
        auto ssl_context = std::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tls_client);
        ssl_context->set_default_verify_paths();
        if (!options.ca_file.empty()) {
            boost::system::error_code ec_ca;
            ssl_context->load_verify_file(options.ca_file, ec_ca);
            if (ec_ca) {
                LOG_ERROR("cannot load CA file {}: {}", options.ca_file, ec_ca.message());
                throw_error(error::handshake_failure, ec_ca.message());
            }
        }
        ssl_context->set_verify_mode(options.verify_peer ?
            boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);
        socket = std::make_shared<asio::ssl_socket>("wss_client", io_context, ssl_context);
    } else {
        socket = std::make_shared<asio::tcp_socket>("ws_client", io_context);
    }

    auto ec = co_await socket->connect(components.host, components.port, options.connect_timeout);
    if (ec) {
        socket->close();
        throw_error(error::handshake_failure, ec.message());
    }

    co_return co_await handshake(std::move(socket), components, custom, options);
}

}
