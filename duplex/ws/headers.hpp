#ifndef DUPLEX_WS_HEADERS_HPP
#define DUPLEX_WS_HEADERS_HPP

#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace duplex::ws {

/**
 * Ordered http header list with case-insensitive names. Setting an existing
 * header replaces its name and value, so the last write wins.
 */
class headers {
public:
    headers() = default;
    headers(std::initializer_list<std::pair<std::string, std::string>> init);
    headers(const std::map<std::string, std::string>& init);

    void set_header(std::string key, std::string value);
    void remove_header(std::string_view key);
    bool has_header(std::string_view key) const;

    /// header value, or an empty string when it is not present
    const std::string& get_header(std::string_view key) const;

    /// set every header of other on this list, in order
    void merge(const headers& other);

    const std::vector<std::pair<std::string, std::string>>& get_headers() const { return headers_; }
    size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    static bool is_header(std::string_view key, std::string_view header);

private:
    std::vector<std::pair<std::string, std::string>> headers_;
};

namespace header {
    inline constexpr const char* host = "Host";
    inline constexpr const char* upgrade = "Upgrade";
    inline constexpr const char* connection = "Connection";
    inline constexpr const char* user_agent = "User-Agent";
    inline constexpr const char* sec_websocket_key = "Sec-WebSocket-Key";
    inline constexpr const char* sec_websocket_version = "Sec-WebSocket-Version";
    inline constexpr const char* sec_websocket_accept = "Sec-WebSocket-Accept";
}

}

#endif
