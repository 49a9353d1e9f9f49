#include <catch2/catch_test_macros.hpp>
#include <duplex/ws/headers.hpp>

using namespace duplex::ws;

TEST_CASE("Header list operations", "[headers][unit]") {
    headers hdrs;

    SECTION("set and get header") {
        hdrs.set_header("Content-Type", "application/json");

        REQUIRE(hdrs.has_header("Content-Type"));
        REQUIRE(hdrs.get_header("Content-Type") == "application/json");
        REQUIRE(hdrs.get_header("content-type") == "application/json"); // Case insensitive
    }

    SECTION("set_header replaces existing case-insensitive") {
        hdrs.set_header("Content-Type", "text/html");
        hdrs.set_header("content-type", "application/json");
        REQUIRE(hdrs.size() == 1);
        REQUIRE(hdrs.get_header("Content-Type") == "application/json");
    }

    SECTION("missing header is empty") {
        REQUIRE_FALSE(hdrs.has_header("X-Missing"));
        REQUIRE(hdrs.get_header("X-Missing").empty());
    }

    SECTION("empty names are ignored") {
        hdrs.set_header("", "value");
        REQUIRE(hdrs.empty());
    }

    SECTION("remove header") {
        hdrs.set_header("Authorization", "Bearer token123");
        hdrs.set_header("Accept", "*/*");
        hdrs.remove_header("authorization");

        REQUIRE_FALSE(hdrs.has_header("Authorization"));
        REQUIRE(hdrs.size() == 1);
    }

    SECTION("insertion order is kept") {
        hdrs.set_header("B", "2");
        hdrs.set_header("A", "1");
        hdrs.set_header("C", "3");
        hdrs.set_header("a", "one");

        const auto& all = hdrs.get_headers();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0].first == "B");
        REQUIRE(all[1].first == "a");
        REQUIRE(all[1].second == "one");
        REQUIRE(all[2].first == "C");
    }
}

TEST_CASE("Header list construction and merge", "[headers][unit]") {

    SECTION("initializer list") {
        headers hdrs{{"Authorization", "Bearer x"}, {"X-Trace", "1"}};
        REQUIRE(hdrs.size() == 2);
        REQUIRE(hdrs.get_header("x-trace") == "1");
    }

    SECTION("from a map") {
        std::map<std::string, std::string> values{{"A", "1"}, {"B", "2"}};
        headers hdrs(values);
        REQUIRE(hdrs.size() == 2);
        REQUIRE(hdrs.get_header("b") == "2");
    }

    SECTION("merge lets the other list win") {
        headers base{{"User-Agent", "duplex"}, {"Host", "example.com"}};
        headers custom{{"user-agent", "custom"}, {"X-Extra", "yes"}};
        base.merge(custom);

        REQUIRE(base.size() == 3);
        REQUIRE(base.get_header("User-Agent") == "custom");
        REQUIRE(base.get_header("Host") == "example.com");
        REQUIRE(base.get_header("X-Extra") == "yes");
    }

    SECTION("header name comparison") {
        REQUIRE(headers::is_header("Sec-WebSocket-Key", "sec-websocket-key"));
        REQUIRE_FALSE(headers::is_header("Sec-WebSocket-Key", "Sec-WebSocket-Accept"));
    }
}
