#include <catch2/catch_test_macros.hpp>
#include "interfaces/session_channel.hpp"
#include <string>
#include <vector>

using proptrade::interfaces::SessionChannel;

TEST_CASE("SessionChannel - Outbox", "[session]") {
    SessionChannel channel("session-1", 100);
    std::vector<std::string> written;
    auto writer = [&written](const std::string& sessionId, const std::string& type, const std::string& payload) {
        written.push_back(sessionId + "/" + type + "/" + payload);
        return true;
    };

    SECTION("Frames drain in order and reset the byte count") {
        REQUIRE(channel.send("PRICE_UPDATE", "{\"a\":1}"));
        REQUIRE(channel.send("ORDER_FILLED", "{\"b\":2}"));
        REQUIRE(channel.bufferedAmount() == 14);

        REQUIRE(channel.drain(writer) == 2);
        REQUIRE(written == std::vector<std::string>{"session-1/PRICE_UPDATE/{\"a\":1}",
                                                    "session-1/ORDER_FILLED/{\"b\":2}"});
        REQUIRE(channel.bufferedAmount() == 0);
        REQUIRE(channel.drain(writer) == 0);
    }

    SECTION("A failed write closes the session") {
        channel.send("A", "1");
        channel.send("B", "2");
        size_t calls = 0;
        auto failing = [&calls](const std::string&, const std::string&, const std::string&) {
            ++calls;
            return false;
        };

        REQUIRE(channel.drain(failing) == 0);
        REQUIRE(calls == 1);
        REQUIRE(channel.isClosed());
        REQUIRE_FALSE(channel.send("C", "3"));
    }

    SECTION("Overflow past four times the limit closes the session") {
        std::string chunk(150, 'x');
        REQUIRE(channel.send("A", chunk));
        REQUIRE(channel.send("A", chunk));
        REQUIRE_FALSE(channel.send("A", chunk));
        REQUIRE(channel.isClosed());
    }

    SECTION("Closed sessions accept nothing") {
        channel.close();
        REQUIRE_FALSE(channel.send("A", "1"));
        REQUIRE(channel.bufferedAmount() == 0);
    }
}
