#include <catch2/catch_test_macros.hpp>
#include "utils/parser.hpp"
#include <map>
#include <string>
#include <vector>

using proptrade::utils::parsePayload;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

template <typename T>
std::vector<uint8_t> packed(const T& value) {
    msgpack::sbuffer buffer;
    msgpack::pack(buffer, value);
    return std::vector<uint8_t>(buffer.data(), buffer.data() + buffer.size());
}

} // namespace

TEST_CASE("Payload Parser - JSON", "[parser]") {
    SECTION("Object text") {
        auto payload = parsePayload(bytes(R"({"symbol":"BTCUSDT","quantity":0.01})"));
        REQUIRE(payload.has_value());
        REQUIRE((*payload)["symbol"] == "BTCUSDT");
        REQUIRE((*payload)["quantity"] == 0.01);
    }

    SECTION("Empty payload is an empty object") {
        auto payload = parsePayload({});
        REQUIRE(payload.has_value());
        REQUIRE(payload->is_object());
        REQUIRE(payload->empty());
    }
}

TEST_CASE("Payload Parser - MsgPack", "[parser]") {
    SECTION("String map") {
        std::map<std::string, std::string> map = {{"token", "abc"}, {"accountId", "ACC_1"}};
        auto payload = parsePayload(packed(map));
        REQUIRE(payload.has_value());
        REQUIRE((*payload)["token"] == "abc");
        REQUIRE((*payload)["accountId"] == "ACC_1");
    }

    SECTION("Numbers, booleans and nested arrays") {
        msgpack::sbuffer buffer;
        msgpack::packer<msgpack::sbuffer> packer(buffer);
        packer.pack_map(4);
        packer.pack(std::string("quantity"));
        packer.pack(0.5);
        packer.pack(std::string("leverage"));
        packer.pack(-3);
        packer.pack(std::string("reduceOnly"));
        packer.pack(true);
        packer.pack(std::string("symbols"));
        packer.pack(std::vector<std::string>{"BTCUSDT", "ETHUSDT"});

        auto payload = parsePayload(std::vector<uint8_t>(buffer.data(), buffer.data() + buffer.size()));
        REQUIRE(payload.has_value());
        REQUIRE((*payload)["quantity"] == 0.5);
        REQUIRE((*payload)["leverage"] == -3);
        REQUIRE((*payload)["reduceOnly"] == true);
        REQUIRE((*payload)["symbols"][1] == "ETHUSDT");
    }

    SECTION("Non-string keys are skipped") {
        std::map<int, std::string> map = {{1, "one"}};
        auto payload = parsePayload(packed(map));
        REQUIRE(payload.has_value());
        REQUIRE(payload->empty());
    }

    SECTION("Bytes that are neither format") {
        REQUIRE_FALSE(parsePayload(std::vector<uint8_t>{0xc1}).has_value());
        REQUIRE_FALSE(parsePayload(std::vector<uint8_t>{0x92, 0x01}).has_value());
    }
}
