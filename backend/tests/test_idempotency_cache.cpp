#include <catch2/catch_test_macros.hpp>
#include "infrastructure/cache/idempotency_cache.hpp"
#include "domain/types.hpp"
#include <chrono>
#include <thread>

using namespace proptrade::infrastructure::cache;
using namespace proptrade::domain;

namespace {

FillResult filled(const std::string& orderId) {
    FillResult fill;
    fill.orderId = orderId;
    fill.executionPrice = 50010.0;
    return fill;
}

} // namespace

TEST_CASE("IdempotencyCache - Basic Operations", "[cache]") {
    IdempotencyCache cache;

    SECTION("Store and retrieve a fill") {
        std::string key = "user-1:client-123";
        cache.put(key, filled("ORD_1"));

        auto retrieved = cache.get(key);
        REQUIRE(retrieved.has_value());
        REQUIRE(std::holds_alternative<FillResult>(*retrieved));
        REQUIRE(std::get<FillResult>(*retrieved).orderId == "ORD_1");
        REQUIRE(std::get<FillResult>(*retrieved).executionPrice == 50010.0);
    }

    SECTION("Non-existent key returns empty") {
        REQUIRE_FALSE(cache.get("user-1:missing").has_value());
    }

    SECTION("Keys are independent") {
        cache.put("user-1:a", filled("ORD_1"));
        PendingResult pending;
        pending.order.id = "ORD_2";
        pending.currentPrice = 50010.0;
        cache.put("user-2:a", pending);

        REQUIRE(std::get<FillResult>(*cache.get("user-1:a")).orderId == "ORD_1");
        REQUIRE(std::get<PendingResult>(*cache.get("user-2:a")).order.id == "ORD_2");
        REQUIRE(cache.size() == 2);
    }

    SECTION("Overwrite existing result") {
        cache.put("user-1:a", filled("ORD_1"));
        cache.put("user-1:a", filled("ORD_2"));
        REQUIRE(std::get<FillResult>(*cache.get("user-1:a")).orderId == "ORD_2");
        REQUIRE(cache.size() == 1);
    }

    SECTION("Rejections are not stored") {
        cache.put("user-1:a", Rejection(RejectCode::INSUFFICIENT_MARGIN, "Insufficient margin"));
        REQUIRE_FALSE(cache.get("user-1:a").has_value());
        REQUIRE(cache.size() == 0);
    }
}

TEST_CASE("IdempotencyCache - TTL Behavior", "[cache]") {
    IdempotencyCache cache;

    SECTION("Entry is available until it expires") {
        cache.put("user-1:ttl", filled("ORD_1"), 1);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        REQUIRE_FALSE(cache.get("user-1:ttl").has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Cleanup drops only expired entries") {
        cache.put("user-1:short", filled("ORD_1"), 1);
        cache.put("user-1:long", filled("ORD_2"));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        REQUIRE(cache.cleanup() == 1);
        REQUIRE(cache.size() == 1);
        REQUIRE(cache.get("user-1:long").has_value());
    }
}
