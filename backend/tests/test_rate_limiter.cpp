#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "application/lock_registry.hpp"
#include "application/rate_limiter.hpp"
#include <future>
#include <limits>
#include <thread>

using namespace proptrade::application;
using namespace proptrade::domain;

TEST_CASE("RateLimiter - Fixed Window", "[ratelimit]") {
    RateLimiter limiter;
    const int64_t start = 1000000;

    SECTION("Ten orders per second, the eleventh is refused") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(limiter.check("user-1", "PLACE_ORDER", start + i).allowed);
        }
        auto refused = limiter.check("user-1", "PLACE_ORDER", start + 10);
        REQUIRE_FALSE(refused.allowed);
        REQUIRE(refused.remaining == 0);
        REQUIRE(refused.resetInMs == 990);
    }

    SECTION("Window resets after it elapses") {
        for (int i = 0; i < 10; ++i) {
            limiter.check("user-1", "PLACE_ORDER", start);
        }
        REQUIRE(limiter.check("user-1", "PLACE_ORDER", start + 1000).allowed);
        REQUIRE(limiter.getRemainingRequests("user-1", "PLACE_ORDER", start + 1000) == 9);
    }

    SECTION("Users and actions are independent") {
        for (int i = 0; i < 10; ++i) {
            limiter.check("user-1", "PLACE_ORDER", start);
        }
        REQUIRE(limiter.check("user-2", "PLACE_ORDER", start).allowed);
        REQUIRE(limiter.check("user-1", "CLOSE_POSITION", start).allowed);
    }

    SECTION("Unknown actions use the default limit") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(limiter.check("user-1", "SOMETHING", start).allowed);
        }
        REQUIRE_FALSE(limiter.check("user-1", "SOMETHING", start).allowed);
    }

    SECTION("Cleanup drops idle windows") {
        limiter.check("user-1", "PLACE_ORDER", start);
        limiter.check("user-2", "PLACE_ORDER", start + 5000);
        limiter.cleanup(start + 5000);
        REQUIRE(limiter.size() == 1);
    }
}

TEST_CASE("RateLimiter - Timestamp Replay Guard", "[ratelimit]") {
    const int64_t now = 1700000000000;

    SECTION("Missing timestamp") {
        auto error = RateLimiter::validateTimestamp(std::nullopt, now);
        REQUIRE(error->code == RejectCode::TIMESTAMP_INVALID);
    }

    SECTION("Up to three seconds old is accepted") {
        REQUIRE_FALSE(RateLimiter::validateTimestamp(now - 3000, now).has_value());
        auto expired = RateLimiter::validateTimestamp(now - 4000, now);
        REQUIRE(expired->reason == "Order timestamp expired (4s old, max 3s)");
    }

    SECTION("One second of clock skew into the future") {
        REQUIRE_FALSE(RateLimiter::validateTimestamp(now + 1000, now).has_value());
        REQUIRE_THAT(RateLimiter::validateTimestamp(now + 1001, now)->reason,
                     Catch::Matchers::ContainsSubstring("future"));
    }

    SECTION("Extreme client timestamps are rejected") {
        auto ancient = RateLimiter::validateTimestamp(std::numeric_limits<int64_t>::min(), now);
        REQUIRE(ancient->code == RejectCode::TIMESTAMP_INVALID);
        REQUIRE_THAT(ancient->reason, Catch::Matchers::ContainsSubstring("expired"));

        auto distant = RateLimiter::validateTimestamp(std::numeric_limits<int64_t>::max(), now);
        REQUIRE_THAT(distant->reason, Catch::Matchers::ContainsSubstring("future"));
    }
}

TEST_CASE("LockRegistry - Bounded Acquisition", "[locks]") {
    LockRegistry registry(std::chrono::milliseconds(20));

    SECTION("Free lock is acquired") {
        auto lock = registry.acquire("ACC_1");
        REQUIRE(lock.owns());
        REQUIRE(lock.id() == "ACC_1");
    }

    SECTION("Held lock times out for another thread") {
        auto held = registry.acquire("ACC_1");
        REQUIRE(held.owns());

        auto contender = std::async(std::launch::async, [&registry] {
            return registry.acquire("ACC_1").owns();
        });
        REQUIRE_FALSE(contender.get());
    }

    SECTION("Different ids do not contend") {
        auto first = registry.acquire("ACC_1");
        auto other = std::async(std::launch::async, [&registry] {
            return registry.acquire("ACC_2").owns();
        });
        REQUIRE(other.get());
    }

    SECTION("Release forgets the entity") {
        { auto lock = registry.acquire("POS_1"); }
        REQUIRE(registry.size() == 1);
        registry.release("POS_1");
        REQUIRE(registry.size() == 0);
    }
}
