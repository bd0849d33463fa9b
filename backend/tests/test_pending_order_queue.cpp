#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "application/pending_order_queue.hpp"
#include "test_fakes.hpp"

using namespace proptrade::application;
using namespace proptrade::domain;
using namespace proptrade::testing;
using Catch::Approx;

namespace {

PendingOrder admitOrder(TradingFixture& fx, const OrderRequest& request) {
    auto lock = fx.ledger.lock(request.accountId);
    auto outcome = fx.pending.admit(lock, request, 50010.0);
    return std::get<PendingResult>(outcome).order;
}

} // namespace

TEST_CASE("PendingOrderQueue - Admission Reserves Margin", "[pending]") {
    TradingFixture fx;

    SECTION("Reservation is computed at the limit price") {
        // 0.01 @ 49000 x10: margin 49, fee 0.245
        auto order = admitOrder(fx, limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0));
        REQUIRE(order.marginReserved == Approx(49.245));
        REQUIRE(order.status == PendingOrderStatus::PENDING);
        REQUIRE(fx.account().availableMargin == Approx(100000.0 - 49.245));
        REQUIRE(fx.account().totalMarginUsed == 0.0);
        REQUIRE(fx.pending.reservedForAccount("ACC_1") == Approx(49.245));
        REQUIRE(fx.sink.count(TradeEventType::ORDER_PENDING) == 1);
    }

    SECTION("Reservation larger than available margin") {
        auto lock = fx.ledger.lock("ACC_1");
        auto outcome = fx.pending.admit(lock, limitOrder("c1", "BTCUSDT", Side::LONG, 50.0, 49000.0, 2.0), 50010.0);
        REQUIRE(std::get<Rejection>(outcome).code == RejectCode::INSUFFICIENT_MARGIN);
        REQUIRE(fx.pending.pendingCount() == 0);
    }
}

TEST_CASE("PendingOrderQueue - Cancel", "[pending]") {
    TradingFixture fx;
    auto order = admitOrder(fx, limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0));

    SECTION("Cancel releases the reservation once") {
        auto cancelled = std::get<CancelResult>(fx.pending.cancel(order.id, "user-1"));
        REQUIRE(cancelled.marginReleased == Approx(49.245));
        REQUIRE(cancelled.order.status == PendingOrderStatus::CANCELLED);
        REQUIRE(fx.account().availableMargin == Approx(100000.0));

        auto again = fx.pending.cancel(order.id, "user-1");
        REQUIRE(std::get<Rejection>(again).code == RejectCode::ORDER_NOT_CANCELLABLE);
        REQUIRE(fx.account().availableMargin == Approx(100000.0));
    }

    SECTION("Other users cannot cancel") {
        REQUIRE(std::get<Rejection>(fx.pending.cancel(order.id, "user-2")).code == RejectCode::NOT_OWNER);
        REQUIRE(std::get<Rejection>(fx.pending.cancel("ORD_missing", "user-1")).code == RejectCode::ORDER_NOT_FOUND);
    }

    SECTION("A claimed order is no longer cancellable") {
        {
            auto lock = fx.ledger.lock("ACC_1");
            REQUIRE(fx.pending.claim(lock, order.id, PendingOrderStatus::FILLED).has_value());
        }
        REQUIRE(std::get<Rejection>(fx.pending.cancel(order.id, "user-1")).code == RejectCode::ORDER_NOT_CANCELLABLE);
    }

    SECTION("Breach cancels everything on the account") {
        admitOrder(fx, limitOrder("c2", "ETHUSDT", Side::SHORT, 1.0, 3100.0));
        auto lock = fx.ledger.lock("ACC_1");
        auto cancelled = fx.pending.cancelAllForAccount(lock);
        REQUIRE(cancelled.size() == 2);
        REQUIRE(fx.pending.pendingCount() == 0);
        REQUIRE(fx.account().availableMargin == Approx(100000.0));
    }
}

TEST_CASE("PendingOrderQueue - Fill Conditions", "[pending]") {
    PendingOrder buy;
    buy.side = Side::LONG;
    buy.limitPrice = 50000.0;

    PendingOrder sell;
    sell.side = Side::SHORT;
    sell.limitPrice = 50000.0;

    SECTION("Long fills when ask reaches the limit") {
        REQUIRE(PendingOrderQueue::isFillable(buy, PriceSnapshot("BTCUSDT", 49980.0, 50000.0, 0)));
        REQUIRE_FALSE(PendingOrderQueue::isFillable(buy, PriceSnapshot("BTCUSDT", 49990.0, 50010.0, 0)));
        REQUIRE(PendingOrderQueue::executionPriceFor(buy, PriceSnapshot("BTCUSDT", 49900.0, 49950.0, 0)) == 49950.0);
    }

    SECTION("Short fills when bid reaches the limit") {
        REQUIRE(PendingOrderQueue::isFillable(sell, PriceSnapshot("BTCUSDT", 50000.0, 50020.0, 0)));
        REQUIRE_FALSE(PendingOrderQueue::isFillable(sell, PriceSnapshot("BTCUSDT", 49990.0, 50010.0, 0)));
        REQUIRE(PendingOrderQueue::executionPriceFor(sell, PriceSnapshot("BTCUSDT", 50100.0, 50120.0, 0)) == 50100.0);
    }
}

TEST_CASE("PendingOrderQueue - Collect And Expire", "[pending]") {
    TradingFixture fx;
    auto buy = admitOrder(fx, limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0));
    auto expiring = limitOrder("c2", "BTCUSDT", Side::LONG, 0.01, 48000.0);
    expiring.expiresAt = 1000;
    auto stale = admitOrder(fx, expiring);

    SECTION("Only orders the quote satisfies are collected") {
        auto fillable = fx.pending.collectFillable(PriceSnapshot("BTCUSDT", 48980.0, 48990.0, 0));
        REQUIRE(fillable.size() == 1);
        REQUIRE(fillable[0].id == buy.id);
        REQUIRE(fx.pending.collectFillable(PriceSnapshot("ETHUSDT", 1.0, 1.0, 0)).empty());
    }

    SECTION("Overdue orders expire and release margin") {
        auto expired = fx.pending.cleanupExpired(2000);
        REQUIRE(expired.size() == 1);
        REQUIRE(expired[0].id == stale.id);
        REQUIRE(expired[0].status == PendingOrderStatus::EXPIRED);
        REQUIRE(fx.pending.pendingCount() == 1);
        REQUIRE(fx.account().availableMargin == Approx(100000.0 - buy.marginReserved));
        REQUIRE(fx.sink.count(TradeEventType::ORDER_EXPIRED) == 1);
    }
}
