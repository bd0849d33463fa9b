#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "application/order_executor.hpp"
#include "application/trigger_engine.hpp"
#include "test_fakes.hpp"
#include <future>
#include <string>
#include <vector>

using namespace proptrade::application;
using namespace proptrade::domain;
using namespace proptrade::testing;
using Catch::Approx;

TEST_CASE("OrderExecutor - Market Fills", "[executor]") {
    TradingFixture fx;

    SECTION("Long fills at ask and debits margin plus fee") {
        auto outcome = fx.executor.place(marketOrder("c1", "BTCUSDT", Side::LONG, 0.01));
        auto fill = std::get<FillResult>(outcome.result);

        REQUIRE_FALSE(outcome.duplicate);
        REQUIRE(fill.executionPrice == 50010.0);
        REQUIRE(fill.marginRequired == Approx(50.01));
        REQUIRE(fill.entryFee == Approx(0.25005));
        REQUIRE(fill.position.liquidationPrice == Approx(50010.0 * 0.905));
        REQUIRE(fill.account.availableMargin == Approx(100000.0 - 50.26005));
        REQUIRE(fill.account.totalMarginUsed == Approx(50.01));
        REQUIRE(fx.positions.size() == 1);
        REQUIRE(fx.sink.count(TradeEventType::ORDER_FILLED) == 1);
        REQUIRE(fx.sink.count(TradeEventType::POSITION_OPENED) == 1);
    }

    SECTION("Short fills at bid") {
        auto fill = fx.fill(marketOrder("c1", "BTCUSDT", Side::SHORT, 0.01));
        REQUIRE(fill.executionPrice == 49990.0);
        REQUIRE(fill.position.side == Side::SHORT);
    }

    SECTION("Margin conservation across open and close") {
        auto fill = fx.fill(marketOrder("c1", "BTCUSDT", Side::LONG, 0.5));
        auto account = fx.account();
        // available + used == balance while a position is open
        REQUIRE(account.availableMargin + account.totalMarginUsed == Approx(account.currentBalance));

        auto closed = fx.executor.closePosition("user-1", fill.position.id, std::nullopt, currentTimeMs());
        REQUIRE(std::holds_alternative<CloseResult>(closed));
        account = fx.account();
        REQUIRE(account.totalMarginUsed == Approx(0.0));
        REQUIRE(account.availableMargin == Approx(account.currentBalance));
    }

    SECTION("Protection levels are judged against the fill price") {
        auto order = marketOrder("c1", "BTCUSDT", Side::LONG, 0.01);
        order.takeProfit = 50005.0;
        auto outcome = fx.executor.place(order);
        REQUIRE(std::get<Rejection>(outcome.result).code == RejectCode::TAKE_PROFIT_WRONG_SIDE);
        REQUIRE(fx.positions.size() == 0);
    }
}

TEST_CASE("OrderExecutor - Rejections Leave State Untouched", "[executor]") {
    TradingFixture fx;
    auto before = fx.account();

    SECTION("Stale price") {
        fx.prices.setPrice("BTCUSDT", 49990.0, 50010.0, currentTimeMs() - 10000);
        auto outcome = fx.executor.place(marketOrder("c1", "BTCUSDT", Side::LONG, 0.01));
        auto rejection = std::get<Rejection>(outcome.result);
        REQUIRE(rejection.code == RejectCode::PRICE_STALE);
        REQUIRE(rejection.reason == "Price data is stale. Please try again.");
    }

    SECTION("No price") {
        auto outcome = fx.executor.place(marketOrder("c1", "SOLUSDT", Side::LONG, 1.0));
        REQUIRE(std::get<Rejection>(outcome.result).code == RejectCode::PRICE_UNAVAILABLE);
    }

    SECTION("Insufficient margin") {
        auto outcome = fx.executor.place(marketOrder("c1", "BTCUSDT", Side::LONG, 100.0, 1.0));
        REQUIRE(std::get<Rejection>(outcome.result).code == RejectCode::INSUFFICIENT_MARGIN);
    }

    SECTION("Account owned by someone else") {
        auto order = marketOrder("c1", "BTCUSDT", Side::LONG, 0.01);
        order.userId = "user-2";
        REQUIRE(std::get<Rejection>(fx.executor.place(order).result).code == RejectCode::NOT_OWNER);
    }

    SECTION("Expired client timestamp") {
        auto order = marketOrder("c1", "BTCUSDT", Side::LONG, 0.01);
        order.timestamp = currentTimeMs() - 10000;
        REQUIRE(std::get<Rejection>(fx.executor.place(order).result).code == RejectCode::TIMESTAMP_INVALID);
    }

    SECTION("Rate limit") {
        auto now = currentTimeMs();
        for (int i = 0; i < 10; ++i) {
            fx.rateLimiter.check("user-1", "PLACE_ORDER", now);
        }
        auto order = marketOrder("c1", "BTCUSDT", Side::LONG, 0.01);
        auto rejection = std::get<Rejection>(fx.executor.place(order, now).result);
        REQUIRE(rejection.code == RejectCode::RATE_LIMITED);
        REQUIRE_THAT(rejection.reason, Catch::Matchers::StartsWith("Rate limit exceeded. Try again in "));
    }

    auto after = fx.account();
    REQUIRE(after.availableMargin == before.availableMargin);
    REQUIRE(after.currentBalance == before.currentBalance);
    REQUIRE(after.totalMarginUsed == before.totalMarginUsed);
    REQUIRE(fx.positions.size() == 0);
}

TEST_CASE("OrderExecutor - Idempotent Placement", "[executor]") {
    TradingFixture fx;

    SECTION("Duplicate clientOrderId replays the fill") {
        auto order = marketOrder("dup-1", "BTCUSDT", Side::LONG, 0.01);
        auto first = fx.executor.place(order);
        auto second = fx.executor.place(order);

        REQUIRE(second.duplicate);
        REQUIRE(std::get<FillResult>(second.result).orderId == std::get<FillResult>(first.result).orderId);
        REQUIRE(fx.positions.size() == 1);
        REQUIRE(fx.account().totalTrades == 1);
    }

    SECTION("Rejections are not cached") {
        auto order = marketOrder("dup-2", "BTCUSDT", Side::LONG, 0.01);
        order.takeProfit = 40000.0;
        REQUIRE(std::holds_alternative<Rejection>(fx.executor.place(order).result));

        order.takeProfit = 60000.0;
        auto retry = fx.executor.place(order);
        REQUIRE(std::holds_alternative<FillResult>(retry.result));
        REQUIRE_FALSE(retry.duplicate);
    }

    SECTION("Same clientOrderId from another user is a different order") {
        fx.store.updateAccount(AccountState("ACC_2", "user-2", 100000.0, 5000.0, 10000.0));
        auto other = marketOrder("shared", "BTCUSDT", Side::LONG, 0.01);
        other.userId = "user-2";
        other.accountId = "ACC_2";

        fx.fill(marketOrder("shared", "BTCUSDT", Side::LONG, 0.01));
        REQUIRE_FALSE(fx.executor.place(other).duplicate);
        REQUIRE(fx.positions.size() == 2);
    }

    SECTION("Concurrent duplicates execute once") {
        auto order = marketOrder("race", "BTCUSDT", Side::LONG, 0.01);
        std::vector<std::future<PlacementOutcome>> attempts;
        for (int i = 0; i < 4; ++i) {
            attempts.push_back(std::async(std::launch::async, [&fx, order] { return fx.executor.place(order); }));
        }

        int fills = 0;
        for (auto& attempt : attempts) {
            auto outcome = attempt.get();
            if (std::holds_alternative<FillResult>(outcome.result)) {
                ++fills;
            } else {
                // Only a contended lock may refuse
                REQUIRE(std::get<Rejection>(outcome.result).code == RejectCode::LOCK_TIMEOUT);
            }
        }
        REQUIRE(fills >= 1);
        REQUIRE(fx.positions.size() == 1);
    }
}

TEST_CASE("OrderExecutor - Limit Orders", "[executor]") {
    TradingFixture fx;

    SECTION("A limit that does not cross rests in the queue") {
        auto outcome = fx.executor.place(limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0));
        auto pending = std::get<PendingResult>(outcome.result);
        REQUIRE(pending.currentPrice == 50010.0);
        REQUIRE(fx.pending.pendingCount() == 1);
        REQUIRE(fx.positions.size() == 0);
    }

    SECTION("A limit that crosses fills at the market price") {
        auto fill = fx.fill(limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 50100.0));
        REQUIRE(fill.executionPrice == 50010.0);
        REQUIRE(fx.pending.pendingCount() == 0);
    }

    SECTION("Tick that reaches the limit fills the resting order") {
        auto pending = std::get<PendingResult>(fx.executor.place(limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0)).result);
        fx.prices.setPrice("BTCUSDT", 48970.0, 48990.0);

        auto fills = fx.executor.fillPending(*fx.prices.getPrice("BTCUSDT"));
        REQUIRE(fills.size() == 1);
        auto fill = std::get<FillResult>(fills[0].result);
        REQUIRE(fill.orderId == pending.order.id);
        REQUIRE(fill.filledFromQueue);
        REQUIRE(fill.executionPrice == 48990.0);
        REQUIRE(fx.pending.pendingCount() == 0);

        // Reservation swapped for the actual margin at the execution price
        auto account = fx.account();
        REQUIRE(account.totalMarginUsed == Approx(48.99));
        REQUIRE(account.availableMargin == Approx(100000.0 - 48.99 - 0.244950));
    }

    SECTION("A failed queued fill cancels the order and keeps margin whole") {
        auto order = limitOrder("c1", "BTCUSDT", Side::LONG, 0.01, 49000.0);
        order.stopLoss = 48500.0;
        fx.executor.place(order);
        fx.prices.setPrice("BTCUSDT", 48400.0, 48420.0);

        auto fills = fx.executor.fillPending(*fx.prices.getPrice("BTCUSDT"));
        REQUIRE(fills.size() == 1);
        REQUIRE(std::get<Rejection>(fills[0].result).code == RejectCode::STOP_LOSS_WRONG_SIDE);
        REQUIRE(fills[0].order.status == PendingOrderStatus::CANCELLED);
        REQUIRE(fx.account().availableMargin == Approx(100000.0));
        REQUIRE(fx.positions.size() == 0);
    }
}

TEST_CASE("OrderExecutor - Client Close And Modify", "[executor]") {
    TradingFixture fx;
    auto fill = fx.fill(marketOrder("c1", "BTCUSDT", Side::LONG, 0.02));

    SECTION("Partial close") {
        auto closed = std::get<CloseResult>(fx.executor.closePosition("user-1", fill.position.id, 0.01, currentTimeMs()));
        REQUIRE(closed.partial);
        REQUIRE(closed.exitPrice == 49990.0);
    }

    SECTION("Close refused on a stale price") {
        fx.prices.setPrice("BTCUSDT", 49990.0, 50010.0, currentTimeMs() - 60000);
        auto outcome = fx.executor.closePosition("user-1", fill.position.id, std::nullopt, currentTimeMs());
        REQUIRE(std::get<Rejection>(outcome).code == RejectCode::PRICE_STALE);
        REQUIRE(fx.positions.size() == 1);
    }

    SECTION("Unknown position") {
        auto outcome = fx.executor.closePosition("user-1", "POS_missing", std::nullopt, currentTimeMs());
        REQUIRE(std::get<Rejection>(outcome).code == RejectCode::POSITION_NOT_FOUND);
    }

    SECTION("Modify goes through the position manager") {
        auto outcome = fx.executor.modifyPosition("user-1", fill.position.id, 55000.0, std::nullopt, currentTimeMs());
        REQUIRE(*std::get<ModifyResult>(outcome).position.takeProfit == 55000.0);
    }
}

namespace {

std::map<std::string, RateLimitConfig> unthrottled() {
    return {
        {"PLACE_ORDER", {1000, 10000}},
        {"CLOSE_POSITION", {1000, 10000}},
        {"CANCEL_ORDER", {1000, 10000}}
    };
}

// currentBalance == availableMargin + margin held by positions + margin reserved by resting orders
void requireMarginConserved(TradingFixture& fx) {
    auto account = fx.account();
    double used = 0.0;
    for (const auto& position : fx.positions.getByAccount("ACC_1")) {
        used += position.marginUsed;
    }
    double reserved = fx.pending.reservedForAccount("ACC_1");

    REQUIRE(account.totalMarginUsed == Approx(used).margin(1e-6));
    REQUIRE(account.availableMargin + used + reserved == Approx(account.currentBalance));
}

} // namespace

TEST_CASE("OrderExecutor - Concurrent Margin Conservation", "[executor][concurrency]") {
    TradingFixture fx(unthrottled());
    constexpr int kThreads = 8;
    constexpr int kOrdersPerThread = 12;

    std::vector<std::future<std::vector<PlacementOutcome>>> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.push_back(std::async(std::launch::async, [&fx, t] {
            std::vector<PlacementOutcome> outcomes;
            for (int i = 0; i < kOrdersPerThread; ++i) {
                auto id = "t" + std::to_string(t) + "-" + std::to_string(i);
                OrderRequest order;
                switch (i % 3) {
                    case 0:
                        order = limitOrder(id, "BTCUSDT", Side::LONG, 0.01, 49000.0 - i);
                        break;
                    case 1:
                        order = marketOrder(id, "ETHUSDT", Side::SHORT, 0.1);
                        break;
                    default:
                        order = marketOrder(id, "BTCUSDT", Side::LONG, 0.01, 20.0);
                        break;
                }
                outcomes.push_back(fx.executor.place(order));
            }
            return outcomes;
        }));
    }

    size_t fills = 0;
    size_t rested = 0;
    double fees = 0.0;
    for (auto& worker : workers) {
        for (const auto& outcome : worker.get()) {
            if (auto* fill = std::get_if<FillResult>(&outcome.result)) {
                ++fills;
                fees += fill->entryFee;
            } else if (std::holds_alternative<PendingResult>(outcome.result)) {
                ++rested;
            } else {
                REQUIRE(std::get<Rejection>(outcome.result).code == RejectCode::LOCK_TIMEOUT);
            }
        }
    }

    REQUIRE(fills > 0);
    REQUIRE(rested > 0);
    REQUIRE(fx.positions.size() == fills);
    REQUIRE(fx.pending.pendingCount() == rested);
    REQUIRE(fx.account().currentBalance == Approx(100000.0 - fees));
    requireMarginConserved(fx);

    SECTION("Unwinding from many threads returns every reservation") {
        std::vector<std::future<CloseOutcome>> closes;
        for (const auto& position : fx.positions.getByAccount("ACC_1")) {
            closes.push_back(std::async(std::launch::async, [&fx, id = position.id] {
                return fx.executor.closePosition("user-1", id, std::nullopt, currentTimeMs());
            }));
        }
        std::vector<std::future<CancelOutcome>> cancels;
        for (const auto& order : fx.pending.pendingForAccount("ACC_1")) {
            cancels.push_back(std::async(std::launch::async, [&fx, id = order.id] {
                return fx.executor.cancelOrder("user-1", id);
            }));
        }
        // Contention may refuse with the retryable lock timeout, never with anything else
        for (auto& close : closes) {
            auto outcome = close.get();
            if (auto* rejection = std::get_if<Rejection>(&outcome)) {
                REQUIRE(rejection->code == RejectCode::LOCK_TIMEOUT);
            }
        }
        for (auto& cancel : cancels) {
            auto outcome = cancel.get();
            if (auto* rejection = std::get_if<Rejection>(&outcome)) {
                REQUIRE(rejection->code == RejectCode::LOCK_TIMEOUT);
            }
        }
        for (const auto& position : fx.positions.getByAccount("ACC_1")) {
            REQUIRE(std::holds_alternative<CloseResult>(
                fx.executor.closePosition("user-1", position.id, std::nullopt, currentTimeMs())));
        }
        for (const auto& order : fx.pending.pendingForAccount("ACC_1")) {
            REQUIRE(std::holds_alternative<CancelResult>(fx.executor.cancelOrder("user-1", order.id)));
        }

        auto account = fx.account();
        REQUIRE(fx.positions.size() == 0);
        REQUIRE(fx.pending.pendingCount() == 0);
        REQUIRE(account.totalMarginUsed == Approx(0.0).margin(1e-6));
        REQUIRE(account.availableMargin == Approx(account.currentBalance));
    }
}

TEST_CASE("OrderExecutor - Trigger And Client Close Race", "[executor][concurrency]") {
    TradingFixture fx(unthrottled());
    TriggerEngine triggers(fx.positions, 5000);
    constexpr int kRounds = 20;

    for (int round = 0; round < kRounds; ++round) {
        fx.prices.setPrice("BTCUSDT", 49990.0, 50010.0);
        auto request = marketOrder("race-" + std::to_string(round), "BTCUSDT", Side::LONG, 0.01);
        request.takeProfit = 51000.0;
        auto positionId = fx.fill(request).position.id;

        fx.prices.setPrice("BTCUSDT", 51490.0, 51510.0);
        PriceSnapshot tick("BTCUSDT", 51490.0, 51510.0, currentTimeMs());

        std::promise<void> start;
        auto started = start.get_future().share();
        auto scan = std::async(std::launch::async, [&triggers, tick, started] {
            started.wait();
            return triggers.onPriceUpdate(tick, currentTimeMs());
        });
        auto manual = std::async(std::launch::async, [&fx, positionId, started] {
            started.wait();
            return fx.executor.closePosition("user-1", positionId, std::nullopt, currentTimeMs());
        });
        start.set_value();

        auto scanned = scan.get();
        auto closed = manual.get();
        size_t closes = scanned.closed.size() + (std::holds_alternative<CloseResult>(closed) ? 1 : 0);
        REQUIRE(closes == 1);
        REQUIRE_FALSE(fx.positions.get(positionId).has_value());
        requireMarginConserved(fx);
    }

    auto account = fx.account();
    REQUIRE(fx.positions.size() == 0);
    REQUIRE(fx.sink.count(TradeEventType::POSITION_CLOSED) == kRounds);
    REQUIRE(account.availableMargin == Approx(account.currentBalance));
}
