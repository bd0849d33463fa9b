#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "interfaces/trading_engine.hpp"
#include "infrastructure/store/in_memory_account_store.hpp"
#include "test_fakes.hpp"

using namespace proptrade::interfaces;
using namespace proptrade::domain;
using namespace proptrade::testing;
using proptrade::infrastructure::config::EngineConfig;
using proptrade::infrastructure::store::InMemoryAccountStore;
using Catch::Approx;

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

struct EngineFixture {
    int64_t startMs = currentTimeMs();
    RecordingEventSink* sink = nullptr;
    std::unique_ptr<TradingEngine> engine;
    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>();

    EngineFixture() {
        EngineConfig config;
        config.jwtSecret = "test-secret";

        auto recording = std::make_unique<RecordingEventSink>();
        sink = recording.get();
        engine = std::make_unique<TradingEngine>(config, InMemoryAccountStore::createDemo(), std::move(recording),
                                                 std::make_unique<FixedAuthInspector>(), startMs);

        engine->connections().addConnection("conn-1", channel, "demo-user-001");
        engine->connections().subscribe("conn-1", "BTCUSDT");
    }

    void quote(double mid) {
        engine->priceBook().onMidPrice("BTCUSDT", mid, currentTimeMs());
    }

    OrderRequest order(const std::string& clientOrderId, double quantity, double leverage = 10.0) {
        auto request = marketOrder(clientOrderId, "BTCUSDT", Side::LONG, quantity, leverage);
        request.userId = "demo-user-001";
        request.accountId = "ACC_DEMO_1";
        return request;
    }

    AccountState account() {
        return *engine->ledger().getAccount("ACC_DEMO_1");
    }
};

} // namespace

TEST_CASE("TradingEngine - Construction", "[engine]") {
    EngineConfig config;
    REQUIRE_THROWS_AS(TradingEngine(config, nullptr, std::make_unique<RecordingEventSink>(),
                                    std::make_unique<FixedAuthInspector>()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TradingEngine(config, InMemoryAccountStore::createDemo(), nullptr,
                                    std::make_unique<FixedAuthInspector>()),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(TradingEngine(config, InMemoryAccountStore::createDemo(),
                                    std::make_unique<RecordingEventSink>(), nullptr),
                      std::invalid_argument);
}

TEST_CASE("TradingEngine - Tick Pipeline", "[engine]") {
    EngineFixture fx;
    fx.quote(50000.0);

    SECTION("Accepted ticks reach subscribers with the spread applied") {
        auto updates = fx.channel->ofType("PRICE_UPDATE");
        REQUIRE(updates.size() == 1);
        REQUIRE(updates[0]["bid"].get<double>() == Approx(49995.0));
        REQUIRE(updates[0]["ask"].get<double>() == Approx(50005.0));
    }

    SECTION("Take profit fires on the tick and notifies the owner") {
        auto request = fx.order("c-1", 0.01);
        request.takeProfit = 51000.0;
        auto fill = std::get<FillResult>(fx.engine->executor().place(request).result);
        REQUIRE(fill.executionPrice == Approx(50005.0));

        fx.quote(51100.0);
        auto closed = fx.channel->ofType("POSITION_CLOSED");
        REQUIRE(closed.size() == 1);
        REQUIRE(closed[0]["closeReason"] == "TP_TRIGGERED");
        REQUIRE(fx.engine->positions().size() == 0);
        REQUIRE(fx.sink->count(TradeEventType::TP_TRIGGERED) == 1);
    }

    SECTION("Resting limit order fills when the ask reaches it") {
        auto request = fx.order("c-2", 0.01);
        request.type = OrderType::LIMIT;
        request.limitPrice = 49500.0;
        REQUIRE(std::holds_alternative<PendingResult>(fx.engine->executor().place(request).result));

        fx.quote(49400.0);
        auto fills = fx.channel->ofType("ORDER_FILLED");
        REQUIRE(fills.size() == 1);
        REQUIRE(fills[0]["filledFromQueue"] == true);
        REQUIRE(fx.engine->pendingOrders().pendingCount() == 0);
        REQUIRE(fx.engine->positions().size() == 1);
    }

    SECTION("Equity loss walks the account into a breach") {
        fx.engine->executor().place(fx.order("c-3", 1.0, 5.0));

        fx.quote(48000.0);
        fx.quote(46000.0);
        REQUIRE(fx.channel->ofType("RISK_WARNING").size() == 1);
        REQUIRE(fx.channel->ofType("ACCOUNT_BREACHED").empty());

        fx.quote(45000.0);
        auto breached = fx.channel->ofType("ACCOUNT_BREACHED");
        REQUIRE(breached.size() == 1);
        REQUIRE(breached[0]["breachType"] == "DAILY_LOSS");
        REQUIRE(fx.account().status == AccountStatus::BREACHED);
        REQUIRE(fx.engine->positions().size() == 0);
    }

    SECTION("A tick the circuit breaker discards changes nothing") {
        fx.engine->executor().place(fx.order("c-4", 1.0, 5.0));
        fx.quote(40000.0);
        REQUIRE(fx.engine->priceBook().getPrice("BTCUSDT")->mid == Approx(50000.0));
        REQUIRE(fx.engine->positions().size() == 1);
    }

    SECTION("Order book updates are broadcast") {
        OrderBookSnapshot book;
        book.symbol = "BTCUSDT";
        book.bids.emplace_back(49995.0, 1.0);
        fx.engine->processOrderBook(book, currentTimeMs());
        REQUIRE(fx.channel->ofType("ORDER_BOOK_UPDATE").size() == 1);
    }
}

TEST_CASE("TradingEngine - Maintenance", "[engine]") {
    EngineFixture fx;
    fx.quote(50000.0);

    SECTION("Expired resting orders are cancelled and reported") {
        auto request = fx.order("c-1", 0.01);
        request.type = OrderType::LIMIT;
        request.limitPrice = 49000.0;
        request.expiresAt = fx.startMs + 1000;
        fx.engine->executor().place(request);

        fx.engine->runHousekeeping(fx.startMs + 2000);
        auto cancelled = fx.channel->ofType("ORDER_CANCELLED");
        REQUIRE(cancelled.size() == 1);
        REQUIRE(cancelled[0]["reason"] == "EXPIRED");
        REQUIRE(fx.account().availableMargin == Approx(100000.0));
    }

    SECTION("Daily reset runs once per UTC day") {
        REQUIRE_FALSE(fx.engine->runDailyResetIfDue(fx.startMs));
        REQUIRE(fx.engine->runDailyResetIfDue(fx.startMs + kDayMs));
        REQUIRE(fx.sink->count(TradeEventType::DAILY_RESET) == 1);
        REQUIRE_FALSE(fx.engine->runDailyResetIfDue(fx.startMs + kDayMs + 1000));
    }

    SECTION("Funding accrues once per interval") {
        fx.engine->executor().place(fx.order("c-2", 0.01));
        auto interval = fx.engine->config().fundingIntervalMs;

        REQUIRE_FALSE(fx.engine->applyFundingIfDue(fx.startMs + 1000));
        REQUIRE(fx.engine->applyFundingIfDue(fx.startMs + interval));
        REQUIRE_FALSE(fx.engine->applyFundingIfDue(fx.startMs + interval + 1000));
        REQUIRE(fx.sink->count(TradeEventType::FUNDING_APPLIED) == 1);
    }

    SECTION("Heartbeat pings every connection") {
        REQUIRE_FALSE(fx.engine->sendHeartbeatIfDue(fx.startMs + 1000));
        REQUIRE(fx.engine->sendHeartbeatIfDue(fx.startMs + TradingEngine::HEARTBEAT_INTERVAL_MS));
        REQUIRE(fx.channel->ofType("PING").size() == 1);
    }

    SECTION("Workers start and stop cleanly") {
        fx.engine->startWorkers();
        fx.engine->stopWorkers();
        REQUIRE(fx.engine->connections().connectionCount() == 1);
    }
}
