#pragma once

#include "application/account_ledger.hpp"
#include "application/margin_calculator.hpp"
#include "application/order_executor.hpp"
#include "application/order_validator.hpp"
#include "application/pending_order_queue.hpp"
#include "application/position_manager.hpp"
#include "application/rate_limiter.hpp"
#include "domain/interfaces.hpp"
#include "infrastructure/cache/idempotency_cache.hpp"
#include "infrastructure/store/in_memory_account_store.hpp"
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace proptrade::testing {

// Quotes set directly by the test, stamped with the wall clock unless told otherwise
class StaticPriceProvider : public proptrade::domain::IPriceSnapshotProvider {
private:
    std::map<std::string, proptrade::domain::PriceSnapshot> prices_;

public:
    void setPrice(const std::string& symbol, double bid, double ask,
                  int64_t timestamp = proptrade::domain::currentTimeMs()) {
        prices_[symbol] = proptrade::domain::PriceSnapshot(symbol, bid, ask, timestamp);
    }

    void remove(const std::string& symbol) { prices_.erase(symbol); }

    std::optional<proptrade::domain::PriceSnapshot> getPrice(const std::string& symbol) const override {
        auto it = prices_.find(symbol);
        if (it == prices_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool isPriceStale(const std::string& symbol, int64_t maxAgeMs) const override {
        auto price = getPrice(symbol);
        return !price || price->isStale(proptrade::domain::currentTimeMs(), maxAgeMs);
    }
};

class RecordingEventSink : public proptrade::domain::ITradeEventSink {
private:
    mutable std::mutex mutex_;
    std::vector<proptrade::domain::TradeEvent> events_;

public:
    void record(const proptrade::domain::TradeEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<proptrade::domain::TradeEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(proptrade::domain::TradeEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& event : events_) {
            if (event.type == type) {
                ++n;
            }
        }
        return n;
    }
};

class RecordingChannel : public proptrade::domain::IConnectionChannel {
public:
    std::vector<nlohmann::json> messages;
    size_t buffered = 0;
    bool failSends = false;
    bool throwOnSend = false;

    bool send(const std::string& type, const std::string& payload) override {
        if (throwOnSend) {
            throw std::runtime_error("socket closed");
        }
        if (failSends) {
            return false;
        }
        auto message = nlohmann::json::parse(payload);
        message["_frameType"] = type;
        messages.push_back(std::move(message));
        return true;
    }

    size_t bufferedAmount() const override { return buffered; }

    std::vector<nlohmann::json> ofType(const std::string& type) const {
        std::vector<nlohmann::json> result;
        for (const auto& message : messages) {
            if (message.value("type", "") == type) {
                result.push_back(message);
            }
        }
        return result;
    }
};

class FixedAuthInspector : public proptrade::domain::IAuthInspector {
public:
    std::map<std::string, std::string> tokens;

    std::optional<proptrade::domain::Principal> verify(const std::string& token) override {
        auto it = tokens.find(token);
        if (it == tokens.end()) {
            return std::nullopt;
        }
        return proptrade::domain::Principal(it->second, {"trader"});
    }
};

inline proptrade::domain::OrderRequest marketOrder(const std::string& clientOrderId,
                                                   const std::string& symbol,
                                                   proptrade::domain::Side side,
                                                   double quantity,
                                                   std::optional<double> leverage = 10.0) {
    proptrade::domain::OrderRequest order;
    order.clientOrderId = clientOrderId;
    order.userId = "user-1";
    order.accountId = "ACC_1";
    order.symbol = symbol;
    order.side = side;
    order.type = proptrade::domain::OrderType::MARKET;
    order.quantity = quantity;
    order.leverage = leverage;
    order.timestamp = proptrade::domain::currentTimeMs();
    return order;
}

inline proptrade::domain::OrderRequest limitOrder(const std::string& clientOrderId,
                                                  const std::string& symbol,
                                                  proptrade::domain::Side side,
                                                  double quantity,
                                                  double limitPrice,
                                                  std::optional<double> leverage = 10.0) {
    auto order = marketOrder(clientOrderId, symbol, side, quantity, leverage);
    order.type = proptrade::domain::OrderType::LIMIT;
    order.limitPrice = limitPrice;
    return order;
}

// The application layer wired against fakes. ACC_1 belongs to user-1 with
// 100000 balance, 5000 daily loss limit and 10000 max drawdown.
struct TradingFixture {
    proptrade::infrastructure::store::InMemoryAccountStore store;
    RecordingEventSink sink;
    StaticPriceProvider prices;
    proptrade::infrastructure::cache::IdempotencyCache cache;
    proptrade::application::MarginCalculator calculator;
    proptrade::application::OrderValidator validator;
    proptrade::application::RateLimiter rateLimiter;
    proptrade::application::AccountLedger ledger;
    proptrade::application::PositionManager positions;
    proptrade::application::PendingOrderQueue pending;
    proptrade::application::OrderExecutor executor;

    TradingFixture()
        : validator(calculator),
          ledger(store, std::chrono::milliseconds(50)),
          positions(ledger, calculator, sink, std::chrono::milliseconds(50)),
          pending(ledger, calculator, sink),
          executor(ledger, positions, pending, calculator, validator, rateLimiter, prices, cache, sink) {
        seed();
    }

    // Same wiring with custom throttles, for tests that place many orders at once
    explicit TradingFixture(std::map<std::string, proptrade::application::RateLimitConfig> limits)
        : validator(calculator),
          rateLimiter(std::move(limits)),
          ledger(store, std::chrono::milliseconds(50)),
          positions(ledger, calculator, sink, std::chrono::milliseconds(50)),
          pending(ledger, calculator, sink),
          executor(ledger, positions, pending, calculator, validator, rateLimiter, prices, cache, sink) {
        seed();
    }

    void seed() {
        store.updateAccount(proptrade::domain::AccountState("ACC_1", "user-1", 100000.0, 5000.0, 10000.0));
        prices.setPrice("BTCUSDT", 49990.0, 50010.0);
        prices.setPrice("ETHUSDT", 2999.0, 3001.0);
    }

    proptrade::domain::AccountState account(const std::string& accountId = "ACC_1") const {
        auto found = store.getAccount(accountId);
        if (!found) {
            throw std::runtime_error("missing account " + accountId);
        }
        return *found;
    }

    proptrade::domain::FillResult fill(const proptrade::domain::OrderRequest& order) {
        auto outcome = executor.place(order);
        if (!std::holds_alternative<proptrade::domain::FillResult>(outcome.result)) {
            throw std::runtime_error("expected a fill for " + order.clientOrderId);
        }
        return std::get<proptrade::domain::FillResult>(outcome.result);
    }
};

} // namespace proptrade::testing
