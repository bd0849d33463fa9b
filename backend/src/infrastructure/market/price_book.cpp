#include "price_book.hpp"
#include <cmath>
#include <iostream>

namespace proptrade::infrastructure::market {

using proptrade::domain::OrderBookSnapshot;
using proptrade::domain::PriceSnapshot;

PriceBook::PriceBook(PriceBookConfig config) : config_(std::move(config)) {
    auto spreads = defaultSpreads();
    for (const auto& [symbol, bps] : config_.symbolSpreadsBps) {
        spreads[symbol] = bps;
    }
    config_.symbolSpreadsBps = std::move(spreads);
}

std::map<std::string, double> PriceBook::defaultSpreads() {
    return {
        {"BTCUSDT", 1.0}, {"ETHUSDT", 1.0}, {"BNBUSDT", 2.0}, {"SOLUSDT", 2.0}, {"XRPUSDT", 2.0},
        {"ADAUSDT", 3.0}, {"DOGEUSDT", 3.0}, {"DOTUSDT", 2.0}, {"LINKUSDT", 2.0}, {"MATICUSDT", 3.0},
        {"AVAXUSDT", 2.0}, {"LTCUSDT", 2.0}, {"UNIUSDT", 3.0}, {"ATOMUSDT", 2.0}, {"XLMUSDT", 3.0}
    };
}

double PriceBook::spreadBpsFor(const std::string& symbol) const {
    auto it = config_.symbolSpreadsBps.find(symbol);
    return it != config_.symbolSpreadsBps.end() ? it->second : config_.defaultSpreadBps;
}

bool PriceBook::circuitBreakerTripped(const std::string& symbol, double mid, int64_t timestampMs) {
    auto it = lastAccepted_.find(symbol);
    if (it == lastAccepted_.end()) {
        return false;
    }

    if (timestampMs - it->second.timestamp > config_.circuitBreakerResetMs) {
        tripped_.erase(symbol);
        return false;
    }

    double move = std::abs(mid - it->second.mid) / it->second.mid;
    if (move > config_.circuitBreakerThreshold) {
        tripped_.insert(symbol);
        return true;
    }
    return tripped_.count(symbol) > 0;
}

std::optional<PriceSnapshot> PriceBook::onQuote(const std::string& symbol,
                                                double upstreamBid,
                                                double upstreamAsk,
                                                int64_t timestampMs) {
    if (!std::isfinite(upstreamBid) || !std::isfinite(upstreamAsk) || upstreamBid <= 0.0 || upstreamAsk <= 0.0) {
        std::cerr << "[PriceBook] Ignoring invalid quote for " << symbol << std::endl;
        return std::nullopt;
    }

    double mid = (upstreamBid + upstreamAsk) / 2.0;
    double halfSpread = mid * spreadBpsFor(symbol) / 10000.0;
    PriceSnapshot snapshot(symbol, mid - halfSpread, mid + halfSpread, timestampMs);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (circuitBreakerTripped(symbol, mid, timestampMs)) {
            std::cerr << "[PriceBook] Circuit breaker tripped for " << symbol << std::endl;
            return std::nullopt;
        }
        prices_[symbol] = snapshot;
        lastAccepted_[symbol] = {mid, timestampMs};
    }

    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        try {
            listener(snapshot);
        } catch (const std::exception& e) {
            std::cerr << "[PriceBook] Listener error for " << symbol << ": " << e.what() << std::endl;
        }
    }
    return snapshot;
}

void PriceBook::onOrderBook(const OrderBookSnapshot& book) {
    std::lock_guard<std::mutex> lock(mutex_);
    books_[book.symbol] = book;
}

std::optional<OrderBookSnapshot> PriceBook::getOrderBook(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(symbol);
    if (it == books_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PriceBook::addListener(Listener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

std::optional<PriceSnapshot> PriceBook::getPrice(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = prices_.find(symbol);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PriceBook::isPriceStale(const std::string& symbol, int64_t maxAgeMs) const {
    auto snapshot = getPrice(symbol);
    if (!snapshot) {
        return true;
    }
    return snapshot->isStale(proptrade::domain::currentTimeMs(), maxAgeMs);
}

std::vector<std::string> PriceBook::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(prices_.size());
    for (const auto& [symbol, snapshot] : prices_) {
        result.push_back(symbol);
    }
    return result;
}

} // namespace proptrade::infrastructure::market
