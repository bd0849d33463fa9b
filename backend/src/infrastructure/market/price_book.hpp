#pragma once

#include "../../domain/interfaces.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace proptrade::infrastructure::market {

struct PriceBookConfig {
    double defaultSpreadBps = 10.0;
    std::map<std::string, double> symbolSpreadsBps;
    double circuitBreakerThreshold = 0.05;
    int64_t circuitBreakerResetMs = 1000;
};

// Latest quote per symbol with our spread applied to the upstream mid.
// Listeners run on the caller's thread after the quote is stored.
class PriceBook : public proptrade::domain::IPriceSnapshotProvider {
public:
    using Listener = std::function<void(const proptrade::domain::PriceSnapshot&)>;

private:
    struct LastAccepted {
        double mid = 0.0;
        int64_t timestamp = 0;
    };

    PriceBookConfig config_;
    std::unordered_map<std::string, proptrade::domain::PriceSnapshot> prices_;
    std::unordered_map<std::string, LastAccepted> lastAccepted_;
    std::set<std::string> tripped_;
    std::unordered_map<std::string, proptrade::domain::OrderBookSnapshot> books_;
    mutable std::mutex mutex_;

    std::vector<Listener> listeners_;
    std::mutex listenersMutex_;

    bool circuitBreakerTripped(const std::string& symbol, double mid, int64_t timestampMs);

public:
    explicit PriceBook(PriceBookConfig config = {});
    ~PriceBook() override = default;

    static std::map<std::string, double> defaultSpreads();

    double spreadBpsFor(const std::string& symbol) const;

    // Returns the stored snapshot, or nothing when the circuit breaker discarded the tick
    std::optional<proptrade::domain::PriceSnapshot> onQuote(const std::string& symbol,
                                                            double upstreamBid,
                                                            double upstreamAsk,
                                                            int64_t timestampMs);
    std::optional<proptrade::domain::PriceSnapshot> onMidPrice(const std::string& symbol,
                                                               double mid,
                                                               int64_t timestampMs) {
        return onQuote(symbol, mid, mid, timestampMs);
    }

    void onOrderBook(const proptrade::domain::OrderBookSnapshot& book);
    std::optional<proptrade::domain::OrderBookSnapshot> getOrderBook(const std::string& symbol) const;

    void addListener(Listener listener);

    std::optional<proptrade::domain::PriceSnapshot> getPrice(const std::string& symbol) const override;
    bool isPriceStale(const std::string& symbol, int64_t maxAgeMs) const override;

    std::vector<std::string> symbols() const;
};

} // namespace proptrade::infrastructure::market
