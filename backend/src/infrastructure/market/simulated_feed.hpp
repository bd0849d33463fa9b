#pragma once

#include "price_book.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace proptrade::infrastructure::market {

// Development stand-in for the upstream ingester: a random walk per symbol
// pushed into the PriceBook, plus a synthetic five-level book.
class SimulatedFeed {
public:
    using BookListener = std::function<void(const proptrade::domain::OrderBookSnapshot&)>;

    struct Instrument {
        std::string symbol;
        double price;
        double volatility;
    };

private:
    PriceBook& priceBook_;
    std::vector<Instrument> instruments_;
    int64_t intervalMs_;
    BookListener bookListener_;

    std::mt19937 generator_;
    std::mutex mutex_;

    std::thread thread_;
    std::atomic<bool> running_;

    proptrade::domain::OrderBookSnapshot buildBook(const proptrade::domain::PriceSnapshot& price);

public:
    SimulatedFeed(PriceBook& priceBook, int64_t intervalMs = 250, uint32_t seed = std::random_device{}());
    ~SimulatedFeed();

    static std::vector<Instrument> defaultInstruments();

    void setInstruments(std::vector<Instrument> instruments);
    void setBookListener(BookListener listener);

    // One step of the walk for every instrument
    void tick();

    void start();
    void stop();
    bool isRunning() const { return running_; }
};

} // namespace proptrade::infrastructure::market
