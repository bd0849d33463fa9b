#include "simulated_feed.hpp"
#include <chrono>
#include <cmath>
#include <iostream>

namespace proptrade::infrastructure::market {

using proptrade::domain::OrderBookLevel;
using proptrade::domain::OrderBookSnapshot;
using proptrade::domain::PriceSnapshot;

SimulatedFeed::SimulatedFeed(PriceBook& priceBook, int64_t intervalMs, uint32_t seed)
    : priceBook_(priceBook), instruments_(defaultInstruments()), intervalMs_(intervalMs),
      generator_(seed), running_(false) {
}

SimulatedFeed::~SimulatedFeed() {
    stop();
}

std::vector<SimulatedFeed::Instrument> SimulatedFeed::defaultInstruments() {
    // Per-tick volatility, well under the circuit breaker threshold
    return {
        {"BTCUSDT", 50000.0, 0.0004},
        {"ETHUSDT", 3000.0, 0.0005},
        {"SOLUSDT", 150.0, 0.0008},
        {"BNBUSDT", 600.0, 0.0006},
        {"XRPUSDT", 0.60, 0.0008},
        {"DOGEUSDT", 0.15, 0.0010},
        {"ADAUSDT", 0.45, 0.0008},
        {"AVAXUSDT", 35.0, 0.0008},
        {"DOTUSDT", 7.0, 0.0008},
        {"LINKUSDT", 15.0, 0.0007}
    };
}

void SimulatedFeed::setInstruments(std::vector<Instrument> instruments) {
    std::lock_guard<std::mutex> lock(mutex_);
    instruments_ = std::move(instruments);
}

void SimulatedFeed::setBookListener(BookListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    bookListener_ = std::move(listener);
}

OrderBookSnapshot SimulatedFeed::buildBook(const PriceSnapshot& price) {
    std::uniform_real_distribution<double> quantityDist(0.5, 10.0);

    OrderBookSnapshot book;
    book.symbol = price.symbol;
    book.timestamp = price.timestamp;

    double step = price.spread > 0.0 ? price.spread / 2.0 : price.mid * 0.0001;
    for (int level = 0; level < 5; ++level) {
        book.bids.emplace_back(price.bid - step * level, quantityDist(generator_));
        book.asks.emplace_back(price.ask + step * level, quantityDist(generator_));
    }
    return book;
}

void SimulatedFeed::tick() {
    std::vector<std::pair<OrderBookSnapshot, BookListener>> books;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = proptrade::domain::currentTimeMs();

        for (auto& instrument : instruments_) {
            std::uniform_real_distribution<double> dist(-instrument.volatility, instrument.volatility);
            double next = instrument.price * (1.0 + dist(generator_));
            if (!std::isfinite(next) || next <= 0.0) {
                continue;
            }
            instrument.price = next;

            // Upstream quote one basis point wide around the walk
            double halfWidth = next * 0.00005;
            auto accepted = priceBook_.onQuote(instrument.symbol, next - halfWidth, next + halfWidth, now);
            if (!accepted) {
                continue;
            }

            auto book = buildBook(*accepted);
            priceBook_.onOrderBook(book);
            if (bookListener_) {
                books.emplace_back(std::move(book), bookListener_);
            }
        }
    }

    for (const auto& [book, listener] : books) {
        listener(book);
    }
}

void SimulatedFeed::start() {
    if (running_.exchange(true)) {
        return;
    }
    std::cout << "[MarketFeed] Starting simulated feed, interval " << intervalMs_ << "ms" << std::endl;
    thread_ = std::thread([this]() {
        while (running_) {
            try {
                tick();
            } catch (const std::exception& e) {
                std::cerr << "[MarketFeed] Error in tick: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(intervalMs_));
        }
        std::cout << "[MarketFeed] Feed thread stopped." << std::endl;
    });
}

void SimulatedFeed::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace proptrade::infrastructure::market
