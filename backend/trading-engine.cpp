#include "src/interfaces/trading_server.hpp"
#include "src/interfaces/trading_engine.hpp"
#include "src/infrastructure/auth/jwt_inspector.hpp"
#include "src/infrastructure/config/engine_config.hpp"
#include "src/infrastructure/market/simulated_feed.hpp"
#include "src/infrastructure/persistence/clickhouse_trade_sink.hpp"
#include "src/infrastructure/store/in_memory_account_store.hpp"
#include <iostream>
#include <memory>
#include <signal.h>

using namespace proptrade::interfaces;
using namespace proptrade::infrastructure;

namespace {

// Stand-in sink when ClickHouse is disabled
class LoggingTradeEventSink : public proptrade::domain::ITradeEventSink {
public:
    void record(const proptrade::domain::TradeEvent& event) override {
        std::cout << "[EventSink] " << proptrade::domain::toString(event.type) << " account=" << event.accountId
                  << " position=" << event.positionId << " order=" << event.orderId << std::endl;
    }
};

} // namespace

// Global instances for signal handling
std::unique_ptr<TradingServer> g_server;
std::unique_ptr<market::SimulatedFeed> g_feed;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (g_feed) {
        g_feed->stop();
    }
    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::cout << "=== proptrade execution engine ===" << std::endl;

    try {
        auto config = config::EngineConfig::fromEnvironment();
        config.applyArguments(argc, argv);

        std::unique_ptr<proptrade::domain::IAccountStore> accounts;
        if (!config.accountsFile.empty()) {
            accounts = store::InMemoryAccountStore::loadFromFile(config.accountsFile);
        } else {
            accounts = store::InMemoryAccountStore::createDemo();
        }

        std::unique_ptr<proptrade::domain::ITradeEventSink> sink;
        if (config.persistenceEnabled) {
            sink = persistence::ClickHouseTradeEventSink::createFromEnvironment();
        } else {
            sink = std::make_unique<LoggingTradeEventSink>();
        }

        auto inspector = std::make_unique<auth::JwtInspector>(config.jwtSecret, config.jwtIssuer, config.jwtAudience);

        std::string host = config.host;
        uint16_t port = config.port;
        std::string secret = config.jwtSecret;
        bool simulated = config.simulatedFeed;

        TradingEngine engine(std::move(config), std::move(accounts), std::move(sink), std::move(inspector));

        if (simulated) {
            g_feed = std::make_unique<market::SimulatedFeed>(engine.priceBook());
            g_feed->setBookListener([&engine](const proptrade::domain::OrderBookSnapshot& book) {
                engine.processOrderBook(book, proptrade::domain::currentTimeMs());
            });
            g_feed->start();
        } else {
            std::cout << "[Main] Simulated feed disabled, waiting for an external price source" << std::endl;
        }

        g_server = std::make_unique<TradingServer>(engine, host, port, secret);
        if (!g_server->initialize()) {
            std::cerr << "Failed to initialize trading server" << std::endl;
            return 1;
        }

        std::cout << "Host: " << host << std::endl;
        std::cout << "Port: " << port << std::endl;

        // Blocks until stopped
        g_server->start();

        if (g_feed) {
            g_feed->stop();
        }
        g_server.reset();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
