#pragma once

#include "../application/account_ledger.hpp"
#include "../application/margin_calculator.hpp"
#include "../application/order_executor.hpp"
#include "../application/order_validator.hpp"
#include "../application/pending_order_queue.hpp"
#include "../application/position_manager.hpp"
#include "../application/rate_limiter.hpp"
#include "../application/risk_monitor.hpp"
#include "../application/trigger_engine.hpp"
#include "../domain/interfaces.hpp"
#include "../infrastructure/cache/idempotency_cache.hpp"
#include "../infrastructure/config/engine_config.hpp"
#include "../infrastructure/market/price_book.hpp"
#include "connection_manager.hpp"
#include "message_dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace proptrade::interfaces {

// Owns the engine components and drives everything that is not a client
// request: the per-tick pipeline and the periodic maintenance work.
class TradingEngine {
private:
    proptrade::infrastructure::config::EngineConfig config_;

    std::unique_ptr<proptrade::domain::IAccountStore> accountStore_;
    std::unique_ptr<proptrade::domain::ITradeEventSink> eventSink_;
    std::unique_ptr<proptrade::domain::IAuthInspector> authInspector_;

    proptrade::infrastructure::market::PriceBook priceBook_;
    proptrade::infrastructure::cache::IdempotencyCache idempotencyCache_;

    proptrade::application::MarginCalculator calculator_;
    proptrade::application::OrderValidator validator_;
    proptrade::application::RateLimiter rateLimiter_;
    proptrade::application::AccountLedger ledger_;
    proptrade::application::PositionManager positions_;
    proptrade::application::PendingOrderQueue pending_;
    proptrade::application::OrderExecutor executor_;
    proptrade::application::TriggerEngine triggers_;
    proptrade::application::RiskMonitor risk_;

    ConnectionManager connections_;
    MessageDispatcher dispatcher_;

    int64_t currentDay_;
    std::vector<std::string> resetBacklog_;
    int64_t lastFundingMs_;
    int64_t lastHeartbeatMs_;
    std::mutex maintenanceMutex_;

    std::thread maintenanceThread_;
    std::thread broadcastThread_;
    std::atomic<bool> running_;
    std::mutex stopMutex_;
    std::condition_variable stopCond_;

    void notifyRisk(const std::vector<proptrade::application::RiskEvaluation>& evaluations);
    void maintenanceLoop();
    void broadcastLoop();
    bool waitFor(std::chrono::milliseconds interval);

public:
    static constexpr int64_t HEARTBEAT_INTERVAL_MS = 30000;
    static constexpr int64_t MAINTENANCE_INTERVAL_MS = 1000;

    TradingEngine(proptrade::infrastructure::config::EngineConfig config,
                  std::unique_ptr<proptrade::domain::IAccountStore> accountStore,
                  std::unique_ptr<proptrade::domain::ITradeEventSink> eventSink,
                  std::unique_ptr<proptrade::domain::IAuthInspector> authInspector,
                  int64_t nowMs = proptrade::domain::currentTimeMs());
    ~TradingEngine();

    TradingEngine(const TradingEngine&) = delete;
    TradingEngine& operator=(const TradingEngine&) = delete;

    const proptrade::infrastructure::config::EngineConfig& config() const { return config_; }
    proptrade::infrastructure::market::PriceBook& priceBook() { return priceBook_; }
    ConnectionManager& connections() { return connections_; }
    MessageDispatcher& dispatcher() { return dispatcher_; }
    proptrade::application::AccountLedger& ledger() { return ledger_; }
    proptrade::application::OrderExecutor& executor() { return executor_; }
    proptrade::application::PositionManager& positions() { return positions_; }
    proptrade::application::PendingOrderQueue& pendingOrders() { return pending_; }
    proptrade::application::RiskMonitor& riskMonitor() { return risk_; }

    // Resting fills, then TP/SL and liquidation, then risk, then the price broadcast
    void processTick(const proptrade::domain::PriceSnapshot& price, int64_t nowMs);
    void processOrderBook(const proptrade::domain::OrderBookSnapshot& book, int64_t nowMs);

    void runHousekeeping(int64_t nowMs);
    void runRiskSweep();
    // UTC day rollover; accounts that were busy are retried on the next call
    bool runDailyResetIfDue(int64_t nowMs);
    bool applyFundingIfDue(int64_t nowMs);
    bool sendHeartbeatIfDue(int64_t nowMs);

    void startWorkers();
    void stopWorkers();
};

} // namespace proptrade::interfaces
