#include "trading_engine.hpp"
#include "messages.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>

namespace proptrade::interfaces {

using namespace proptrade::domain;
using proptrade::application::RiskEvaluation;

namespace {

constexpr int64_t kDayMs = 24LL * 60 * 60 * 1000;

int64_t utcDay(int64_t nowMs) {
    return nowMs / kDayMs;
}

template <typename T>
T& required(const std::unique_ptr<T>& dependency, const char* name) {
    if (!dependency) {
        throw std::invalid_argument(std::string("TradingEngine requires ") + name);
    }
    return *dependency;
}

} // namespace

TradingEngine::TradingEngine(proptrade::infrastructure::config::EngineConfig config,
                             std::unique_ptr<IAccountStore> accountStore,
                             std::unique_ptr<ITradeEventSink> eventSink,
                             std::unique_ptr<IAuthInspector> authInspector,
                             int64_t nowMs)
    : config_(std::move(config)),
      accountStore_(std::move(accountStore)),
      eventSink_(std::move(eventSink)),
      authInspector_(std::move(authInspector)),
      priceBook_(config_.priceBook),
      calculator_(config_.trading),
      validator_(calculator_),
      ledger_(required(accountStore_, "an account store"), std::chrono::milliseconds(config_.trading.lockTimeoutMs)),
      positions_(ledger_, calculator_, required(eventSink_, "an event sink"), std::chrono::milliseconds(config_.trading.lockTimeoutMs)),
      pending_(ledger_, calculator_, *eventSink_),
      executor_(ledger_, positions_, pending_, calculator_, validator_, rateLimiter_, priceBook_,
                idempotencyCache_, *eventSink_),
      triggers_(positions_, config_.trading.priceStaleMs),
      risk_(ledger_, positions_, pending_, priceBook_, *eventSink_, config_.trading.priceStaleMs),
      connections_(ConnectionSettings{config_.priceUpdateThrottleMs, config_.maxBufferedAmount}),
      dispatcher_(connections_, executor_, positions_, pending_, ledger_, rateLimiter_, priceBook_,
                  required(authInspector_, "an auth inspector")),
      currentDay_(utcDay(nowMs)),
      lastFundingMs_(nowMs),
      lastHeartbeatMs_(nowMs),
      running_(false) {

    priceBook_.addListener([this](const PriceSnapshot& price) {
        processTick(price, currentTimeMs());
    });
}

TradingEngine::~TradingEngine() {
    stopWorkers();
}

void TradingEngine::processTick(const PriceSnapshot& price, int64_t nowMs) {
    std::set<std::string> touchedAccounts;

    for (const auto& queued : executor_.fillPending(price)) {
        touchedAccounts.insert(queued.order.accountId);
        if (auto* fill = std::get_if<FillResult>(&queued.result)) {
            connections_.sendToUser(queued.order.userId, outbound::orderFilled(*fill));
        } else {
            connections_.sendToUser(queued.order.userId,
                                    outbound::orderRejected(std::get<Rejection>(queued.result),
                                                            queued.order.clientOrderId,
                                                            queued.order.id));
        }
    }

    auto scan = triggers_.onPriceUpdate(price, nowMs);
    for (const auto& closed : scan.closed) {
        touchedAccounts.insert(closed.accountId);
        connections_.sendToUser(closed.userId, outbound::positionClosed(closed));
    }
    for (const auto& warning : scan.warnings) {
        connections_.sendToUser(warning.position.userId, outbound::liquidationWarning(warning));
    }

    for (const auto& accountId : positions_.accountsWithPositionsOn(price.symbol)) {
        touchedAccounts.insert(accountId);
    }
    if (!touchedAccounts.empty()) {
        notifyRisk(risk_.evaluateAccounts(std::vector<std::string>(touchedAccounts.begin(), touchedAccounts.end())));
    }

    connections_.broadcastToSubscribers(price.symbol, outbound::priceUpdate(price), nowMs);
}

void TradingEngine::processOrderBook(const OrderBookSnapshot& book, int64_t nowMs) {
    connections_.broadcastToSubscribers(book.symbol, outbound::orderBookUpdate(book), nowMs);
}

void TradingEngine::notifyRisk(const std::vector<RiskEvaluation>& evaluations) {
    for (const auto& evaluation : evaluations) {
        if (evaluation.breach) {
            connections_.sendToUser(evaluation.breach->userId, outbound::accountBreached(*evaluation.breach));
        }
        for (const auto& warning : evaluation.warnings) {
            connections_.sendToUser(warning.userId, outbound::riskWarning(warning));
        }
    }
}

void TradingEngine::runRiskSweep() {
    notifyRisk(risk_.evaluateAll());
}

bool TradingEngine::runDailyResetIfDue(int64_t nowMs) {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    int64_t day = utcDay(nowMs);
    if (day != currentDay_) {
        currentDay_ = day;
        resetBacklog_ = ledger_.listAccountIds();
        std::cout << "[TradingEngine] Daily reset for " << resetBacklog_.size() << " accounts" << std::endl;
    }
    if (resetBacklog_.empty()) {
        return false;
    }

    resetBacklog_ = risk_.resetDaily(resetBacklog_);
    if (!resetBacklog_.empty()) {
        std::cout << "[TradingEngine] " << resetBacklog_.size() << " accounts busy, retrying daily reset" << std::endl;
    }
    return true;
}

bool TradingEngine::applyFundingIfDue(int64_t nowMs) {
    {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        if (config_.fundingIntervalMs <= 0 || nowMs - lastFundingMs_ < config_.fundingIntervalMs) {
            return false;
        }
        lastFundingMs_ = nowMs;
    }

    double rate = config_.fundingRate;
    int32_t applied = positions_.accrueFunding([rate](const std::string&) { return rate; });
    std::cout << "[TradingEngine] Funding applied to " << applied << " positions at rate " << rate << std::endl;
    return true;
}

bool TradingEngine::sendHeartbeatIfDue(int64_t nowMs) {
    {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        if (nowMs - lastHeartbeatMs_ < HEARTBEAT_INTERVAL_MS) {
            return false;
        }
        lastHeartbeatMs_ = nowMs;
    }
    connections_.sendToAll(outbound::ping(nowMs));
    return true;
}

void TradingEngine::runHousekeeping(int64_t nowMs) {
    size_t cacheDropped = idempotencyCache_.cleanup();
    rateLimiter_.cleanup(nowMs);
    triggers_.prune();

    for (const auto& order : pending_.cleanupExpired(nowMs)) {
        connections_.sendToUser(order.userId, outbound::orderExpired(order));
    }

    runRiskSweep();
    runDailyResetIfDue(nowMs);
    applyFundingIfDue(nowMs);
    sendHeartbeatIfDue(nowMs);

    if (cacheDropped > 0) {
        std::cout << "[TradingEngine] Housekeeping dropped " << cacheDropped << " idempotency entries" << std::endl;
    }
}

bool TradingEngine::waitFor(std::chrono::milliseconds interval) {
    std::unique_lock<std::mutex> lock(stopMutex_);
    return !stopCond_.wait_for(lock, interval, [this] { return !running_; });
}

void TradingEngine::maintenanceLoop() {
    while (waitFor(std::chrono::milliseconds(MAINTENANCE_INTERVAL_MS))) {
        try {
            runHousekeeping(currentTimeMs());
        } catch (const std::exception& e) {
            std::cerr << "[TradingEngine] Housekeeping error: " << e.what() << std::endl;
        }
    }
}

void TradingEngine::broadcastLoop() {
    auto interval = std::chrono::milliseconds(std::max<int64_t>(config_.priceUpdateThrottleMs, 1));
    while (waitFor(interval)) {
        try {
            connections_.flushThrottled(currentTimeMs());
        } catch (const std::exception& e) {
            std::cerr << "[TradingEngine] Broadcast flush error: " << e.what() << std::endl;
        }
    }
}

void TradingEngine::startWorkers() {
    if (running_.exchange(true)) {
        return;
    }
    maintenanceThread_ = std::thread(&TradingEngine::maintenanceLoop, this);
    broadcastThread_ = std::thread(&TradingEngine::broadcastLoop, this);
    std::cout << "[TradingEngine] Workers started." << std::endl;
}

void TradingEngine::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        running_ = false;
    }
    stopCond_.notify_all();
    if (maintenanceThread_.joinable()) {
        maintenanceThread_.join();
    }
    if (broadcastThread_.joinable()) {
        broadcastThread_.join();
        std::cout << "[TradingEngine] Workers stopped." << std::endl;
    }
}

} // namespace proptrade::interfaces
