#pragma once

#include "../domain/interfaces.hpp"
#include "account_ledger.hpp"
#include "pending_order_queue.hpp"
#include "position_manager.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace proptrade::application {

struct RiskMetrics {
    double equity = 0.0;
    double dailyPnl = 0.0;
    double dailyLossPct = 0.0;
    double drawdownPct = 0.0;
    double dailyLossLimitPct = 0.0;
    double maxDrawdownLimitPct = 0.0;
};

struct BreachReport {
    std::string accountId;
    std::string userId;
    std::string breachType;
    int32_t positionsClosed = 0;
    int32_t positionsSkipped = 0;
    int32_t ordersCancelled = 0;
    double totalPnl = 0.0;
    std::string message;
};

struct RiskWarning {
    std::string accountId;
    std::string userId;
    std::string warningType;
    std::string message;
};

struct RiskEvaluation {
    std::string accountId;
    RiskMetrics metrics;
    std::optional<BreachReport> breach;
    std::vector<RiskWarning> warnings;
};

// Equity-based daily loss and max drawdown enforcement.
// Warnings fire once per limit per trading day.
class RiskMonitor {
private:
    AccountLedger& ledger_;
    PositionManager& positions_;
    PendingOrderQueue& pending_;
    const proptrade::domain::IPriceSnapshotProvider& prices_;
    proptrade::domain::ITradeEventSink& events_;
    int64_t priceStaleMs_;
    double warningRatio_;

    std::set<std::string> warned_;
    std::mutex warnedMutex_;

    bool markWarned(const std::string& accountId, const std::string& warningType);
    BreachReport breach(const proptrade::domain::AccountState& account, const std::string& breachType);

public:
    RiskMonitor(AccountLedger& ledger,
                PositionManager& positions,
                PendingOrderQueue& pending,
                const proptrade::domain::IPriceSnapshotProvider& prices,
                proptrade::domain::ITradeEventSink& events,
                int64_t priceStaleMs,
                double warningRatio = 0.8);

    static RiskMetrics computeMetrics(const proptrade::domain::AccountState& account, double unrealizedPnl);

    RiskEvaluation evaluate(const std::string& accountId);
    std::vector<RiskEvaluation> evaluateAccounts(const std::vector<std::string>& accountIds);
    std::vector<RiskEvaluation> evaluateAll();

    // Returns the accounts that were busy and still need a reset
    std::vector<std::string> resetDaily(const std::vector<std::string>& accountIds);
};

} // namespace proptrade::application
