#include "risk_monitor.hpp"
#include "../utils/id_generator.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace proptrade::application {

using proptrade::domain::AccountState;
using proptrade::domain::CloseReason;
using proptrade::domain::TradeEvent;
using proptrade::domain::TradeEventType;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string describeBreach(const std::string& breachType) {
    std::string words = lowercase(breachType);
    std::replace(words.begin(), words.end(), '_', ' ');
    return words;
}

} // namespace

RiskMonitor::RiskMonitor(AccountLedger& ledger,
                         PositionManager& positions,
                         PendingOrderQueue& pending,
                         const proptrade::domain::IPriceSnapshotProvider& prices,
                         proptrade::domain::ITradeEventSink& events,
                         int64_t priceStaleMs,
                         double warningRatio)
    : ledger_(ledger), positions_(positions), pending_(pending), prices_(prices), events_(events),
      priceStaleMs_(priceStaleMs), warningRatio_(warningRatio) {
}

RiskMetrics RiskMonitor::computeMetrics(const AccountState& account, double unrealizedPnl) {
    RiskMetrics metrics;
    metrics.equity = account.currentBalance + unrealizedPnl;
    metrics.dailyPnl = metrics.equity - account.dailyStartingBalance;

    if (account.dailyStartingBalance > 0.0) {
        metrics.dailyLossPct = std::max(0.0, -metrics.dailyPnl) / account.dailyStartingBalance;
        metrics.dailyLossLimitPct = account.dailyLossLimit / account.dailyStartingBalance;
    }
    if (account.startingBalance > 0.0) {
        metrics.drawdownPct = std::max(0.0, account.startingBalance - metrics.equity) / account.startingBalance;
        metrics.maxDrawdownLimitPct = account.maxDrawdownLimit / account.startingBalance;
    }
    return metrics;
}

bool RiskMonitor::markWarned(const std::string& accountId, const std::string& warningType) {
    std::lock_guard<std::mutex> lock(warnedMutex_);
    return warned_.insert(accountId + ":" + warningType).second;
}

RiskEvaluation RiskMonitor::evaluate(const std::string& accountId) {
    RiskEvaluation evaluation;
    evaluation.accountId = accountId;

    auto account = ledger_.getAccount(accountId);
    if (!account || !account->canTrade()) {
        return evaluation;
    }

    evaluation.metrics = computeMetrics(*account, positions_.unrealizedPnlForAccount(accountId, prices_));
    const auto& metrics = evaluation.metrics;

    if (metrics.dailyLossLimitPct > 0.0 && metrics.dailyLossPct >= metrics.dailyLossLimitPct) {
        evaluation.breach = breach(*account, "DAILY_LOSS");
        return evaluation;
    }
    if (metrics.maxDrawdownLimitPct > 0.0 && metrics.drawdownPct >= metrics.maxDrawdownLimitPct) {
        evaluation.breach = breach(*account, "MAX_DRAWDOWN");
        return evaluation;
    }

    if (metrics.dailyLossLimitPct > 0.0 && metrics.dailyLossPct >= metrics.dailyLossLimitPct * warningRatio_ &&
        markWarned(accountId, "DAILY_LOSS_WARNING")) {
        std::cout << "[RiskMonitor] WARNING: DAILY_LOSS_WARNING for account " << accountId << std::endl;
        evaluation.warnings.push_back({accountId, account->userId, "DAILY_LOSS_WARNING",
                                       "Risk warning: approaching daily loss limit"});
    }
    if (metrics.maxDrawdownLimitPct > 0.0 && metrics.drawdownPct >= metrics.maxDrawdownLimitPct * warningRatio_ &&
        markWarned(accountId, "DRAWDOWN_WARNING")) {
        std::cout << "[RiskMonitor] WARNING: DRAWDOWN_WARNING for account " << accountId << std::endl;
        evaluation.warnings.push_back({accountId, account->userId, "DRAWDOWN_WARNING",
                                       "Risk warning: approaching max drawdown limit"});
    }
    return evaluation;
}

BreachReport RiskMonitor::breach(const AccountState& account, const std::string& breachType) {
    std::cout << "[RiskMonitor] BREACH: " << breachType << " for account " << account.accountId << std::endl;

    BreachReport report;
    report.accountId = account.accountId;
    report.userId = account.userId;
    report.breachType = breachType;
    report.message = "Account breached due to " + describeBreach(breachType);

    // Status flips first so no new order slips in while positions are closing
    {
        auto accountLock = ledger_.lock(account.accountId);
        if (accountLock) {
            auto cancelled = pending_.cancelAllForAccount(accountLock);
            report.ordersCancelled = static_cast<int32_t>(cancelled.size());
            ledger_.markBreached(accountLock, lowercase(breachType));
        } else {
            std::cerr << "[RiskMonitor] Account " << account.accountId
                      << " busy while breaching; status update deferred to next sweep" << std::endl;
        }
    }

    auto summary = positions_.closeAllForAccount(account.accountId, prices_, CloseReason::BREACH, priceStaleMs_);
    report.positionsClosed = summary.closed;
    report.positionsSkipped = summary.skipped;
    report.totalPnl = summary.totalPnl;

    if (summary.skipped > 0) {
        std::cerr << "[RiskMonitor] Breach close of " << account.accountId << " skipped "
                  << summary.skipped << " positions" << std::endl;
    }

    TradeEvent event;
    event.id = proptrade::utils::generateId("EVT");
    event.type = TradeEventType::ACCOUNT_BREACHED;
    event.accountId = account.accountId;
    event.userId = account.userId;
    event.pnl = summary.totalPnl;
    event.reason = breachType;
    event.timestamp = proptrade::domain::currentTimeMs();
    events_.record(event);

    return report;
}

std::vector<RiskEvaluation> RiskMonitor::evaluateAccounts(const std::vector<std::string>& accountIds) {
    std::vector<RiskEvaluation> evaluations;
    for (const auto& accountId : accountIds) {
        try {
            auto evaluation = evaluate(accountId);
            if (evaluation.breach || !evaluation.warnings.empty()) {
                evaluations.push_back(std::move(evaluation));
            }
        } catch (const std::exception& e) {
            std::cerr << "[RiskMonitor] Failed to evaluate " << accountId << ": " << e.what() << std::endl;
        }
    }
    return evaluations;
}

std::vector<RiskEvaluation> RiskMonitor::evaluateAll() {
    return evaluateAccounts(ledger_.listAccountIds());
}

std::vector<std::string> RiskMonitor::resetDaily(const std::vector<std::string>& accountIds) {
    std::vector<std::string> busy;
    for (const auto& accountId : accountIds) {
        auto accountLock = ledger_.lock(accountId);
        if (!accountLock) {
            busy.push_back(accountId);
            continue;
        }
        auto account = ledger_.resetDaily(accountLock);

        {
            std::lock_guard<std::mutex> lock(warnedMutex_);
            warned_.erase(accountId + ":DAILY_LOSS_WARNING");
            warned_.erase(accountId + ":DRAWDOWN_WARNING");
        }

        TradeEvent event;
        event.id = proptrade::utils::generateId("EVT");
        event.type = TradeEventType::DAILY_RESET;
        event.accountId = account.accountId;
        event.userId = account.userId;
        event.price = account.dailyStartingBalance;
        event.timestamp = proptrade::domain::currentTimeMs();
        events_.record(event);
    }

    std::cout << "[RiskMonitor] Daily reset for " << (accountIds.size() - busy.size()) << " accounts" << std::endl;
    return busy;
}

} // namespace proptrade::application
