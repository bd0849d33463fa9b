#pragma once

#include "../domain/interfaces.hpp"
#include "account_ledger.hpp"
#include "margin_calculator.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace proptrade::application {

using AdmitOutcome = std::variant<proptrade::domain::PendingResult, proptrade::domain::Rejection>;

// Resting limit orders and their margin reservations.
// A reservation leaves the order exactly once: through claim() on fill,
// cancel, expiry or breach, each under the owning account's lock.
class PendingOrderQueue {
private:
    AccountLedger& ledger_;
    const MarginCalculator& calculator_;
    proptrade::domain::ITradeEventSink& events_;

    std::unordered_map<std::string, proptrade::domain::PendingOrder> orders_;
    std::unordered_map<std::string, std::set<std::string>> bySymbol_;
    std::unordered_map<std::string, int64_t> finishedAt_;
    mutable std::mutex mutex_;

    int64_t retentionMs_;

    void recordEvent(proptrade::domain::TradeEventType type,
                     const proptrade::domain::PendingOrder& order,
                     const std::string& reason = "");

public:
    PendingOrderQueue(AccountLedger& ledger,
                      const MarginCalculator& calculator,
                      proptrade::domain::ITradeEventSink& events,
                      int64_t retentionMs = 3600000);

    // Reserves margin + entry fee computed at the limit price. Caller holds the account lock.
    AdmitOutcome admit(const EntityLock& accountLock,
                       const proptrade::domain::OrderRequest& order,
                       double currentPrice);

    proptrade::domain::CancelOutcome cancel(const std::string& orderId, const std::string& userId);

    // Orders on the snapshot's symbol whose limit the quote now satisfies
    std::vector<proptrade::domain::PendingOrder> collectFillable(const proptrade::domain::PriceSnapshot& price) const;

    // PENDING -> status for an order of the locked account. Empty when someone else got there first.
    std::optional<proptrade::domain::PendingOrder> claim(const EntityLock& accountLock,
                                                         const std::string& orderId,
                                                         proptrade::domain::PendingOrderStatus status);

    // A claimed FILLED order whose execution failed ends up CANCELLED
    void markFillFailed(const EntityLock& accountLock, const std::string& orderId, const std::string& reason);

    // Cancels every pending order of the locked account and returns the reservations
    std::vector<proptrade::domain::CancelResult> cancelAllForAccount(const EntityLock& accountLock);

    // Expires overdue orders and forgets finished ones older than the retention window
    std::vector<proptrade::domain::PendingOrder> cleanupExpired(int64_t nowMs);

    std::optional<proptrade::domain::PendingOrder> get(const std::string& orderId) const;
    std::vector<proptrade::domain::PendingOrder> pendingForAccount(const std::string& accountId) const;
    double reservedForAccount(const std::string& accountId) const;
    size_t pendingCount() const;

    // Fill condition: LONG when ask <= limit, SHORT when bid >= limit
    static bool isFillable(const proptrade::domain::PendingOrder& order, const proptrade::domain::PriceSnapshot& price);
    // min(limit, ask) for LONG, max(limit, bid) for SHORT
    static double executionPriceFor(const proptrade::domain::PendingOrder& order, const proptrade::domain::PriceSnapshot& price);
};

} // namespace proptrade::application
