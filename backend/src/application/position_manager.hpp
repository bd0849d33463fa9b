#pragma once

#include "../domain/interfaces.hpp"
#include "account_ledger.hpp"
#include "lock_registry.hpp"
#include "margin_calculator.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace proptrade::application {

struct BatchCloseSummary {
    int32_t closed = 0;
    int32_t skipped = 0;
    double totalPnl = 0.0;
    std::vector<proptrade::domain::CloseResult> results;
};

// In-memory position table with symbol and account indices.
// Mutations take the position lock, then the owning account's ledger lock.
class PositionManager {
private:
    AccountLedger& ledger_;
    const MarginCalculator& calculator_;
    proptrade::domain::ITradeEventSink& events_;
    LockRegistry positionLocks_;

    std::unordered_map<std::string, proptrade::domain::Position> positions_;
    std::unordered_map<std::string, std::set<std::string>> bySymbol_;
    std::unordered_map<std::string, std::set<std::string>> byAccount_;
    mutable std::mutex mutex_;

    void insert(const proptrade::domain::Position& position);
    void erase(const std::string& positionId);
    void store(const proptrade::domain::Position& position);

    proptrade::domain::CloseOutcome closeQuantity(const std::string& positionId,
                                                  std::optional<double> quantity,
                                                  const proptrade::domain::PriceSnapshot& price,
                                                  proptrade::domain::CloseReason reason,
                                                  const std::string& userId);

    void emitCloseEvents(const proptrade::domain::Position& position, const proptrade::domain::CloseResult& result);

public:
    PositionManager(AccountLedger& ledger,
                    const MarginCalculator& calculator,
                    proptrade::domain::ITradeEventSink& events,
                    std::chrono::milliseconds lockTimeout);

    // Registers a freshly filled position. Caller holds the owning account's lock.
    proptrade::domain::Position open(const EntityLock& accountLock, proptrade::domain::Position position);

    // 0 removes a level; std::nullopt leaves it unchanged
    proptrade::domain::ModifyOutcome modifyTPSL(const std::string& positionId,
                                                const std::string& userId,
                                                std::optional<double> takeProfit,
                                                std::optional<double> stopLoss);

    // userId empty means a system close (trigger, breach) that skips the ownership check
    proptrade::domain::CloseOutcome closePartial(const std::string& positionId,
                                                 double quantity,
                                                 const proptrade::domain::PriceSnapshot& price,
                                                 proptrade::domain::CloseReason reason,
                                                 const std::string& userId = "");
    proptrade::domain::CloseOutcome closeFull(const std::string& positionId,
                                              const proptrade::domain::PriceSnapshot& price,
                                              proptrade::domain::CloseReason reason,
                                              const std::string& userId = "");

    // Skips positions whose symbol has no fresh price
    BatchCloseSummary closeAllForAccount(const std::string& accountId,
                                         const proptrade::domain::IPriceSnapshotProvider& prices,
                                         proptrade::domain::CloseReason reason,
                                         int64_t staleMs);

    // Adds quantity * entryPrice * rate to each position's funding (LONG pays, SHORT receives)
    int32_t accrueFunding(const std::function<double(const std::string&)>& rateForSymbol);

    std::optional<proptrade::domain::Position> get(const std::string& positionId) const;
    std::vector<proptrade::domain::Position> getByAccount(const std::string& accountId) const;
    std::vector<proptrade::domain::Position> getBySymbol(const std::string& symbol) const;
    std::vector<std::string> accountsWithPositionsOn(const std::string& symbol) const;
    double unrealizedPnlForAccount(const std::string& accountId,
                                   const proptrade::domain::IPriceSnapshotProvider& prices) const;
    size_t size() const;
};

} // namespace proptrade::application
