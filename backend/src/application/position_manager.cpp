#include "position_manager.hpp"
#include "order_validator.hpp"
#include "../utils/id_generator.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace proptrade::application {

using proptrade::domain::CloseOutcome;
using proptrade::domain::CloseReason;
using proptrade::domain::CloseResult;
using proptrade::domain::ModifyOutcome;
using proptrade::domain::ModifyResult;
using proptrade::domain::Position;
using proptrade::domain::PriceSnapshot;
using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;
using proptrade::domain::Side;
using proptrade::domain::TradeEvent;
using proptrade::domain::TradeEventType;

namespace {

TradeEvent positionEvent(TradeEventType type, const Position& position) {
    TradeEvent event;
    event.id = proptrade::utils::generateId("EVT");
    event.type = type;
    event.accountId = position.accountId;
    event.userId = position.userId;
    event.positionId = position.id;
    event.symbol = position.symbol;
    event.side = position.side;
    event.quantity = position.quantity;
    event.price = position.entryPrice;
    event.margin = position.marginUsed;
    event.timestamp = proptrade::domain::currentTimeMs();
    return event;
}

std::optional<TradeEventType> triggerEventFor(CloseReason reason) {
    switch (reason) {
        case CloseReason::TP_TRIGGERED: return TradeEventType::TP_TRIGGERED;
        case CloseReason::SL_TRIGGERED: return TradeEventType::SL_TRIGGERED;
        case CloseReason::LIQUIDATION_TRIGGERED: return TradeEventType::LIQUIDATION_TRIGGERED;
        default: return std::nullopt;
    }
}

} // namespace

PositionManager::PositionManager(AccountLedger& ledger,
                                 const MarginCalculator& calculator,
                                 proptrade::domain::ITradeEventSink& events,
                                 std::chrono::milliseconds lockTimeout)
    : ledger_(ledger), calculator_(calculator), events_(events), positionLocks_(lockTimeout) {
}

void PositionManager::insert(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.id] = position;
    bySymbol_[position.symbol].insert(position.id);
    byAccount_[position.accountId].insert(position.id);
}

void PositionManager::store(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    positions_[position.id] = position;
}

void PositionManager::erase(const std::string& positionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(positionId);
    if (it == positions_.end()) {
        return;
    }

    auto symbolIt = bySymbol_.find(it->second.symbol);
    if (symbolIt != bySymbol_.end()) {
        symbolIt->second.erase(positionId);
        if (symbolIt->second.empty()) {
            bySymbol_.erase(symbolIt);
        }
    }
    auto accountIt = byAccount_.find(it->second.accountId);
    if (accountIt != byAccount_.end()) {
        accountIt->second.erase(positionId);
        if (accountIt->second.empty()) {
            byAccount_.erase(accountIt);
        }
    }
    positions_.erase(it);
}

Position PositionManager::open(const EntityLock& accountLock, Position position) {
    if (!accountLock.owns() || accountLock.id() != position.accountId) {
        throw std::logic_error("position opened without holding account lock: " + position.accountId);
    }

    if (position.id.empty()) {
        position.id = proptrade::utils::generateId("POS");
    }
    insert(position);
    events_.record(positionEvent(TradeEventType::POSITION_OPENED, position));

    std::cout << "[PositionManager] Opened " << position.id << " " << position.symbol << " "
              << proptrade::domain::toString(position.side) << " " << position.quantity
              << " @ " << position.entryPrice << " x" << position.leverage << std::endl;
    return position;
}

ModifyOutcome PositionManager::modifyTPSL(const std::string& positionId,
                                          const std::string& userId,
                                          std::optional<double> takeProfit,
                                          std::optional<double> stopLoss) {
    auto positionLock = positionLocks_.acquire(positionId);
    if (!positionLock) {
        return Rejection(RejectCode::LOCK_TIMEOUT, "Position busy, please retry");
    }

    auto found = get(positionId);
    if (!found) {
        return Rejection(RejectCode::POSITION_NOT_FOUND, "Position not found");
    }
    Position position = *found;
    if (!userId.empty() && position.userId != userId) {
        return Rejection(RejectCode::NOT_OWNER, "Position does not belong to user");
    }

    // Validate both levels before touching either
    if (takeProfit && *takeProfit != 0.0) {
        if (!std::isfinite(*takeProfit) || *takeProfit < 0.0) {
            return Rejection(RejectCode::INVALID_TAKE_PROFIT, "Take profit must be a positive number");
        }
        if (auto error = OrderValidator::validateTakeProfit(position.side, position.entryPrice, *takeProfit)) {
            return *error;
        }
    }
    if (stopLoss && *stopLoss != 0.0) {
        if (!std::isfinite(*stopLoss) || *stopLoss < 0.0) {
            return Rejection(RejectCode::INVALID_STOP_LOSS, "Stop loss must be a positive number");
        }
        if (auto error = OrderValidator::validateStopLoss(position.side, position.entryPrice, *stopLoss)) {
            return *error;
        }
    }

    ModifyResult result;
    if (takeProfit) {
        auto next = *takeProfit == 0.0 ? std::nullopt : takeProfit;
        result.takeProfitChanged = next != position.takeProfit;
        position.takeProfit = next;
    }
    if (stopLoss) {
        auto next = *stopLoss == 0.0 ? std::nullopt : stopLoss;
        result.stopLossChanged = next != position.stopLoss;
        position.stopLoss = next;
    }
    store(position);
    result.position = position;

    if (result.takeProfitChanged) {
        auto event = positionEvent(TradeEventType::TP_MODIFIED, position);
        event.price = position.takeProfit.value_or(0.0);
        events_.record(event);
    }
    if (result.stopLossChanged) {
        auto event = positionEvent(TradeEventType::SL_MODIFIED, position);
        event.price = position.stopLoss.value_or(0.0);
        events_.record(event);
    }
    return result;
}

CloseOutcome PositionManager::closePartial(const std::string& positionId,
                                           double quantity,
                                           const PriceSnapshot& price,
                                           CloseReason reason,
                                           const std::string& userId) {
    return closeQuantity(positionId, quantity, price, reason, userId);
}

CloseOutcome PositionManager::closeFull(const std::string& positionId,
                                        const PriceSnapshot& price,
                                        CloseReason reason,
                                        const std::string& userId) {
    return closeQuantity(positionId, std::nullopt, price, reason, userId);
}

CloseOutcome PositionManager::closeQuantity(const std::string& positionId,
                                            std::optional<double> quantity,
                                            const PriceSnapshot& price,
                                            CloseReason reason,
                                            const std::string& userId) {
    auto positionLock = positionLocks_.acquire(positionId);
    if (!positionLock) {
        return Rejection(RejectCode::LOCK_TIMEOUT, "Position busy, please retry");
    }

    auto found = get(positionId);
    if (!found) {
        return Rejection(RejectCode::POSITION_NOT_FOUND, "Position not found");
    }
    Position position = *found;
    if (!userId.empty() && position.userId != userId) {
        return Rejection(RejectCode::NOT_OWNER, "Position does not belong to user");
    }

    double closeQty = position.quantity;
    bool partial = false;
    if (quantity) {
        if (!std::isfinite(*quantity) || *quantity <= 0.0) {
            return Rejection(RejectCode::INVALID_CLOSE_QUANTITY, "Close quantity must be a positive number");
        }
        if (*quantity < position.quantity) {
            closeQty = *quantity;
            partial = true;
        }
    }

    auto accountLock = ledger_.lock(position.accountId);
    if (!accountLock) {
        return Rejection(RejectCode::LOCK_TIMEOUT, "Account busy, please retry");
    }

    double ratio = closeQty / position.quantity;
    double exitPrice = price.exitPriceFor(position.side);

    CloseResult result;
    result.positionId = position.id;
    result.tradeId = proptrade::utils::generateId("TRD");
    result.accountId = position.accountId;
    result.userId = position.userId;
    result.symbol = position.symbol;
    result.side = position.side;
    result.reason = reason;
    result.exitPrice = exitPrice;
    result.quantityClosed = closeQty;
    result.partial = partial;
    result.grossPnl = MarginCalculator::unrealizedPnl(position.side, position.entryPrice, exitPrice, closeQty);
    result.exitFee = calculator_.fee(closeQty, exitPrice);
    result.fundingFee = position.accumulatedFunding * ratio;
    result.netPnl = result.grossPnl - result.exitFee - result.fundingFee;
    double entryFeePortion = position.entryFee * ratio;
    result.realizedPnl = result.netPnl - entryFeePortion;
    result.marginReleased = position.marginUsed * ratio;

    result.account = ledger_.settleClose(accountLock, result.marginReleased, result.netPnl);

    if (partial) {
        position.quantity -= closeQty;
        position.marginUsed -= result.marginReleased;
        position.entryFee -= entryFeePortion;
        position.accumulatedFunding -= result.fundingFee;
        store(position);
        result.remainingQuantity = position.quantity;
    } else {
        erase(position.id);
        positionLocks_.release(position.id);
        result.remainingQuantity = 0.0;
    }

    emitCloseEvents(position, result);

    std::cout << "[PositionManager] " << (partial ? "Partially closed " : "Closed ") << position.id
              << " " << position.symbol << " " << closeQty << " @ " << exitPrice
              << " reason=" << proptrade::domain::toString(reason)
              << " net=" << result.netPnl << std::endl;
    return result;
}

void PositionManager::emitCloseEvents(const Position& position, const CloseResult& result) {
    if (auto triggerType = triggerEventFor(result.reason)) {
        auto trigger = positionEvent(*triggerType, position);
        trigger.quantity = result.quantityClosed;
        trigger.price = result.exitPrice;
        events_.record(trigger);
    }

    auto event = positionEvent(result.partial ? TradeEventType::POSITION_PARTIALLY_CLOSED
                                              : TradeEventType::POSITION_CLOSED, position);
    event.orderId = result.tradeId;
    event.quantity = result.quantityClosed;
    event.price = result.exitPrice;
    event.margin = result.marginReleased;
    event.fee = result.exitFee;
    event.pnl = result.realizedPnl;
    event.reason = proptrade::domain::toString(result.reason);
    events_.record(event);
}

BatchCloseSummary PositionManager::closeAllForAccount(const std::string& accountId,
                                                      const proptrade::domain::IPriceSnapshotProvider& prices,
                                                      CloseReason reason,
                                                      int64_t staleMs) {
    BatchCloseSummary summary;
    for (const auto& position : getByAccount(accountId)) {
        auto snapshot = prices.getPrice(position.symbol);
        if (!snapshot || prices.isPriceStale(position.symbol, staleMs)) {
            std::cerr << "[PositionManager] Skipping close of " << position.id
                      << ": no fresh price for " << position.symbol << std::endl;
            summary.skipped++;
            continue;
        }

        auto outcome = closeFull(position.id, *snapshot, reason);
        if (auto* closed = std::get_if<CloseResult>(&outcome)) {
            summary.closed++;
            summary.totalPnl += closed->netPnl;
            summary.results.push_back(*closed);
        } else {
            const auto& rejection = std::get<Rejection>(outcome);
            std::cerr << "[PositionManager] Failed to close " << position.id << ": " << rejection.reason << std::endl;
            summary.skipped++;
        }
    }
    return summary;
}

int32_t PositionManager::accrueFunding(const std::function<double(const std::string&)>& rateForSymbol) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(positions_.size());
        for (const auto& [id, position] : positions_) {
            ids.push_back(id);
        }
    }

    int32_t applied = 0;
    for (const auto& id : ids) {
        auto positionLock = positionLocks_.acquire(id);
        if (!positionLock) {
            std::cerr << "[PositionManager] Funding skipped for busy position " << id << std::endl;
            continue;
        }
        auto found = get(id);
        if (!found) {
            continue;
        }

        Position position = *found;
        double payment = position.quantity * position.entryPrice * rateForSymbol(position.symbol);
        double cost = position.side == Side::LONG ? payment : -payment;
        position.accumulatedFunding += cost;
        store(position);

        auto event = positionEvent(TradeEventType::FUNDING_APPLIED, position);
        event.fee = cost;
        events_.record(event);
        applied++;
    }
    return applied;
}

std::optional<Position> PositionManager::get(const std::string& positionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(positionId);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Position> PositionManager::getByAccount(const std::string& accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    auto it = byAccount_.find(accountId);
    if (it == byAccount_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        result.push_back(positions_.at(id));
    }
    return result;
}

std::vector<Position> PositionManager::getBySymbol(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    auto it = bySymbol_.find(symbol);
    if (it == bySymbol_.end()) {
        return result;
    }
    for (const auto& id : it->second) {
        result.push_back(positions_.at(id));
    }
    return result;
}

std::vector<std::string> PositionManager::accountsWithPositionsOn(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> accounts;
    auto it = bySymbol_.find(symbol);
    if (it != bySymbol_.end()) {
        for (const auto& id : it->second) {
            accounts.insert(positions_.at(id).accountId);
        }
    }
    return {accounts.begin(), accounts.end()};
}

double PositionManager::unrealizedPnlForAccount(const std::string& accountId,
                                                const proptrade::domain::IPriceSnapshotProvider& prices) const {
    double total = 0.0;
    for (const auto& position : getByAccount(accountId)) {
        auto snapshot = prices.getPrice(position.symbol);
        if (!snapshot) {
            continue;
        }
        total += MarginCalculator::unrealizedPnl(position.side, position.entryPrice, snapshot->mid, position.quantity);
    }
    return total;
}

size_t PositionManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.size();
}

} // namespace proptrade::application
