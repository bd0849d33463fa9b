#include "pending_order_queue.hpp"
#include "../utils/id_generator.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace proptrade::application {

using proptrade::domain::CancelOutcome;
using proptrade::domain::CancelResult;
using proptrade::domain::PendingOrder;
using proptrade::domain::PendingOrderStatus;
using proptrade::domain::PendingResult;
using proptrade::domain::PriceSnapshot;
using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;
using proptrade::domain::Side;
using proptrade::domain::TradeEvent;
using proptrade::domain::TradeEventType;

PendingOrderQueue::PendingOrderQueue(AccountLedger& ledger,
                                     const MarginCalculator& calculator,
                                     proptrade::domain::ITradeEventSink& events,
                                     int64_t retentionMs)
    : ledger_(ledger), calculator_(calculator), events_(events), retentionMs_(retentionMs) {
}

void PendingOrderQueue::recordEvent(TradeEventType type, const PendingOrder& order, const std::string& reason) {
    TradeEvent event;
    event.id = proptrade::utils::generateId("EVT");
    event.type = type;
    event.accountId = order.accountId;
    event.userId = order.userId;
    event.orderId = order.id;
    event.symbol = order.symbol;
    event.side = order.side;
    event.quantity = order.quantity;
    event.price = order.limitPrice;
    event.margin = order.marginReserved;
    event.reason = reason;
    event.timestamp = proptrade::domain::currentTimeMs();
    events_.record(event);
}

bool PendingOrderQueue::isFillable(const PendingOrder& order, const PriceSnapshot& price) {
    if (order.side == Side::LONG) {
        return price.ask <= order.limitPrice;
    }
    return price.bid >= order.limitPrice;
}

double PendingOrderQueue::executionPriceFor(const PendingOrder& order, const PriceSnapshot& price) {
    if (order.side == Side::LONG) {
        return std::min(order.limitPrice, price.ask);
    }
    return std::max(order.limitPrice, price.bid);
}

AdmitOutcome PendingOrderQueue::admit(const EntityLock& accountLock,
                                      const proptrade::domain::OrderRequest& request,
                                      double currentPrice) {
    if (!request.side || !request.limitPrice) {
        throw std::invalid_argument("pending order needs a side and a limit price");
    }

    auto requirement = calculator_.calculate(request.symbol, *request.side, request.quantity,
                                             *request.limitPrice, request.leverage);

    auto reserved = ledger_.reserve(accountLock, requirement.totalRequired());
    if (auto* rejection = std::get_if<Rejection>(&reserved)) {
        return *rejection;
    }

    PendingOrder order;
    order.id = proptrade::utils::generateId("ORD");
    order.clientOrderId = request.clientOrderId;
    order.userId = request.userId;
    order.accountId = accountLock.id();
    order.symbol = request.symbol;
    order.side = *request.side;
    order.quantity = request.quantity;
    order.limitPrice = *request.limitPrice;
    order.leverage = requirement.leverage;
    order.takeProfit = request.takeProfit;
    order.stopLoss = request.stopLoss;
    order.marginReserved = requirement.totalRequired();
    order.status = PendingOrderStatus::PENDING;
    order.createdAt = proptrade::domain::currentTimeMs();
    order.expiresAt = request.expiresAt;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        orders_[order.id] = order;
        bySymbol_[order.symbol].insert(order.id);
    }
    recordEvent(TradeEventType::ORDER_PENDING, order);

    std::cout << "[PendingOrders] Queued " << order.id << " " << order.symbol << " "
              << proptrade::domain::toString(order.side) << " " << order.quantity
              << " @ " << order.limitPrice << " reserved=" << order.marginReserved << std::endl;

    PendingResult result;
    result.order = order;
    result.currentPrice = currentPrice;
    return result;
}

std::optional<PendingOrder> PendingOrderQueue::claim(const EntityLock& accountLock,
                                                     const std::string& orderId,
                                                     PendingOrderStatus status) {
    if (!accountLock.owns()) {
        throw std::logic_error("pending order claimed without holding account lock: " + orderId);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    PendingOrder& order = it->second;
    if (order.status != PendingOrderStatus::PENDING || order.accountId != accountLock.id()) {
        return std::nullopt;
    }

    order.status = status;
    auto symbolIt = bySymbol_.find(order.symbol);
    if (symbolIt != bySymbol_.end()) {
        symbolIt->second.erase(orderId);
        if (symbolIt->second.empty()) {
            bySymbol_.erase(symbolIt);
        }
    }
    finishedAt_[orderId] = proptrade::domain::currentTimeMs();
    return order;
}

void PendingOrderQueue::markFillFailed(const EntityLock& accountLock, const std::string& orderId, const std::string& reason) {
    std::optional<PendingOrder> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        if (it == orders_.end() || it->second.accountId != accountLock.id() ||
            it->second.status != PendingOrderStatus::FILLED) {
            return;
        }
        it->second.status = PendingOrderStatus::CANCELLED;
        failed = it->second;
    }
    recordEvent(TradeEventType::ORDER_CANCELLED, *failed, reason);
    std::cerr << "[PendingOrders] Fill failed for " << orderId << ": " << reason << std::endl;
}

CancelOutcome PendingOrderQueue::cancel(const std::string& orderId, const std::string& userId) {
    auto order = get(orderId);
    if (!order) {
        return Rejection(RejectCode::ORDER_NOT_FOUND, "Order not found");
    }
    if (order->userId != userId) {
        return Rejection(RejectCode::NOT_OWNER, "Order does not belong to user");
    }

    auto accountLock = ledger_.lock(order->accountId);
    if (!accountLock) {
        return Rejection(RejectCode::LOCK_TIMEOUT, "Account busy, please retry");
    }

    auto claimed = claim(accountLock, orderId, PendingOrderStatus::CANCELLED);
    if (!claimed) {
        return Rejection(RejectCode::ORDER_NOT_CANCELLABLE, "Order cannot be cancelled (may already be filled)");
    }

    ledger_.releaseReservation(accountLock, claimed->marginReserved);
    recordEvent(TradeEventType::ORDER_CANCELLED, *claimed, "USER_CANCELLED");

    std::cout << "[PendingOrders] Cancelled " << orderId << ", released " << claimed->marginReserved << std::endl;

    CancelResult result;
    result.order = *claimed;
    result.marginReleased = claimed->marginReserved;
    return result;
}

std::vector<CancelResult> PendingOrderQueue::cancelAllForAccount(const EntityLock& accountLock) {
    std::vector<CancelResult> results;
    for (const auto& order : pendingForAccount(accountLock.id())) {
        auto claimed = claim(accountLock, order.id, PendingOrderStatus::CANCELLED);
        if (!claimed) {
            continue;
        }
        ledger_.releaseReservation(accountLock, claimed->marginReserved);
        recordEvent(TradeEventType::ORDER_CANCELLED, *claimed, "ACCOUNT_BREACHED");

        CancelResult result;
        result.order = *claimed;
        result.marginReleased = claimed->marginReserved;
        results.push_back(result);
    }
    return results;
}

std::vector<PendingOrder> PendingOrderQueue::collectFillable(const PriceSnapshot& price) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingOrder> fillable;
    auto symbolIt = bySymbol_.find(price.symbol);
    if (symbolIt == bySymbol_.end()) {
        return fillable;
    }
    for (const auto& id : symbolIt->second) {
        const auto& order = orders_.at(id);
        if (order.status == PendingOrderStatus::PENDING && isFillable(order, price)) {
            fillable.push_back(order);
        }
    }
    // Oldest first
    std::sort(fillable.begin(), fillable.end(), [](const PendingOrder& a, const PendingOrder& b) {
        return a.createdAt < b.createdAt;
    });
    return fillable;
}

std::vector<PendingOrder> PendingOrderQueue::cleanupExpired(int64_t nowMs) {
    std::vector<PendingOrder> overdue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, order] : orders_) {
            if (order.status == PendingOrderStatus::PENDING && order.expiresAt && *order.expiresAt <= nowMs) {
                overdue.push_back(order);
            }
        }
    }

    std::vector<PendingOrder> expired;
    for (const auto& order : overdue) {
        auto accountLock = ledger_.lock(order.accountId);
        if (!accountLock) {
            // Picked up again on the next sweep
            continue;
        }
        auto claimed = claim(accountLock, order.id, PendingOrderStatus::EXPIRED);
        if (!claimed) {
            continue;
        }
        ledger_.releaseReservation(accountLock, claimed->marginReserved);
        recordEvent(TradeEventType::ORDER_EXPIRED, *claimed);
        expired.push_back(*claimed);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = finishedAt_.begin(); it != finishedAt_.end();) {
            if (nowMs - it->second > retentionMs_) {
                orders_.erase(it->first);
                it = finishedAt_.erase(it);
            } else {
                ++it;
            }
        }
    }

    if (!expired.empty()) {
        std::cout << "[PendingOrders] Expired " << expired.size() << " orders" << std::endl;
    }
    return expired;
}

std::optional<PendingOrder> PendingOrderQueue::get(const std::string& orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PendingOrder> PendingOrderQueue::pendingForAccount(const std::string& accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PendingOrder> result;
    for (const auto& [id, order] : orders_) {
        if (order.accountId == accountId && order.status == PendingOrderStatus::PENDING) {
            result.push_back(order);
        }
    }
    std::sort(result.begin(), result.end(), [](const PendingOrder& a, const PendingOrder& b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

double PendingOrderQueue::reservedForAccount(const std::string& accountId) const {
    double total = 0.0;
    for (const auto& order : pendingForAccount(accountId)) {
        total += order.marginReserved;
    }
    return total;
}

size_t PendingOrderQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, order] : orders_) {
        if (order.status == PendingOrderStatus::PENDING) {
            count++;
        }
    }
    return count;
}

} // namespace proptrade::application
