#include "order_executor.hpp"
#include "../utils/id_generator.hpp"
#include <iostream>
#include <stdexcept>

namespace proptrade::application {

using proptrade::domain::CloseOutcome;
using proptrade::domain::CloseReason;
using proptrade::domain::ExecutionResult;
using proptrade::domain::FillResult;
using proptrade::domain::ModifyOutcome;
using proptrade::domain::OrderRequest;
using proptrade::domain::OrderType;
using proptrade::domain::PendingOrderStatus;
using proptrade::domain::PendingResult;
using proptrade::domain::PlaceOrderResult;
using proptrade::domain::Position;
using proptrade::domain::PriceSnapshot;
using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;
using proptrade::domain::Side;
using proptrade::domain::TradeEvent;
using proptrade::domain::TradeEventType;

namespace {

const char* kInternalError = "Internal error processing order";

Rejection staleRejection() {
    return Rejection(RejectCode::PRICE_STALE, "Price data is stale. Please try again.");
}

} // namespace

OrderExecutor::OrderExecutor(AccountLedger& ledger,
                             PositionManager& positions,
                             PendingOrderQueue& pending,
                             const MarginCalculator& calculator,
                             const OrderValidator& validator,
                             RateLimiter& rateLimiter,
                             const proptrade::domain::IPriceSnapshotProvider& prices,
                             proptrade::domain::IIdempotencyCache& idempotency,
                             proptrade::domain::ITradeEventSink& events)
    : ledger_(ledger), positions_(positions), pending_(pending), calculator_(calculator),
      validator_(validator), rateLimiter_(rateLimiter), prices_(prices),
      idempotency_(idempotency), events_(events) {
}

std::string OrderExecutor::idempotencyKey(const OrderRequest& order) {
    return order.userId + ":" + order.clientOrderId;
}

std::optional<Rejection> OrderExecutor::checkRateLimit(const std::string& userId,
                                                       const std::string& action,
                                                       int64_t nowMs) {
    auto decision = rateLimiter_.check(userId, action, nowMs);
    if (decision.allowed) {
        return std::nullopt;
    }
    return Rejection(RejectCode::RATE_LIMITED,
                     "Rate limit exceeded. Try again in " + std::to_string(decision.resetInMs) + "ms.");
}

PlacementOutcome OrderExecutor::place(const OrderRequest& order, int64_t nowMs) {
    PlacementOutcome outcome;
    try {
        if (auto limited = checkRateLimit(order.userId, "PLACE_ORDER", nowMs)) {
            outcome.result = *limited;
            return outcome;
        }
        if (auto error = RateLimiter::validateTimestamp(order.timestamp, nowMs)) {
            outcome.result = *error;
            return outcome;
        }
        if (auto error = validator_.validate(order)) {
            outcome.result = *error;
            return outcome;
        }

        auto price = prices_.getPrice(order.symbol);
        if (!price) {
            outcome.result = Rejection(RejectCode::PRICE_UNAVAILABLE, "No price available for " + order.symbol);
            return outcome;
        }
        if (prices_.isPriceStale(order.symbol, calculator_.parameters().priceStaleMs)) {
            outcome.result = staleRejection();
            return outcome;
        }

        // Fill price is locked here; TP/SL are judged against it, never a client quote
        double lockedPrice = price->entryPriceFor(*order.side);
        if (auto error = OrderValidator::validateProtectionLevels(*order.side, lockedPrice,
                                                                  order.takeProfit, order.stopLoss)) {
            outcome.result = *error;
            return outcome;
        }

        outcome.result = placeLocked(order, lockedPrice, outcome.duplicate);
    } catch (const std::exception& e) {
        std::cerr << "[OrderExecutor] Unexpected error placing " << order.clientOrderId
                  << " for " << order.accountId << ": " << e.what() << std::endl;
        outcome.result = Rejection(RejectCode::INTERNAL_ERROR, kInternalError);
        outcome.duplicate = false;
    }
    return outcome;
}

PlaceOrderResult OrderExecutor::placeLocked(const OrderRequest& order,
                                            double lockedPrice,
                                            bool& duplicate) {
    auto accountLock = ledger_.lock(order.accountId);
    if (!accountLock) {
        return Rejection(RejectCode::LOCK_TIMEOUT, "Account busy, please retry");
    }

    // Concurrent duplicates serialize on the account lock
    bool deduplicate = !order.clientOrderId.empty();
    if (deduplicate) {
        if (auto cached = idempotency_.get(idempotencyKey(order))) {
            std::cout << "[OrderExecutor] Duplicate clientOrderId " << order.clientOrderId
                      << " from " << order.userId << ", replaying result" << std::endl;
            duplicate = true;
            return *cached;
        }
    }

    PlaceOrderResult result;
    bool crosses = order.type != OrderType::LIMIT ||
                   (*order.side == Side::LONG ? lockedPrice <= *order.limitPrice
                                              : lockedPrice >= *order.limitPrice);
    if (!crosses) {
        auto loaded = ledger_.loadForTrading(accountLock, order.userId);
        if (auto* rejection = std::get_if<Rejection>(&loaded)) {
            return *rejection;
        }
        auto admitted = pending_.admit(accountLock, order, lockedPrice);
        if (auto* rejection = std::get_if<Rejection>(&admitted)) {
            return *rejection;
        }
        result = std::get<PendingResult>(admitted);
    } else {
        auto executed = executeLocked(accountLock, order, lockedPrice, false, "");
        if (auto* rejection = std::get_if<Rejection>(&executed)) {
            return *rejection;
        }
        result = std::get<FillResult>(executed);
    }

    if (deduplicate) {
        idempotency_.put(idempotencyKey(order), result);
    }
    return result;
}

ExecutionResult OrderExecutor::executeSync(const OrderRequest& order, const PriceSnapshot& price) {
    try {
        if (!order.side) {
            return Rejection(RejectCode::INVALID_SIDE, "Side must be LONG or SHORT");
        }
        if (price.isStale(proptrade::domain::currentTimeMs(), calculator_.parameters().priceStaleMs)) {
            return staleRejection();
        }

        double executionPrice = price.entryPriceFor(*order.side);
        if (auto error = OrderValidator::validateProtectionLevels(*order.side, executionPrice,
                                                                  order.takeProfit, order.stopLoss)) {
            return *error;
        }

        auto accountLock = ledger_.lock(order.accountId);
        if (!accountLock) {
            return Rejection(RejectCode::LOCK_TIMEOUT, "Account busy, please retry");
        }
        return executeLocked(accountLock, order, executionPrice, false, "");
    } catch (const std::exception& e) {
        std::cerr << "[OrderExecutor] Unexpected error executing " << order.clientOrderId
                  << " for " << order.accountId << ": " << e.what() << std::endl;
        return Rejection(RejectCode::INTERNAL_ERROR, kInternalError);
    }
}

ExecutionResult OrderExecutor::executeLocked(const EntityLock& accountLock,
                                             const OrderRequest& order,
                                             double executionPrice,
                                             bool filledFromQueue,
                                             const std::string& orderId) {
    auto loaded = ledger_.loadForTrading(accountLock, order.userId);
    if (auto* rejection = std::get_if<Rejection>(&loaded)) {
        return *rejection;
    }

    auto requirement = calculator_.calculate(order.symbol, *order.side, order.quantity,
                                             executionPrice, order.leverage);

    auto applied = ledger_.applyOpen(accountLock, requirement);
    if (auto* rejection = std::get_if<Rejection>(&applied)) {
        return *rejection;
    }

    Position position;
    position.accountId = accountLock.id();
    position.userId = order.userId;
    position.symbol = order.symbol;
    position.side = *order.side;
    position.quantity = order.quantity;
    position.entryPrice = executionPrice;
    position.leverage = requirement.leverage;
    position.marginUsed = requirement.marginRequired;
    position.entryFee = requirement.entryFee;
    position.takeProfit = order.takeProfit;
    position.stopLoss = order.stopLoss;
    position.liquidationPrice = requirement.liquidationPrice;
    position.openedAt = proptrade::domain::currentTimeMs();
    position = positions_.open(accountLock, position);

    FillResult fill;
    fill.orderId = orderId.empty() ? proptrade::utils::generateId("ORD") : orderId;
    fill.clientOrderId = order.clientOrderId;
    fill.position = position;
    fill.account = std::get<proptrade::domain::AccountState>(applied);
    fill.executionPrice = executionPrice;
    fill.marginRequired = requirement.marginRequired;
    fill.entryFee = requirement.entryFee;
    fill.filledFromQueue = filledFromQueue;

    TradeEvent event;
    event.id = proptrade::utils::generateId("EVT");
    event.type = TradeEventType::ORDER_FILLED;
    event.accountId = position.accountId;
    event.userId = position.userId;
    event.positionId = position.id;
    event.orderId = fill.orderId;
    event.symbol = position.symbol;
    event.side = position.side;
    event.quantity = position.quantity;
    event.price = executionPrice;
    event.margin = requirement.marginRequired;
    event.fee = requirement.entryFee;
    event.reason = filledFromQueue ? "LIMIT_FILL" : "";
    event.timestamp = position.openedAt;
    events_.record(event);

    std::cout << "[OrderExecutor] Filled " << fill.orderId << " " << position.symbol << " "
              << proptrade::domain::toString(position.side) << " " << position.quantity
              << " @ " << executionPrice << (filledFromQueue ? " (queued)" : "") << std::endl;
    return fill;
}

std::vector<QueuedFill> OrderExecutor::fillPending(const PriceSnapshot& price) {
    std::vector<QueuedFill> fills;
    if (price.isStale(proptrade::domain::currentTimeMs(), calculator_.parameters().priceStaleMs)) {
        return fills;
    }

    for (const auto& candidate : pending_.collectFillable(price)) {
        auto accountLock = ledger_.lock(candidate.accountId);
        if (!accountLock) {
            // Still resting; retried on the next tick
            continue;
        }

        auto claimed = pending_.claim(accountLock, candidate.id, PendingOrderStatus::FILLED);
        if (!claimed) {
            continue;
        }
        ledger_.releaseReservation(accountLock, claimed->marginReserved);

        double executionPrice = PendingOrderQueue::executionPriceFor(*claimed, price);

        OrderRequest request;
        request.clientOrderId = claimed->clientOrderId;
        request.userId = claimed->userId;
        request.accountId = claimed->accountId;
        request.symbol = claimed->symbol;
        request.side = claimed->side;
        request.type = OrderType::LIMIT;
        request.quantity = claimed->quantity;
        request.leverage = claimed->leverage;
        request.limitPrice = claimed->limitPrice;
        request.takeProfit = claimed->takeProfit;
        request.stopLoss = claimed->stopLoss;

        QueuedFill fill;
        fill.order = *claimed;
        try {
            if (auto error = OrderValidator::validateProtectionLevels(claimed->side, executionPrice,
                                                                      claimed->takeProfit, claimed->stopLoss)) {
                fill.result = *error;
            } else {
                fill.result = executeLocked(accountLock, request, executionPrice, true, claimed->id);
            }
        } catch (const std::exception& e) {
            std::cerr << "[OrderExecutor] Unexpected error filling " << claimed->id << ": " << e.what() << std::endl;
            fill.result = Rejection(RejectCode::INTERNAL_ERROR, kInternalError);
        }

        if (auto* rejection = std::get_if<Rejection>(&fill.result)) {
            pending_.markFillFailed(accountLock, claimed->id, rejection->reason);
            fill.order.status = PendingOrderStatus::CANCELLED;
        }
        fills.push_back(std::move(fill));
    }
    return fills;
}

CloseOutcome OrderExecutor::closePosition(const std::string& userId,
                                          const std::string& positionId,
                                          std::optional<double> quantity,
                                          int64_t nowMs) {
    try {
        if (auto limited = checkRateLimit(userId, "CLOSE_POSITION", nowMs)) {
            return *limited;
        }

        auto position = positions_.get(positionId);
        if (!position) {
            return Rejection(RejectCode::POSITION_NOT_FOUND, "Position not found");
        }

        auto price = prices_.getPrice(position->symbol);
        if (!price) {
            return Rejection(RejectCode::PRICE_UNAVAILABLE, "No price available for " + position->symbol);
        }
        if (prices_.isPriceStale(position->symbol, calculator_.parameters().priceStaleMs)) {
            return staleRejection();
        }

        if (quantity) {
            return positions_.closePartial(positionId, *quantity, *price, CloseReason::MANUAL, userId);
        }
        return positions_.closeFull(positionId, *price, CloseReason::MANUAL, userId);
    } catch (const std::exception& e) {
        std::cerr << "[OrderExecutor] Unexpected error closing " << positionId << ": " << e.what() << std::endl;
        return Rejection(RejectCode::INTERNAL_ERROR, "Internal error closing position");
    }
}

ModifyOutcome OrderExecutor::modifyPosition(const std::string& userId,
                                            const std::string& positionId,
                                            std::optional<double> takeProfit,
                                            std::optional<double> stopLoss,
                                            int64_t nowMs) {
    if (auto limited = checkRateLimit(userId, "MODIFY_POSITION", nowMs)) {
        return *limited;
    }
    return positions_.modifyTPSL(positionId, userId, takeProfit, stopLoss);
}

proptrade::domain::CancelOutcome OrderExecutor::cancelOrder(const std::string& userId, const std::string& orderId) {
    return pending_.cancel(orderId, userId);
}

} // namespace proptrade::application
