#pragma once

#include "../domain/interfaces.hpp"
#include "account_ledger.hpp"
#include "margin_calculator.hpp"
#include "order_validator.hpp"
#include "pending_order_queue.hpp"
#include "position_manager.hpp"
#include "rate_limiter.hpp"
#include <optional>
#include <string>
#include <vector>

namespace proptrade::application {

struct PlacementOutcome {
    proptrade::domain::PlaceOrderResult result;
    bool duplicate = false;
};

struct QueuedFill {
    proptrade::domain::PendingOrder order;
    proptrade::domain::ExecutionResult result;
};

// Single synchronous fill-or-reject path for client orders, resting-order fills
// and client closes. Every check runs before the first ledger write.
class OrderExecutor {
private:
    AccountLedger& ledger_;
    PositionManager& positions_;
    PendingOrderQueue& pending_;
    const MarginCalculator& calculator_;
    const OrderValidator& validator_;
    RateLimiter& rateLimiter_;
    const proptrade::domain::IPriceSnapshotProvider& prices_;
    proptrade::domain::IIdempotencyCache& idempotency_;
    proptrade::domain::ITradeEventSink& events_;

    proptrade::domain::ExecutionResult executeLocked(const EntityLock& accountLock,
                                                     const proptrade::domain::OrderRequest& order,
                                                     double executionPrice,
                                                     bool filledFromQueue,
                                                     const std::string& orderId);

    proptrade::domain::PlaceOrderResult placeLocked(const proptrade::domain::OrderRequest& order,
                                                    double lockedPrice,
                                                    bool& duplicate);

    std::optional<proptrade::domain::Rejection> checkRateLimit(const std::string& userId,
                                                               const std::string& action,
                                                               int64_t nowMs);

    static std::string idempotencyKey(const proptrade::domain::OrderRequest& order);

public:
    OrderExecutor(AccountLedger& ledger,
                  PositionManager& positions,
                  PendingOrderQueue& pending,
                  const MarginCalculator& calculator,
                  const OrderValidator& validator,
                  RateLimiter& rateLimiter,
                  const proptrade::domain::IPriceSnapshotProvider& prices,
                  proptrade::domain::IIdempotencyCache& idempotency,
                  proptrade::domain::ITradeEventSink& events);

    // Rate limit, replay guard, validation, price lock, then queue or fill
    PlacementOutcome place(const proptrade::domain::OrderRequest& order, int64_t nowMs);
    PlacementOutcome place(const proptrade::domain::OrderRequest& order) {
        return place(order, proptrade::domain::currentTimeMs());
    }

    // Fills a validated order at the snapshot's side-appropriate price
    proptrade::domain::ExecutionResult executeSync(const proptrade::domain::OrderRequest& order,
                                                   const proptrade::domain::PriceSnapshot& price);

    // Fills every resting order the tick satisfies; failures cancel the order
    std::vector<QueuedFill> fillPending(const proptrade::domain::PriceSnapshot& price);

    proptrade::domain::CloseOutcome closePosition(const std::string& userId,
                                                  const std::string& positionId,
                                                  std::optional<double> quantity,
                                                  int64_t nowMs);

    proptrade::domain::ModifyOutcome modifyPosition(const std::string& userId,
                                                    const std::string& positionId,
                                                    std::optional<double> takeProfit,
                                                    std::optional<double> stopLoss,
                                                    int64_t nowMs);

    proptrade::domain::CancelOutcome cancelOrder(const std::string& userId, const std::string& orderId);
};

} // namespace proptrade::application
