#pragma once

#include "../application/account_ledger.hpp"
#include "../application/order_executor.hpp"
#include "../application/pending_order_queue.hpp"
#include "../application/position_manager.hpp"
#include "../application/rate_limiter.hpp"
#include "../domain/interfaces.hpp"
#include "connection_manager.hpp"
#include "messages.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace proptrade::interfaces {

// Transport-independent handling of client messages. Each call yields
// the reply for the requesting connection, or null when none is due (PONG).
class MessageDispatcher {
private:
    ConnectionManager& connections_;
    proptrade::application::OrderExecutor& executor_;
    proptrade::application::PositionManager& positions_;
    proptrade::application::PendingOrderQueue& pending_;
    proptrade::application::AccountLedger& ledger_;
    proptrade::application::RateLimiter& rateLimiter_;
    const proptrade::domain::IPriceSnapshotProvider& prices_;
    proptrade::domain::IAuthInspector& auth_;

    // Checks that the account exists and belongs to the user, then binds it to the connection
    std::optional<nlohmann::json> bindAccount(const std::string& connectionId,
                                              const std::string& userId,
                                              const std::string& accountId);

    nlohmann::json handle(const std::string& connectionId, const AuthMessage& message);
    nlohmann::json handle(const std::string& connectionId,
                          const std::string& userId,
                          const PlaceOrderMessage& message,
                          int64_t nowMs);
    nlohmann::json handle(const std::string& userId, const CancelOrderMessage& message);
    nlohmann::json handle(const std::string& userId, const ModifyPositionMessage& message, int64_t nowMs);
    nlohmann::json handle(const std::string& userId, const ClosePositionMessage& message, int64_t nowMs);
    nlohmann::json handle(const std::string& connectionId, const std::string& userId, const GetPositionsMessage& message);
    nlohmann::json handle(const std::string& connectionId, const std::string& userId, const GetPendingOrdersMessage& message);
    std::optional<nlohmann::json> rateLimited(const std::string& userId, const std::string& action, int64_t nowMs);

    nlohmann::json handle(const std::string& connectionId, const SubscribeMessage& message);
    nlohmann::json handle(const std::string& connectionId, const UnsubscribeMessage& message);

public:
    MessageDispatcher(ConnectionManager& connections,
                      proptrade::application::OrderExecutor& executor,
                      proptrade::application::PositionManager& positions,
                      proptrade::application::PendingOrderQueue& pending,
                      proptrade::application::AccountLedger& ledger,
                      proptrade::application::RateLimiter& rateLimiter,
                      const proptrade::domain::IPriceSnapshotProvider& prices,
                      proptrade::domain::IAuthInspector& auth);

    nlohmann::json dispatch(const std::string& connectionId, const InboundMessage& message, int64_t nowMs);
    nlohmann::json dispatch(const std::string& connectionId,
                            const std::string& type,
                            const nlohmann::json& payload,
                            int64_t nowMs);
};

} // namespace proptrade::interfaces
