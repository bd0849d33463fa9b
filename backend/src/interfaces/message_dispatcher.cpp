#include "message_dispatcher.hpp"
#include <iostream>
#include <type_traits>

namespace proptrade::interfaces {

using nlohmann::json;
using namespace proptrade::domain;

namespace {

// Makes a static_assert depend on the visited alternative
template <typename>
struct AlwaysFalse : std::false_type {};

} // namespace

MessageDispatcher::MessageDispatcher(ConnectionManager& connections,
                                     proptrade::application::OrderExecutor& executor,
                                     proptrade::application::PositionManager& positions,
                                     proptrade::application::PendingOrderQueue& pending,
                                     proptrade::application::AccountLedger& ledger,
                                     proptrade::application::RateLimiter& rateLimiter,
                                     const IPriceSnapshotProvider& prices,
                                     IAuthInspector& auth)
    : connections_(connections), executor_(executor), positions_(positions), pending_(pending),
      ledger_(ledger), rateLimiter_(rateLimiter), prices_(prices), auth_(auth) {
}

json MessageDispatcher::dispatch(const std::string& connectionId,
                                 const std::string& type,
                                 const json& payload,
                                 int64_t nowMs) {
    auto decoded = decodeMessage(type, payload);
    if (auto* error = std::get_if<DecodeError>(&decoded)) {
        return outbound::error(error->message);
    }
    return dispatch(connectionId, std::get<InboundMessage>(decoded), nowMs);
}

json MessageDispatcher::dispatch(const std::string& connectionId, const InboundMessage& message, int64_t nowMs) {
    auto userId = connections_.userFor(connectionId);

    return std::visit([&](const auto& typed) -> json {
        using T = std::decay_t<decltype(typed)>;
        if constexpr (std::is_same_v<T, PingMessage>) {
            return outbound::pong(nowMs);
        } else if constexpr (std::is_same_v<T, PongMessage>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, AuthMessage>) {
            return handle(connectionId, typed);
        } else {
            if (!userId) {
                return outbound::error("Not authenticated");
            }

            if constexpr (std::is_same_v<T, PlaceOrderMessage>) {
                return handle(connectionId, *userId, typed, nowMs);
            } else if constexpr (std::is_same_v<T, CancelOrderMessage>) {
                return handle(*userId, typed);
            } else if constexpr (std::is_same_v<T, ModifyPositionMessage>) {
                return handle(*userId, typed, nowMs);
            } else if constexpr (std::is_same_v<T, ClosePositionMessage>) {
                return handle(*userId, typed, nowMs);
            } else if constexpr (std::is_same_v<T, GetPositionsMessage> ||
                                 std::is_same_v<T, GetPendingOrdersMessage>) {
                return handle(connectionId, *userId, typed);
            } else if constexpr (std::is_same_v<T, SubscribeMessage>) {
                if (auto limited = rateLimited(*userId, "SUBSCRIBE", nowMs)) {
                    return *limited;
                }
                return handle(connectionId, typed);
            } else if constexpr (std::is_same_v<T, UnsubscribeMessage>) {
                if (auto limited = rateLimited(*userId, "UNSUBSCRIBE", nowMs)) {
                    return *limited;
                }
                return handle(connectionId, typed);
            } else {
                static_assert(AlwaysFalse<T>::value, "unhandled inbound message");
            }
        }
    }, message);
}

json MessageDispatcher::handle(const std::string& connectionId, const AuthMessage& message) {
    if (message.token.empty()) {
        return outbound::authError("Token is required");
    }

    auto principal = auth_.verify(message.token);
    if (!principal) {
        return outbound::authError("Invalid or expired token");
    }

    if (!connections_.setUser(connectionId, principal->subject)) {
        return outbound::authError("Connection is no longer registered");
    }
    std::cout << "[Auth] Connection " << connectionId << " authenticated as " << principal->subject << std::endl;
    return outbound::authenticated(principal->subject);
}

json MessageDispatcher::handle(const std::string& connectionId,
                              const std::string& userId,
                              const PlaceOrderMessage& message,
                              int64_t nowMs) {
    OrderRequest order = message.order;
    order.userId = userId;

    auto outcome = executor_.place(order, nowMs);
    if (std::holds_alternative<Rejection>(outcome.result)) {
        return outbound::orderRejected(std::get<Rejection>(outcome.result), order.clientOrderId);
    }

    json reply = std::holds_alternative<FillResult>(outcome.result)
        ? outbound::orderFilled(std::get<FillResult>(outcome.result), outcome.duplicate)
        : outbound::orderPending(std::get<PendingResult>(outcome.result), outcome.duplicate);

    // The user's other sessions learn about new positions and resting orders too; replays change nothing
    if (!outcome.duplicate) {
        connections_.sendToUser(userId, reply, connectionId);
    }
    return reply;
}

json MessageDispatcher::handle(const std::string& userId, const CancelOrderMessage& message) {
    auto outcome = executor_.cancelOrder(userId, message.orderId);
    if (auto* cancelled = std::get_if<CancelResult>(&outcome)) {
        return outbound::orderCancelled(*cancelled);
    }
    return outbound::cancelRejected(message.orderId, std::get<Rejection>(outcome));
}

json MessageDispatcher::handle(const std::string& userId, const ModifyPositionMessage& message, int64_t nowMs) {
    auto outcome = executor_.modifyPosition(userId, message.positionId, message.takeProfit, message.stopLoss, nowMs);
    if (auto* modified = std::get_if<ModifyResult>(&outcome)) {
        return outbound::positionModified(*modified);
    }
    return outbound::modifyRejected(message.positionId, std::get<Rejection>(outcome));
}

json MessageDispatcher::handle(const std::string& userId, const ClosePositionMessage& message, int64_t nowMs) {
    if (!message.accountId.empty()) {
        auto position = positions_.get(message.positionId);
        if (position && position->accountId != message.accountId) {
            return outbound::closeRejected(message.positionId,
                                           Rejection(RejectCode::POSITION_NOT_FOUND, "Position not found"));
        }
    }

    auto outcome = executor_.closePosition(userId, message.positionId, message.quantity, nowMs);
    if (auto* closed = std::get_if<CloseResult>(&outcome)) {
        return outbound::positionClosed(*closed);
    }
    return outbound::closeRejected(message.positionId, std::get<Rejection>(outcome));
}

std::optional<json> MessageDispatcher::bindAccount(const std::string& connectionId,
                                                   const std::string& userId,
                                                   const std::string& accountId) {
    if (accountId.empty()) {
        return json{{"type", "ERROR"}, {"error", "Account ID is required"}, {"code", toString(RejectCode::MISSING_ACCOUNT_ID)}};
    }
    auto account = ledger_.getAccount(accountId);
    if (!account) {
        return json{{"type", "ERROR"}, {"error", "Account not found"}, {"code", toString(RejectCode::ACCOUNT_NOT_FOUND)}};
    }
    if (account->userId != userId) {
        return json{{"type", "ERROR"}, {"error", "Account does not belong to user"}, {"code", toString(RejectCode::NOT_OWNER)}};
    }
    connections_.setAccount(connectionId, accountId);
    return std::nullopt;
}

json MessageDispatcher::handle(const std::string& connectionId, const std::string& userId, const GetPositionsMessage& message) {
    if (auto error = bindAccount(connectionId, userId, message.accountId)) {
        return *error;
    }
    return outbound::positions(message.accountId, positions_.getByAccount(message.accountId), prices_);
}

json MessageDispatcher::handle(const std::string& connectionId, const std::string& userId, const GetPendingOrdersMessage& message) {
    if (auto error = bindAccount(connectionId, userId, message.accountId)) {
        return *error;
    }
    std::vector<PendingOrder> own;
    for (auto& order : pending_.pendingForAccount(message.accountId)) {
        if (order.userId == userId) {
            own.push_back(std::move(order));
        }
    }
    return outbound::pendingOrders(message.accountId, own);
}

std::optional<json> MessageDispatcher::rateLimited(const std::string& userId, const std::string& action, int64_t nowMs) {
    auto decision = rateLimiter_.check(userId, action, nowMs);
    if (decision.allowed) {
        return std::nullopt;
    }
    return json{{"type", "ERROR"},
                {"error", "Rate limit exceeded. Try again in " + std::to_string(decision.resetInMs) + "ms."},
                {"code", toString(RejectCode::RATE_LIMITED)}};
}

json MessageDispatcher::handle(const std::string& connectionId, const SubscribeMessage& message) {
    std::vector<std::string> accepted;
    for (const auto& symbol : message.symbols) {
        if (connections_.subscribe(connectionId, symbol)) {
            accepted.push_back(symbol);
        }
    }
    return outbound::subscribed(accepted);
}

json MessageDispatcher::handle(const std::string& connectionId, const UnsubscribeMessage& message) {
    std::vector<std::string> removed;
    for (const auto& symbol : message.symbols) {
        if (connections_.unsubscribe(connectionId, symbol)) {
            removed.push_back(symbol);
        }
    }
    return outbound::unsubscribed(removed);
}

} // namespace proptrade::interfaces
