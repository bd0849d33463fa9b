#pragma once

#include "../application/risk_monitor.hpp"
#include "../application/trigger_engine.hpp"
#include "../domain/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace proptrade::interfaces {

// Inbound messages
struct AuthMessage {
    std::string token;
};

// userId is filled in from the session, never from the payload
struct PlaceOrderMessage {
    proptrade::domain::OrderRequest order;
};

struct CancelOrderMessage {
    std::string orderId;
};

// A field that is absent stays unchanged; 0 removes the level
struct ModifyPositionMessage {
    std::string positionId;
    std::optional<double> takeProfit;
    std::optional<double> stopLoss;
};

struct ClosePositionMessage {
    std::string positionId;
    std::string accountId;
    std::optional<double> quantity;
};

struct GetPositionsMessage {
    std::string accountId;
};

struct GetPendingOrdersMessage {
    std::string accountId;
};

struct SubscribeMessage {
    std::vector<std::string> symbols;
};

struct UnsubscribeMessage {
    std::vector<std::string> symbols;
};

struct PingMessage {};
struct PongMessage {};

using InboundMessage = std::variant<AuthMessage,
                                    PlaceOrderMessage,
                                    CancelOrderMessage,
                                    ModifyPositionMessage,
                                    ClosePositionMessage,
                                    GetPositionsMessage,
                                    GetPendingOrdersMessage,
                                    SubscribeMessage,
                                    UnsubscribeMessage,
                                    PingMessage,
                                    PongMessage>;

struct DecodeError {
    std::string message;
};

using DecodeResult = std::variant<InboundMessage, DecodeError>;

// Message types accepted from clients, in registration order
const std::vector<std::string>& inboundMessageTypes();

// Maps a message type and its decoded payload to a typed message
DecodeResult decodeMessage(const std::string& type, const nlohmann::json& payload);

// Outbound messages. Every object carries "type".
namespace outbound {

nlohmann::json accountSummary(const proptrade::domain::AccountState& account);
nlohmann::json position(const proptrade::domain::Position& position);
nlohmann::json pendingOrder(const proptrade::domain::PendingOrder& order);

nlohmann::json orderFilled(const proptrade::domain::FillResult& fill, bool duplicate = false);
nlohmann::json orderPending(const proptrade::domain::PendingResult& pending, bool duplicate = false);
nlohmann::json orderRejected(const proptrade::domain::Rejection& rejection,
                             const std::string& clientOrderId,
                             const std::string& orderId = "");
nlohmann::json orderCancelled(const proptrade::domain::CancelResult& cancel, const std::string& reason = "");
nlohmann::json orderExpired(const proptrade::domain::PendingOrder& order);
nlohmann::json cancelRejected(const std::string& orderId, const proptrade::domain::Rejection& rejection);

nlohmann::json positionModified(const proptrade::domain::ModifyResult& modify);
nlohmann::json modifyRejected(const std::string& positionId, const proptrade::domain::Rejection& rejection);
nlohmann::json positionClosed(const proptrade::domain::CloseResult& close);
nlohmann::json closeRejected(const std::string& positionId, const proptrade::domain::Rejection& rejection);

nlohmann::json positions(const std::string& accountId,
                         const std::vector<proptrade::domain::Position>& positions,
                         const proptrade::domain::IPriceSnapshotProvider& prices);
nlohmann::json pendingOrders(const std::string& accountId, const std::vector<proptrade::domain::PendingOrder>& orders);

nlohmann::json priceUpdate(const proptrade::domain::PriceSnapshot& price);
nlohmann::json orderBookUpdate(const proptrade::domain::OrderBookSnapshot& book);

nlohmann::json accountBreached(const proptrade::application::BreachReport& report);
nlohmann::json riskWarning(const proptrade::application::RiskWarning& warning);
nlohmann::json liquidationWarning(const proptrade::application::LiquidationWarning& warning);

nlohmann::json authenticated(const std::string& userId);
nlohmann::json authError(const std::string& error);
nlohmann::json error(const std::string& message);
nlohmann::json subscribed(const std::vector<std::string>& symbols);
nlohmann::json unsubscribed(const std::vector<std::string>& symbols);
nlohmann::json ping(int64_t timestamp);
nlohmann::json pong(int64_t timestamp);

} // namespace outbound

} // namespace proptrade::interfaces
