#include "messages.hpp"
#include "../application/margin_calculator.hpp"
#include <cmath>
#include <limits>

namespace proptrade::interfaces {

using nlohmann::json;
using namespace proptrade::domain;

namespace {

const json& emptyObject() {
    static const json empty = json::object();
    return empty;
}

std::string readString(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// Absent -> nothing, present but not a number -> NaN so validation rejects it
std::optional<double> readNumber(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return it->get<double>();
}

// Values that do not fit an int64_t read as absent
std::optional<int64_t> readInteger(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_number()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }

    // [-2^63, 2^63) is the range a double converts without overflow
    double value = it->get<double>();
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(value) || value < -kLimit || value >= kLimit) {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

// For MODIFY_POSITION an explicit null removes the level
std::optional<double> readProtectionLevel(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (it->is_null()) {
        return 0.0;
    }
    return readNumber(payload, key);
}

std::optional<std::vector<std::string>> readSymbols(const json& payload) {
    auto it = payload.find("symbols");
    if (it == payload.end() || !it->is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> symbols;
    for (const auto& entry : *it) {
        if (entry.is_string() && !entry.get<std::string>().empty()) {
            symbols.push_back(entry.get<std::string>());
        }
    }
    return symbols;
}

OrderRequest decodeOrder(const json& payload) {
    const json& data = payload.contains("data") && payload["data"].is_object() ? payload["data"] : payload;

    OrderRequest order;
    order.clientOrderId = readString(data, "clientOrderId");
    order.accountId = readString(data, "accountId");
    order.symbol = readString(data, "symbol");
    order.side = parseSide(readString(data, "side"));
    order.type = parseOrderType(readString(data, "type"));
    order.quantity = readNumber(data, "quantity").value_or(std::numeric_limits<double>::quiet_NaN());
    order.leverage = readNumber(data, "leverage");
    order.limitPrice = readNumber(data, "limitPrice");
    order.takeProfit = readNumber(data, "takeProfit");
    order.stopLoss = readNumber(data, "stopLoss");
    order.timestamp = readInteger(data, "timestamp");
    order.expiresAt = readInteger(data, "expiresAt");
    return order;
}

json optionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

const std::vector<std::string>& inboundMessageTypes() {
    static const std::vector<std::string> types = {
        "AUTH", "PLACE_ORDER", "CANCEL_ORDER", "MODIFY_POSITION", "CLOSE_POSITION",
        "GET_POSITIONS", "GET_PENDING_ORDERS", "SUBSCRIBE", "UNSUBSCRIBE", "PING", "PONG"
    };
    return types;
}

DecodeResult decodeMessage(const std::string& type, const json& rawPayload) {
    const json& payload = rawPayload.is_object() ? rawPayload : emptyObject();

    if (type == "AUTH") {
        return InboundMessage{AuthMessage{readString(payload, "token")}};
    }
    if (type == "PLACE_ORDER") {
        return InboundMessage{PlaceOrderMessage{decodeOrder(payload)}};
    }
    if (type == "CANCEL_ORDER") {
        return InboundMessage{CancelOrderMessage{readString(payload, "orderId")}};
    }
    if (type == "MODIFY_POSITION") {
        ModifyPositionMessage message;
        message.positionId = readString(payload, "positionId");
        message.takeProfit = readProtectionLevel(payload, "takeProfit");
        message.stopLoss = readProtectionLevel(payload, "stopLoss");
        return InboundMessage{message};
    }
    if (type == "CLOSE_POSITION") {
        ClosePositionMessage message;
        message.positionId = readString(payload, "positionId");
        message.accountId = readString(payload, "accountId");
        message.quantity = readNumber(payload, "quantity");
        return InboundMessage{message};
    }
    if (type == "GET_POSITIONS") {
        return InboundMessage{GetPositionsMessage{readString(payload, "accountId")}};
    }
    if (type == "GET_PENDING_ORDERS") {
        return InboundMessage{GetPendingOrdersMessage{readString(payload, "accountId")}};
    }
    if (type == "SUBSCRIBE" || type == "UNSUBSCRIBE") {
        auto symbols = readSymbols(payload);
        if (!symbols) {
            return DecodeError{"Invalid symbols format"};
        }
        if (type == "SUBSCRIBE") {
            return InboundMessage{SubscribeMessage{std::move(*symbols)}};
        }
        return InboundMessage{UnsubscribeMessage{std::move(*symbols)}};
    }
    if (type == "PING") {
        return InboundMessage{PingMessage{}};
    }
    if (type == "PONG") {
        return InboundMessage{PongMessage{}};
    }
    return DecodeError{"Unknown message type"};
}

namespace outbound {

json accountSummary(const AccountState& account) {
    return {
        {"id", account.accountId},
        {"status", toString(account.status)},
        {"currentBalance", account.currentBalance},
        {"availableMargin", account.availableMargin},
        {"totalMarginUsed", account.totalMarginUsed},
        {"dailyPnl", account.dailyPnl}
    };
}

json position(const Position& position) {
    return {
        {"id", position.id},
        {"accountId", position.accountId},
        {"symbol", position.symbol},
        {"side", toString(position.side)},
        {"quantity", position.quantity},
        {"entryPrice", position.entryPrice},
        {"leverage", position.leverage},
        {"marginUsed", position.marginUsed},
        {"entryFee", position.entryFee},
        {"takeProfit", optionalNumber(position.takeProfit)},
        {"stopLoss", optionalNumber(position.stopLoss)},
        {"liquidationPrice", position.liquidationPrice},
        {"accumulatedFunding", position.accumulatedFunding},
        {"openedAt", position.openedAt}
    };
}

json pendingOrder(const PendingOrder& order) {
    json result = {
        {"id", order.id},
        {"clientOrderId", order.clientOrderId},
        {"accountId", order.accountId},
        {"symbol", order.symbol},
        {"side", toString(order.side)},
        {"quantity", order.quantity},
        {"limitPrice", order.limitPrice},
        {"leverage", order.leverage},
        {"takeProfit", optionalNumber(order.takeProfit)},
        {"stopLoss", optionalNumber(order.stopLoss)},
        {"marginReserved", order.marginReserved},
        {"status", toString(order.status)},
        {"createdAt", order.createdAt}
    };
    if (order.expiresAt) {
        result["expiresAt"] = *order.expiresAt;
    }
    return result;
}

json orderFilled(const FillResult& fill, bool duplicate) {
    json result = {
        {"type", "ORDER_FILLED"},
        {"clientOrderId", fill.clientOrderId},
        {"orderId", fill.orderId},
        {"position", position(fill.position)},
        {"executionPrice", fill.executionPrice},
        {"marginUsed", fill.marginRequired},
        {"entryFee", fill.entryFee},
        {"filledFromQueue", fill.filledFromQueue},
        {"account", accountSummary(fill.account)}
    };
    if (duplicate) {
        result["duplicate"] = true;
    }
    return result;
}

json orderPending(const PendingResult& pending, bool duplicate) {
    json result = {
        {"type", "ORDER_PENDING"},
        {"clientOrderId", pending.order.clientOrderId},
        {"orderId", pending.order.id},
        {"symbol", pending.order.symbol},
        {"side", toString(pending.order.side)},
        {"quantity", pending.order.quantity},
        {"limitPrice", pending.order.limitPrice},
        {"marginReserved", pending.order.marginReserved},
        {"currentPrice", pending.currentPrice}
    };
    if (duplicate) {
        result["duplicate"] = true;
    }
    return result;
}

json orderRejected(const Rejection& rejection, const std::string& clientOrderId, const std::string& orderId) {
    json result = {
        {"type", "ORDER_REJECTED"},
        {"clientOrderId", clientOrderId},
        {"reason", rejection.reason},
        {"code", toString(rejection.code)},
        {"retryable", isRetryable(rejection.code)}
    };
    if (!orderId.empty()) {
        result["orderId"] = orderId;
    }
    return result;
}

json orderCancelled(const CancelResult& cancel, const std::string& reason) {
    json result = {
        {"type", "ORDER_CANCELLED"},
        {"orderId", cancel.order.id},
        {"clientOrderId", cancel.order.clientOrderId},
        {"symbol", cancel.order.symbol},
        {"marginReleased", cancel.marginReleased}
    };
    if (!reason.empty()) {
        result["reason"] = reason;
    }
    return result;
}

json orderExpired(const PendingOrder& order) {
    return {
        {"type", "ORDER_CANCELLED"},
        {"orderId", order.id},
        {"clientOrderId", order.clientOrderId},
        {"symbol", order.symbol},
        {"marginReleased", order.marginReserved},
        {"reason", "EXPIRED"}
    };
}

json cancelRejected(const std::string& orderId, const Rejection& rejection) {
    return {
        {"type", "CANCEL_REJECTED"},
        {"orderId", orderId},
        {"reason", rejection.reason},
        {"code", toString(rejection.code)}
    };
}

json positionModified(const ModifyResult& modify) {
    return {
        {"type", "POSITION_MODIFIED"},
        {"positionId", modify.position.id},
        {"takeProfit", optionalNumber(modify.position.takeProfit)},
        {"stopLoss", optionalNumber(modify.position.stopLoss)},
        {"position", position(modify.position)}
    };
}

json modifyRejected(const std::string& positionId, const Rejection& rejection) {
    return {
        {"type", "MODIFY_REJECTED"},
        {"positionId", positionId},
        {"reason", rejection.reason},
        {"code", toString(rejection.code)}
    };
}

json positionClosed(const CloseResult& close) {
    return {
        {"type", "POSITION_CLOSED"},
        {"positionId", close.positionId},
        {"tradeId", close.tradeId},
        {"symbol", close.symbol},
        {"exitPrice", close.exitPrice},
        {"grossPnl", close.grossPnl},
        {"netPnl", close.netPnl},
        {"realizedPnl", close.realizedPnl},
        {"quantityClosed", close.quantityClosed},
        {"remainingQuantity", close.remainingQuantity},
        {"closeReason", toString(close.reason)},
        {"account", accountSummary(close.account)}
    };
}

json closeRejected(const std::string& positionId, const Rejection& rejection) {
    return {
        {"type", "CLOSE_REJECTED"},
        {"positionId", positionId},
        {"reason", rejection.reason},
        {"code", toString(rejection.code)}
    };
}

json positions(const std::string& accountId, const std::vector<Position>& list, const IPriceSnapshotProvider& prices) {
    json entries = json::array();
    for (const auto& entry : list) {
        json item = position(entry);
        auto price = prices.getPrice(entry.symbol);
        if (price) {
            item["currentPrice"] = price->mid;
            item["unrealizedPnl"] = proptrade::application::MarginCalculator::unrealizedPnl(
                entry.side, entry.entryPrice, price->mid, entry.quantity);
            item["roe"] = proptrade::application::MarginCalculator::roe(
                entry.side, entry.entryPrice, price->mid, entry.leverage);
        }
        entries.push_back(std::move(item));
    }
    return {{"type", "POSITIONS"}, {"accountId", accountId}, {"positions", entries}};
}

json pendingOrders(const std::string& accountId, const std::vector<PendingOrder>& orders) {
    json entries = json::array();
    for (const auto& order : orders) {
        entries.push_back(pendingOrder(order));
    }
    return {{"type", "PENDING_ORDERS"}, {"accountId", accountId}, {"orders", entries}};
}

json priceUpdate(const PriceSnapshot& price) {
    return {
        {"type", "PRICE_UPDATE"},
        {"symbol", price.symbol},
        {"bid", price.bid},
        {"ask", price.ask},
        {"spread", price.spread},
        {"midPrice", price.mid},
        {"timestamp", price.timestamp}
    };
}

json orderBookUpdate(const OrderBookSnapshot& book) {
    auto levels = [](const std::vector<OrderBookLevel>& side) {
        json result = json::array();
        for (const auto& level : side) {
            result.push_back({level.price, level.quantity});
        }
        return result;
    };
    return {
        {"type", "ORDER_BOOK_UPDATE"},
        {"symbol", book.symbol},
        {"bids", levels(book.bids)},
        {"asks", levels(book.asks)},
        {"timestamp", book.timestamp}
    };
}

json accountBreached(const proptrade::application::BreachReport& report) {
    return {
        {"type", "ACCOUNT_BREACHED"},
        {"accountId", report.accountId},
        {"breachType", report.breachType},
        {"positionsClosed", report.positionsClosed},
        {"ordersCancelled", report.ordersCancelled},
        {"totalPnl", report.totalPnl},
        {"message", report.message}
    };
}

json riskWarning(const proptrade::application::RiskWarning& warning) {
    return {
        {"type", "RISK_WARNING"},
        {"accountId", warning.accountId},
        {"warningType", warning.warningType},
        {"message", warning.message}
    };
}

json liquidationWarning(const proptrade::application::LiquidationWarning& warning) {
    return {
        {"type", "LIQUIDATION_WARNING"},
        {"positionId", warning.position.id},
        {"accountId", warning.position.accountId},
        {"symbol", warning.position.symbol},
        {"currentPrice", warning.currentPrice},
        {"liquidationPrice", warning.position.liquidationPrice},
        {"distance", warning.distance}
    };
}

json authenticated(const std::string& userId) {
    return {{"type", "AUTHENTICATED"}, {"userId", userId}, {"message", "Successfully authenticated"}};
}

json authError(const std::string& error) {
    return {{"type", "AUTH_ERROR"}, {"error", error}};
}

json error(const std::string& message) {
    return {{"type", "ERROR"}, {"error", message}};
}

json subscribed(const std::vector<std::string>& symbols) {
    return {{"type", "SUBSCRIBED"}, {"symbols", symbols}};
}

json unsubscribed(const std::vector<std::string>& symbols) {
    return {{"type", "UNSUBSCRIBED"}, {"symbols", symbols}};
}

json ping(int64_t timestamp) {
    return {{"type", "PING"}, {"timestamp", timestamp}};
}

json pong(int64_t timestamp) {
    return {{"type", "PONG"}, {"timestamp", timestamp}};
}

} // namespace outbound

} // namespace proptrade::interfaces
