#include "types.hpp"

namespace proptrade::domain {

std::string toString(Side side) {
    return side == Side::LONG ? "LONG" : "SHORT";
}

std::string toString(OrderType type) {
    return type == OrderType::MARKET ? "MARKET" : "LIMIT";
}

std::string toString(PendingOrderStatus status) {
    switch (status) {
        case PendingOrderStatus::PENDING: return "PENDING";
        case PendingOrderStatus::FILLED: return "FILLED";
        case PendingOrderStatus::CANCELLED: return "CANCELLED";
        case PendingOrderStatus::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

std::string toString(AccountStatus status) {
    switch (status) {
        case AccountStatus::ACTIVE: return "active";
        case AccountStatus::STEP1_PASSED: return "step1_passed";
        case AccountStatus::PASSED: return "passed";
        case AccountStatus::BREACHED: return "breached";
        case AccountStatus::SUSPENDED: return "suspended";
    }
    return "unknown";
}

std::string toString(CloseReason reason) {
    switch (reason) {
        case CloseReason::MANUAL: return "MANUAL";
        case CloseReason::TP_TRIGGERED: return "TP_TRIGGERED";
        case CloseReason::SL_TRIGGERED: return "SL_TRIGGERED";
        case CloseReason::LIQUIDATION_TRIGGERED: return "LIQUIDATION_TRIGGERED";
        case CloseReason::BREACH: return "BREACH";
    }
    return "UNKNOWN";
}

std::string toString(RejectCode code) {
    switch (code) {
        case RejectCode::MISSING_ACCOUNT_ID: return "MISSING_ACCOUNT_ID";
        case RejectCode::MISSING_SYMBOL: return "MISSING_SYMBOL";
        case RejectCode::SYMBOL_NOT_TRADEABLE: return "SYMBOL_NOT_TRADEABLE";
        case RejectCode::INVALID_SIDE: return "INVALID_SIDE";
        case RejectCode::INVALID_ORDER_TYPE: return "INVALID_ORDER_TYPE";
        case RejectCode::INVALID_QUANTITY: return "INVALID_QUANTITY";
        case RejectCode::QUANTITY_OUT_OF_RANGE: return "QUANTITY_OUT_OF_RANGE";
        case RejectCode::INVALID_LEVERAGE: return "INVALID_LEVERAGE";
        case RejectCode::LEVERAGE_TOO_HIGH: return "LEVERAGE_TOO_HIGH";
        case RejectCode::LIMIT_PRICE_REQUIRED: return "LIMIT_PRICE_REQUIRED";
        case RejectCode::INVALID_LIMIT_PRICE: return "INVALID_LIMIT_PRICE";
        case RejectCode::INVALID_TAKE_PROFIT: return "INVALID_TAKE_PROFIT";
        case RejectCode::INVALID_STOP_LOSS: return "INVALID_STOP_LOSS";
        case RejectCode::TAKE_PROFIT_WRONG_SIDE: return "TAKE_PROFIT_WRONG_SIDE";
        case RejectCode::STOP_LOSS_WRONG_SIDE: return "STOP_LOSS_WRONG_SIDE";
        case RejectCode::RATE_LIMITED: return "RATE_LIMITED";
        case RejectCode::TIMESTAMP_INVALID: return "TIMESTAMP_INVALID";
        case RejectCode::PRICE_UNAVAILABLE: return "PRICE_UNAVAILABLE";
        case RejectCode::PRICE_STALE: return "PRICE_STALE";
        case RejectCode::LOCK_TIMEOUT: return "LOCK_TIMEOUT";
        case RejectCode::ACCOUNT_NOT_FOUND: return "ACCOUNT_NOT_FOUND";
        case RejectCode::ACCOUNT_NOT_ACTIVE: return "ACCOUNT_NOT_ACTIVE";
        case RejectCode::NOT_OWNER: return "NOT_OWNER";
        case RejectCode::INSUFFICIENT_MARGIN: return "INSUFFICIENT_MARGIN";
        case RejectCode::POSITION_NOT_FOUND: return "POSITION_NOT_FOUND";
        case RejectCode::ORDER_NOT_FOUND: return "ORDER_NOT_FOUND";
        case RejectCode::ORDER_NOT_CANCELLABLE: return "ORDER_NOT_CANCELLABLE";
        case RejectCode::INVALID_CLOSE_QUANTITY: return "INVALID_CLOSE_QUANTITY";
        case RejectCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

std::string toString(TradeEventType type) {
    switch (type) {
        case TradeEventType::ORDER_PLACED: return "ORDER_PLACED";
        case TradeEventType::ORDER_FILLED: return "ORDER_FILLED";
        case TradeEventType::ORDER_PENDING: return "ORDER_PENDING";
        case TradeEventType::ORDER_CANCELLED: return "ORDER_CANCELLED";
        case TradeEventType::ORDER_EXPIRED: return "ORDER_EXPIRED";
        case TradeEventType::POSITION_OPENED: return "POSITION_OPENED";
        case TradeEventType::TP_MODIFIED: return "TP_MODIFIED";
        case TradeEventType::SL_MODIFIED: return "SL_MODIFIED";
        case TradeEventType::POSITION_CLOSED: return "POSITION_CLOSED";
        case TradeEventType::POSITION_PARTIALLY_CLOSED: return "POSITION_PARTIALLY_CLOSED";
        case TradeEventType::TP_TRIGGERED: return "TP_TRIGGERED";
        case TradeEventType::SL_TRIGGERED: return "SL_TRIGGERED";
        case TradeEventType::LIQUIDATION_TRIGGERED: return "LIQUIDATION_TRIGGERED";
        case TradeEventType::ACCOUNT_BREACHED: return "ACCOUNT_BREACHED";
        case TradeEventType::FUNDING_APPLIED: return "FUNDING_APPLIED";
        case TradeEventType::DAILY_RESET: return "DAILY_RESET";
    }
    return "UNKNOWN";
}

std::optional<Side> parseSide(const std::string& value) {
    if (value == "LONG") return Side::LONG;
    if (value == "SHORT") return Side::SHORT;
    return std::nullopt;
}

std::optional<OrderType> parseOrderType(const std::string& value) {
    if (value == "MARKET") return OrderType::MARKET;
    if (value == "LIMIT") return OrderType::LIMIT;
    return std::nullopt;
}

std::optional<AccountStatus> parseAccountStatus(const std::string& value) {
    if (value == "active") return AccountStatus::ACTIVE;
    if (value == "step1_passed") return AccountStatus::STEP1_PASSED;
    if (value == "passed") return AccountStatus::PASSED;
    if (value == "breached") return AccountStatus::BREACHED;
    if (value == "suspended") return AccountStatus::SUSPENDED;
    return std::nullopt;
}

bool isRetryable(RejectCode code) {
    switch (code) {
        case RejectCode::RATE_LIMITED:
        case RejectCode::PRICE_UNAVAILABLE:
        case RejectCode::PRICE_STALE:
        case RejectCode::LOCK_TIMEOUT:
            return true;
        default:
            return false;
    }
}

} // namespace proptrade::domain
