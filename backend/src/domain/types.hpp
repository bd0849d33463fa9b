#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <variant>

namespace proptrade::domain {

// Enums
enum class Side {
    LONG,
    SHORT
};

enum class OrderType {
    MARKET,
    LIMIT
};

enum class PendingOrderStatus {
    PENDING,
    FILLED,
    CANCELLED,
    EXPIRED
};

enum class AccountStatus {
    ACTIVE,
    STEP1_PASSED,
    PASSED,
    BREACHED,
    SUSPENDED
};

enum class CloseReason {
    MANUAL,
    TP_TRIGGERED,
    SL_TRIGGERED,
    LIQUIDATION_TRIGGERED,
    BREACH
};

enum class RejectCode {
    MISSING_ACCOUNT_ID,
    MISSING_SYMBOL,
    SYMBOL_NOT_TRADEABLE,
    INVALID_SIDE,
    INVALID_ORDER_TYPE,
    INVALID_QUANTITY,
    QUANTITY_OUT_OF_RANGE,
    INVALID_LEVERAGE,
    LEVERAGE_TOO_HIGH,
    LIMIT_PRICE_REQUIRED,
    INVALID_LIMIT_PRICE,
    INVALID_TAKE_PROFIT,
    INVALID_STOP_LOSS,
    TAKE_PROFIT_WRONG_SIDE,
    STOP_LOSS_WRONG_SIDE,
    RATE_LIMITED,
    TIMESTAMP_INVALID,
    PRICE_UNAVAILABLE,
    PRICE_STALE,
    LOCK_TIMEOUT,
    ACCOUNT_NOT_FOUND,
    ACCOUNT_NOT_ACTIVE,
    NOT_OWNER,
    INSUFFICIENT_MARGIN,
    POSITION_NOT_FOUND,
    ORDER_NOT_FOUND,
    ORDER_NOT_CANCELLABLE,
    INVALID_CLOSE_QUANTITY,
    INTERNAL_ERROR
};

enum class TradeEventType {
    ORDER_PLACED,
    ORDER_FILLED,
    ORDER_PENDING,
    ORDER_CANCELLED,
    ORDER_EXPIRED,
    POSITION_OPENED,
    TP_MODIFIED,
    SL_MODIFIED,
    POSITION_CLOSED,
    POSITION_PARTIALLY_CLOSED,
    TP_TRIGGERED,
    SL_TRIGGERED,
    LIQUIDATION_TRIGGERED,
    ACCOUNT_BREACHED,
    FUNDING_APPLIED,
    DAILY_RESET
};

std::string toString(Side side);
std::string toString(OrderType type);
std::string toString(PendingOrderStatus status);
std::string toString(AccountStatus status);
std::string toString(CloseReason reason);
std::string toString(RejectCode code);
std::string toString(TradeEventType type);

std::optional<Side> parseSide(const std::string& value);
std::optional<OrderType> parseOrderType(const std::string& value);
std::optional<AccountStatus> parseAccountStatus(const std::string& value);

// Rate limits, stale or missing prices and lock contention can be retried as-is
bool isRetryable(RejectCode code);

inline int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Engine-wide trading parameters
struct TradingParameters {
    double maintenanceMarginPct = 0.005;
    double feeRate = 0.0005;
    int64_t priceStaleMs = 5000;
    double majorMaxLeverage = 100.0;
    double altcoinMaxLeverage = 50.0;
    int32_t lockTimeoutMs = 50;
};

// Value Objects
struct PriceSnapshot {
    std::string symbol;
    double bid = 0.0;
    double ask = 0.0;
    double mid = 0.0;
    double spread = 0.0;
    int64_t timestamp = 0;

    PriceSnapshot() = default;
    PriceSnapshot(std::string sym, double b, double a, int64_t ts)
        : symbol(std::move(sym)), bid(b), ask(a), mid((b + a) / 2.0), spread(a - b), timestamp(ts) {}

    bool isStale(int64_t nowMs, int64_t maxAgeMs) const { return nowMs - timestamp > maxAgeMs; }

    // LONG buys at ask, SHORT sells at bid
    double entryPriceFor(Side side) const { return side == Side::LONG ? ask : bid; }
    double exitPriceFor(Side side) const { return side == Side::LONG ? bid : ask; }
};

struct OrderBookLevel {
    double price = 0.0;
    double quantity = 0.0;

    OrderBookLevel() = default;
    OrderBookLevel(double p, double q) : price(p), quantity(q) {}
};

struct OrderBookSnapshot {
    std::string symbol;
    std::vector<OrderBookLevel> bids;
    std::vector<OrderBookLevel> asks;
    int64_t timestamp = 0;
};

struct Rejection {
    RejectCode code = RejectCode::INTERNAL_ERROR;
    std::string reason;

    Rejection() = default;
    Rejection(RejectCode c, std::string r) : code(c), reason(std::move(r)) {}
};

// Ephemeral order intent. side/type stay empty when the client sent an unknown value.
struct OrderRequest {
    std::string clientOrderId;
    std::string userId;
    std::string accountId;
    std::string symbol;
    std::optional<Side> side;
    std::optional<OrderType> type;
    double quantity = 0.0;
    std::optional<double> leverage;
    std::optional<double> limitPrice;
    std::optional<double> takeProfit;
    std::optional<double> stopLoss;
    std::optional<int64_t> timestamp;
    std::optional<int64_t> expiresAt;
};

struct MarginRequirement {
    double leverage = 0.0;
    double notional = 0.0;
    double marginRequired = 0.0;
    double entryFee = 0.0;
    double liquidationPrice = 0.0;

    double totalRequired() const { return marginRequired + entryFee; }
};

// Entities
struct AccountState {
    std::string accountId;
    std::string userId;
    AccountStatus status = AccountStatus::ACTIVE;
    double startingBalance = 0.0;
    double currentBalance = 0.0;
    double availableMargin = 0.0;
    double totalMarginUsed = 0.0;
    double dailyPnl = 0.0;
    double dailyStartingBalance = 0.0;
    double dailyLossLimit = 0.0;
    double maxDrawdownLimit = 0.0;
    double peakBalance = 0.0;
    double currentProfit = 0.0;
    int64_t totalTrades = 0;
    int64_t winningTrades = 0;
    int64_t losingTrades = 0;
    double totalVolume = 0.0;
    std::string breachType;

    AccountState() = default;
    AccountState(std::string id, std::string owner, double balance, double dailyLoss, double maxDrawdown)
        : accountId(std::move(id)), userId(std::move(owner)), startingBalance(balance),
          currentBalance(balance), availableMargin(balance), dailyStartingBalance(balance),
          dailyLossLimit(dailyLoss), maxDrawdownLimit(maxDrawdown), peakBalance(balance) {}

    bool canTrade() const { return status == AccountStatus::ACTIVE || status == AccountStatus::STEP1_PASSED; }
};

struct Position {
    std::string id;
    std::string accountId;
    std::string userId;
    std::string symbol;
    Side side = Side::LONG;
    double quantity = 0.0;
    double entryPrice = 0.0;
    double leverage = 1.0;
    double marginUsed = 0.0;
    double entryFee = 0.0;
    std::optional<double> takeProfit;
    std::optional<double> stopLoss;
    double liquidationPrice = 0.0;
    double accumulatedFunding = 0.0;
    int64_t openedAt = 0;

    double entryValue() const { return quantity * entryPrice; }
};

struct PendingOrder {
    std::string id;
    std::string clientOrderId;
    std::string userId;
    std::string accountId;
    std::string symbol;
    Side side = Side::LONG;
    double quantity = 0.0;
    double limitPrice = 0.0;
    double leverage = 1.0;
    std::optional<double> takeProfit;
    std::optional<double> stopLoss;
    double marginReserved = 0.0;
    PendingOrderStatus status = PendingOrderStatus::PENDING;
    int64_t createdAt = 0;
    std::optional<int64_t> expiresAt;
};

struct TradeEvent {
    std::string id;
    TradeEventType type = TradeEventType::ORDER_PLACED;
    std::string accountId;
    std::string userId;
    std::string positionId;
    std::string orderId;
    std::string symbol;
    std::optional<Side> side;
    double quantity = 0.0;
    double price = 0.0;
    double margin = 0.0;
    double fee = 0.0;
    double pnl = 0.0;
    std::string reason;
    int64_t timestamp = 0;
};

// Operation results
struct FillResult {
    std::string orderId;
    std::string clientOrderId;
    Position position;
    AccountState account;
    double executionPrice = 0.0;
    double marginRequired = 0.0;
    double entryFee = 0.0;
    bool filledFromQueue = false;
};

struct PendingResult {
    PendingOrder order;
    double currentPrice = 0.0;
};

struct CloseResult {
    std::string positionId;
    std::string tradeId;
    std::string accountId;
    std::string userId;
    std::string symbol;
    Side side = Side::LONG;
    CloseReason reason = CloseReason::MANUAL;
    double exitPrice = 0.0;
    double quantityClosed = 0.0;
    double remainingQuantity = 0.0;
    double grossPnl = 0.0;
    double exitFee = 0.0;
    double fundingFee = 0.0;
    double netPnl = 0.0;
    double realizedPnl = 0.0;
    double marginReleased = 0.0;
    bool partial = false;
    AccountState account;
};

struct ModifyResult {
    Position position;
    bool takeProfitChanged = false;
    bool stopLossChanged = false;
};

struct CancelResult {
    PendingOrder order;
    double marginReleased = 0.0;
};

using ExecutionResult = std::variant<FillResult, Rejection>;
using PlaceOrderResult = std::variant<FillResult, PendingResult, Rejection>;
using CloseOutcome = std::variant<CloseResult, Rejection>;
using ModifyOutcome = std::variant<ModifyResult, Rejection>;
using CancelOutcome = std::variant<CancelResult, Rejection>;

} // namespace proptrade::domain
