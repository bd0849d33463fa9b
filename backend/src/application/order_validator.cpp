#include "order_validator.hpp"
#include "../utils/format.hpp"
#include <cmath>

namespace proptrade::application {

using proptrade::domain::OrderRequest;
using proptrade::domain::OrderType;
using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;
using proptrade::domain::Side;
using proptrade::utils::formatNumber;

OrderValidator::OrderValidator(const MarginCalculator& calculator)
    : tradeableSymbols_(defaultTradeableSymbols()), calculator_(calculator) {
}

OrderValidator::OrderValidator(const MarginCalculator& calculator, std::set<std::string> tradeableSymbols)
    : tradeableSymbols_(std::move(tradeableSymbols)), calculator_(calculator) {
}

const std::set<std::string>& OrderValidator::defaultTradeableSymbols() {
    static const std::set<std::string> symbols = {
        "BTCUSDT", "ETHUSDT", "SOLUSDT", "BNBUSDT", "XRPUSDT",
        "DOGEUSDT", "ADAUSDT", "AVAXUSDT", "DOTUSDT", "LINKUSDT"
    };
    return symbols;
}

QuantityBand OrderValidator::quantityBand(const std::string& symbol) {
    if (symbol.find("BTC") != std::string::npos) {
        return {0.0001, 100.0};
    }
    if (symbol.find("ETH") != std::string::npos) {
        return {0.001, 1000.0};
    }
    return {0.01, 100000.0};
}

std::optional<Rejection> OrderValidator::validate(const OrderRequest& order) const {
    if (auto error = validateRequiredFields(order)) {
        return error;
    }
    if (auto error = validateEnums(order)) {
        return error;
    }
    if (auto error = validateQuantity(order)) {
        return error;
    }
    if (auto error = validateLeverage(order)) {
        return error;
    }
    if (auto error = validateLimitPrice(order)) {
        return error;
    }
    return validateProtectionValues(order);
}

std::optional<Rejection> OrderValidator::validateRequiredFields(const OrderRequest& order) const {
    if (order.accountId.empty()) {
        return Rejection(RejectCode::MISSING_ACCOUNT_ID, "Account ID is required");
    }
    if (order.symbol.empty()) {
        return Rejection(RejectCode::MISSING_SYMBOL, "Symbol is required");
    }
    if (!isTradeable(order.symbol)) {
        return Rejection(RejectCode::SYMBOL_NOT_TRADEABLE, "Symbol " + order.symbol + " is not available for trading");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateEnums(const OrderRequest& order) const {
    if (!order.side) {
        return Rejection(RejectCode::INVALID_SIDE, "Side must be LONG or SHORT");
    }
    if (!order.type) {
        return Rejection(RejectCode::INVALID_ORDER_TYPE, "Type must be MARKET or LIMIT");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateQuantity(const OrderRequest& order) const {
    if (!std::isfinite(order.quantity)) {
        return Rejection(RejectCode::INVALID_QUANTITY, "Quantity must be a finite number");
    }
    if (order.quantity <= 0.0) {
        return Rejection(RejectCode::INVALID_QUANTITY, "Quantity must be a positive number");
    }

    QuantityBand band = quantityBand(order.symbol);
    if (order.quantity < band.min) {
        return Rejection(RejectCode::QUANTITY_OUT_OF_RANGE,
                         "Minimum quantity for " + order.symbol + " is " + formatNumber(band.min));
    }
    if (order.quantity > band.max) {
        return Rejection(RejectCode::QUANTITY_OUT_OF_RANGE,
                         "Maximum quantity for " + order.symbol + " is " + formatNumber(band.max));
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateLeverage(const OrderRequest& order) const {
    if (!order.leverage) {
        return std::nullopt;
    }

    double leverage = *order.leverage;
    if (!std::isfinite(leverage)) {
        return Rejection(RejectCode::INVALID_LEVERAGE, "Leverage must be a finite number");
    }
    if (leverage < 1.0) {
        return Rejection(RejectCode::INVALID_LEVERAGE, "Leverage must be at least 1x");
    }

    double maxLeverage = calculator_.maxLeverage(order.symbol);
    if (leverage > maxLeverage) {
        return Rejection(RejectCode::LEVERAGE_TOO_HIGH,
                         "Maximum leverage for " + order.symbol + " is " + formatNumber(maxLeverage) + "x");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateLimitPrice(const OrderRequest& order) const {
    // !(x > 0) also catches NaN
    if (*order.type == OrderType::LIMIT && (!order.limitPrice || !(*order.limitPrice > 0.0))) {
        return Rejection(RejectCode::LIMIT_PRICE_REQUIRED, "Limit price is required for limit orders");
    }
    if (order.limitPrice && !std::isfinite(*order.limitPrice)) {
        return Rejection(RejectCode::INVALID_LIMIT_PRICE, "Limit price must be a finite number");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateProtectionValues(const OrderRequest& order) const {
    if (order.takeProfit) {
        if (!std::isfinite(*order.takeProfit)) {
            return Rejection(RejectCode::INVALID_TAKE_PROFIT, "Take profit must be a finite number");
        }
        if (*order.takeProfit <= 0.0) {
            return Rejection(RejectCode::INVALID_TAKE_PROFIT, "Take profit must be a positive number");
        }
    }
    if (order.stopLoss) {
        if (!std::isfinite(*order.stopLoss)) {
            return Rejection(RejectCode::INVALID_STOP_LOSS, "Stop loss must be a finite number");
        }
        if (*order.stopLoss <= 0.0) {
            return Rejection(RejectCode::INVALID_STOP_LOSS, "Stop loss must be a positive number");
        }
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateTakeProfit(Side side, double entryPrice, double takeProfit) {
    if (side == Side::LONG && takeProfit <= entryPrice) {
        return Rejection(RejectCode::TAKE_PROFIT_WRONG_SIDE, "Take profit must be above entry price for LONG positions");
    }
    if (side == Side::SHORT && takeProfit >= entryPrice) {
        return Rejection(RejectCode::TAKE_PROFIT_WRONG_SIDE, "Take profit must be below entry price for SHORT positions");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateStopLoss(Side side, double entryPrice, double stopLoss) {
    if (side == Side::LONG && stopLoss >= entryPrice) {
        return Rejection(RejectCode::STOP_LOSS_WRONG_SIDE, "Stop loss must be below entry price for LONG positions");
    }
    if (side == Side::SHORT && stopLoss <= entryPrice) {
        return Rejection(RejectCode::STOP_LOSS_WRONG_SIDE, "Stop loss must be above entry price for SHORT positions");
    }
    return std::nullopt;
}

std::optional<Rejection> OrderValidator::validateProtectionLevels(Side side,
                                                                  double entryPrice,
                                                                  std::optional<double> takeProfit,
                                                                  std::optional<double> stopLoss) {
    if (takeProfit) {
        if (auto error = validateTakeProfit(side, entryPrice, *takeProfit)) {
            return error;
        }
    }
    if (stopLoss) {
        return validateStopLoss(side, entryPrice, *stopLoss);
    }
    return std::nullopt;
}

} // namespace proptrade::application
