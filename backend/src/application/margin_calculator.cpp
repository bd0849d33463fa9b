#include "margin_calculator.hpp"
#include <cmath>

namespace proptrade::application {

using proptrade::domain::Side;

MarginCalculator::MarginCalculator(const proptrade::domain::TradingParameters& params)
    : params_(params) {
}

bool MarginCalculator::isMajor(const std::string& symbol) {
    return symbol.find("BTC") != std::string::npos || symbol.find("ETH") != std::string::npos;
}

double MarginCalculator::maxLeverage(const std::string& symbol) const {
    return isMajor(symbol) ? params_.majorMaxLeverage : params_.altcoinMaxLeverage;
}

double MarginCalculator::effectiveLeverage(const std::string& symbol, std::optional<double> requested) const {
    double max = maxLeverage(symbol);
    if (requested && std::isfinite(*requested) && *requested >= 1.0 && *requested <= max) {
        return *requested;
    }
    return max;
}

proptrade::domain::MarginRequirement MarginCalculator::calculate(const std::string& symbol,
                                                                 Side side,
                                                                 double quantity,
                                                                 double price,
                                                                 std::optional<double> requestedLeverage) const {
    proptrade::domain::MarginRequirement result;
    result.leverage = effectiveLeverage(symbol, requestedLeverage);
    result.notional = quantity * price;
    result.marginRequired = result.notional / result.leverage;
    result.entryFee = fee(quantity, price);
    result.liquidationPrice = liquidationPrice(side, price, result.leverage);
    return result;
}

double MarginCalculator::liquidationPrice(Side side, double entryPrice, double leverage) const {
    if (side == Side::LONG) {
        return entryPrice * (1.0 - 1.0 / leverage + params_.maintenanceMarginPct);
    }
    return entryPrice * (1.0 + 1.0 / leverage - params_.maintenanceMarginPct);
}

double MarginCalculator::fee(double quantity, double price) const {
    return quantity * price * params_.feeRate;
}

bool MarginCalculator::shouldLiquidate(Side side, double currentPrice, double liquidationPrice) {
    return side == Side::LONG ? currentPrice <= liquidationPrice : currentPrice >= liquidationPrice;
}

double MarginCalculator::unrealizedPnl(Side side, double entryPrice, double currentPrice, double quantity) {
    double diff = side == Side::LONG ? currentPrice - entryPrice : entryPrice - currentPrice;
    return diff * quantity;
}

double MarginCalculator::pnlPercent(Side side, double entryPrice, double currentPrice) {
    if (entryPrice <= 0.0) {
        return 0.0;
    }
    double diff = side == Side::LONG ? currentPrice - entryPrice : entryPrice - currentPrice;
    return diff / entryPrice * 100.0;
}

double MarginCalculator::roe(Side side, double entryPrice, double currentPrice, double leverage) {
    return pnlPercent(side, entryPrice, currentPrice) * leverage;
}

} // namespace proptrade::application
