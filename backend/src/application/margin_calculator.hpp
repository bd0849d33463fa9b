#pragma once

#include "../domain/types.hpp"
#include <string>

namespace proptrade::application {

// Pure margin, fee and liquidation arithmetic. Safe to call from any thread.
class MarginCalculator {
private:
    proptrade::domain::TradingParameters params_;

public:
    explicit MarginCalculator(const proptrade::domain::TradingParameters& params = {});

    static bool isMajor(const std::string& symbol);
    double maxLeverage(const std::string& symbol) const;

    // Requested leverage when it lies in [1, max], otherwise the symbol's maximum
    double effectiveLeverage(const std::string& symbol, std::optional<double> requested) const;

    proptrade::domain::MarginRequirement calculate(const std::string& symbol,
                                                   proptrade::domain::Side side,
                                                   double quantity,
                                                   double price,
                                                   std::optional<double> requestedLeverage) const;

    double liquidationPrice(proptrade::domain::Side side, double entryPrice, double leverage) const;
    double fee(double quantity, double price) const;

    static bool shouldLiquidate(proptrade::domain::Side side, double currentPrice, double liquidationPrice);
    static double unrealizedPnl(proptrade::domain::Side side, double entryPrice, double currentPrice, double quantity);
    static double pnlPercent(proptrade::domain::Side side, double entryPrice, double currentPrice);
    static double roe(proptrade::domain::Side side, double entryPrice, double currentPrice, double leverage);

    const proptrade::domain::TradingParameters& parameters() const { return params_; }
};

} // namespace proptrade::application
