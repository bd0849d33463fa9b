#pragma once

#include "../domain/types.hpp"
#include "margin_calculator.hpp"
#include <optional>
#include <set>
#include <string>

namespace proptrade::application {

struct QuantityBand {
    double min;
    double max;
};

// Stateless structural and business-rule checks on inbound orders.
// The first violated rule wins.
class OrderValidator {
private:
    std::set<std::string> tradeableSymbols_;
    const MarginCalculator& calculator_;

public:
    explicit OrderValidator(const MarginCalculator& calculator);
    OrderValidator(const MarginCalculator& calculator, std::set<std::string> tradeableSymbols);

    std::optional<proptrade::domain::Rejection> validate(const proptrade::domain::OrderRequest& order) const;

    // TP/SL sanity against a known entry or execution price
    static std::optional<proptrade::domain::Rejection> validateTakeProfit(proptrade::domain::Side side, double entryPrice, double takeProfit);
    static std::optional<proptrade::domain::Rejection> validateStopLoss(proptrade::domain::Side side, double entryPrice, double stopLoss);
    static std::optional<proptrade::domain::Rejection> validateProtectionLevels(proptrade::domain::Side side,
                                                                                double entryPrice,
                                                                                std::optional<double> takeProfit,
                                                                                std::optional<double> stopLoss);

    static QuantityBand quantityBand(const std::string& symbol);
    static const std::set<std::string>& defaultTradeableSymbols();

    bool isTradeable(const std::string& symbol) const { return tradeableSymbols_.count(symbol) > 0; }

private:
    std::optional<proptrade::domain::Rejection> validateRequiredFields(const proptrade::domain::OrderRequest& order) const;
    std::optional<proptrade::domain::Rejection> validateEnums(const proptrade::domain::OrderRequest& order) const;
    std::optional<proptrade::domain::Rejection> validateQuantity(const proptrade::domain::OrderRequest& order) const;
    std::optional<proptrade::domain::Rejection> validateLeverage(const proptrade::domain::OrderRequest& order) const;
    std::optional<proptrade::domain::Rejection> validateLimitPrice(const proptrade::domain::OrderRequest& order) const;
    std::optional<proptrade::domain::Rejection> validateProtectionValues(const proptrade::domain::OrderRequest& order) const;
};

} // namespace proptrade::application
