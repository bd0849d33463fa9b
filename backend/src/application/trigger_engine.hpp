#pragma once

#include "../domain/types.hpp"
#include "position_manager.hpp"
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace proptrade::application {

struct LiquidationWarning {
    proptrade::domain::Position position;
    double currentPrice = 0.0;
    // 1 at entry, 0 at the liquidation price
    double distance = 0.0;
};

struct TriggerScanResult {
    std::vector<proptrade::domain::CloseResult> closed;
    std::vector<proptrade::domain::Rejection> failures;
    std::vector<LiquidationWarning> warnings;
};

// Tick-driven TP/SL and liquidation checks over the positions on one symbol.
// Liquidation is judged on the exit side of the quote, TP/SL on mid.
class TriggerEngine {
private:
    PositionManager& positions_;
    int64_t priceStaleMs_;
    double warningThreshold_;

    std::set<std::string> warned_;
    std::mutex warnedMutex_;

public:
    TriggerEngine(PositionManager& positions, int64_t priceStaleMs, double warningThreshold = 0.5);

    // Liquidation wins when it and TP/SL fire on the same tick
    static std::optional<proptrade::domain::CloseReason> evaluate(const proptrade::domain::Position& position,
                                                                  const proptrade::domain::PriceSnapshot& price);

    static double distanceToLiquidation(const proptrade::domain::Position& position, double currentPrice);

    // Stale ticks never trigger anything
    TriggerScanResult onPriceUpdate(const proptrade::domain::PriceSnapshot& price, int64_t nowMs);

    void forget(const std::string& positionId);
    // Drops warning marks of positions closed elsewhere
    size_t prune();
    size_t warnedCount();
};

} // namespace proptrade::application
