#include "trigger_engine.hpp"
#include "margin_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace proptrade::application {

using proptrade::domain::CloseReason;
using proptrade::domain::CloseResult;
using proptrade::domain::Position;
using proptrade::domain::PriceSnapshot;
using proptrade::domain::Rejection;
using proptrade::domain::Side;

TriggerEngine::TriggerEngine(PositionManager& positions, int64_t priceStaleMs, double warningThreshold)
    : positions_(positions), priceStaleMs_(priceStaleMs), warningThreshold_(warningThreshold) {
}

std::optional<CloseReason> TriggerEngine::evaluate(const Position& position, const PriceSnapshot& price) {
    double exitPrice = price.exitPriceFor(position.side);
    if (position.liquidationPrice > 0.0 &&
        MarginCalculator::shouldLiquidate(position.side, exitPrice, position.liquidationPrice)) {
        return CloseReason::LIQUIDATION_TRIGGERED;
    }

    double mark = price.mid;
    if (position.side == Side::LONG) {
        if (position.stopLoss && mark <= *position.stopLoss) {
            return CloseReason::SL_TRIGGERED;
        }
        if (position.takeProfit && mark >= *position.takeProfit) {
            return CloseReason::TP_TRIGGERED;
        }
    } else {
        if (position.stopLoss && mark >= *position.stopLoss) {
            return CloseReason::SL_TRIGGERED;
        }
        if (position.takeProfit && mark <= *position.takeProfit) {
            return CloseReason::TP_TRIGGERED;
        }
    }
    return std::nullopt;
}

double TriggerEngine::distanceToLiquidation(const Position& position, double currentPrice) {
    double total = std::abs(position.entryPrice - position.liquidationPrice);
    if (total <= 0.0) {
        return 0.0;
    }
    double current = position.side == Side::LONG
        ? currentPrice - position.liquidationPrice
        : position.liquidationPrice - currentPrice;
    return std::max(0.0, current / total);
}

TriggerScanResult TriggerEngine::onPriceUpdate(const PriceSnapshot& price, int64_t nowMs) {
    TriggerScanResult scan;
    if (price.isStale(nowMs, priceStaleMs_)) {
        return scan;
    }

    for (const auto& position : positions_.getBySymbol(price.symbol)) {
        auto reason = evaluate(position, price);
        if (!reason) {
            double exitPrice = price.exitPriceFor(position.side);
            double distance = distanceToLiquidation(position, exitPrice);
            if (distance < warningThreshold_) {
                std::lock_guard<std::mutex> lock(warnedMutex_);
                if (warned_.insert(position.id).second) {
                    std::cout << "[TriggerEngine] WARNING: " << position.id << " at "
                              << distance * 100.0 << "% from liquidation" << std::endl;
                    scan.warnings.push_back({position, exitPrice, distance});
                }
            }
            continue;
        }

        if (*reason == CloseReason::LIQUIDATION_TRIGGERED) {
            std::cout << "[TriggerEngine] LIQUIDATION: " << position.id << " " << position.symbol << " "
                      << proptrade::domain::toString(position.side) << " @ "
                      << price.exitPriceFor(position.side) << std::endl;
        }

        auto outcome = positions_.closeFull(position.id, price, *reason);
        if (auto* closed = std::get_if<CloseResult>(&outcome)) {
            forget(position.id);
            scan.closed.push_back(*closed);
        } else {
            const auto& rejection = std::get<Rejection>(outcome);
            // Another path may have closed it first; a busy lock is retried on the next tick
            std::cerr << "[TriggerEngine] " << proptrade::domain::toString(*reason) << " close failed for "
                      << position.id << ": " << rejection.reason << std::endl;
            scan.failures.push_back(rejection);
        }
    }
    return scan;
}

void TriggerEngine::forget(const std::string& positionId) {
    std::lock_guard<std::mutex> lock(warnedMutex_);
    warned_.erase(positionId);
}

size_t TriggerEngine::prune() {
    std::lock_guard<std::mutex> lock(warnedMutex_);
    size_t removed = 0;
    for (auto it = warned_.begin(); it != warned_.end();) {
        if (!positions_.get(*it)) {
            it = warned_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t TriggerEngine::warnedCount() {
    std::lock_guard<std::mutex> lock(warnedMutex_);
    return warned_.size();
}

} // namespace proptrade::application
