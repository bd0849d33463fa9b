#pragma once

#include "../../domain/types.hpp"
#include "../market/price_book.hpp"
#include <cstdint>
#include <string>

namespace proptrade::infrastructure::config {

std::string getEnvVar(const std::string& name, const std::string& defaultValue);
int getEnvVarInt(const std::string& name, int defaultValue);
int64_t getEnvVarInt64(const std::string& name, int64_t defaultValue);
double getEnvVarDouble(const std::string& name, double defaultValue);

struct EngineConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3002;

    std::string jwtSecret;
    std::string jwtIssuer = "propfirm-api";
    std::string jwtAudience = "propfirm-client";

    proptrade::domain::TradingParameters trading;
    proptrade::infrastructure::market::PriceBookConfig priceBook;

    int64_t priceUpdateThrottleMs = 50;
    size_t maxBufferedAmount = 65536;

    double fundingRate = 0.0001;
    int64_t fundingIntervalMs = 8LL * 60 * 60 * 1000;

    std::string accountsFile;
    bool persistenceEnabled = true;
    bool simulatedFeed = true;

    // Throws std::runtime_error when JWT_SECRET is missing
    static EngineConfig fromEnvironment();

    // Overrides from `trading-engine [port] [host]`
    void applyArguments(int argc, char* argv[]);
};

} // namespace proptrade::infrastructure::config
