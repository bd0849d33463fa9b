#include "engine_config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace proptrade::infrastructure::config {

std::string getEnvVar(const std::string& name, const std::string& defaultValue) {
    const char* envValue = std::getenv(name.c_str());
    if (envValue == nullptr) {
        return defaultValue;
    }
    return std::string(envValue);
}

int getEnvVarInt(const std::string& name, int defaultValue) {
    const char* envValue = std::getenv(name.c_str());
    if (envValue == nullptr) {
        return defaultValue;
    }

    try {
        return std::stoi(envValue);
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid integer value for " << name << ": " << envValue
                  << ", using default: " << defaultValue << std::endl;
        return defaultValue;
    }
}

int64_t getEnvVarInt64(const std::string& name, int64_t defaultValue) {
    const char* envValue = std::getenv(name.c_str());
    if (envValue == nullptr) {
        return defaultValue;
    }

    try {
        return std::stoll(envValue);
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid integer value for " << name << ": " << envValue
                  << ", using default: " << defaultValue << std::endl;
        return defaultValue;
    }
}

double getEnvVarDouble(const std::string& name, double defaultValue) {
    const char* envValue = std::getenv(name.c_str());
    if (envValue == nullptr) {
        return defaultValue;
    }

    try {
        return std::stod(envValue);
    } catch (const std::exception&) {
        std::cerr << "[Config] Invalid numeric value for " << name << ": " << envValue
                  << ", using default: " << defaultValue << std::endl;
        return defaultValue;
    }
}

namespace {

bool getEnvVarBool(const std::string& name, bool defaultValue) {
    std::string value = getEnvVar(name, "");
    if (value.empty()) {
        return defaultValue;
    }
    if (value == "1" || value == "true" || value == "yes") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no") {
        return false;
    }
    std::cerr << "[Config] Invalid boolean value for " << name << ": " << value
              << ", using default: " << (defaultValue ? "true" : "false") << std::endl;
    return defaultValue;
}

void mergeSymbolSpreads(const std::string& text, std::map<std::string, double>& spreads) {
    if (text.empty()) {
        return;
    }
    try {
        auto parsed = nlohmann::json::parse(text);
        if (!parsed.is_object()) {
            std::cerr << "[Config] SYMBOL_SPREADS must be a JSON object, ignoring" << std::endl;
            return;
        }
        for (auto it = parsed.begin(); it != parsed.end(); ++it) {
            if (it.value().is_number() && it.value().get<double>() >= 0.0) {
                spreads[it.key()] = it.value().get<double>();
            } else {
                std::cerr << "[Config] Ignoring invalid spread for " << it.key() << std::endl;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Config] Invalid SYMBOL_SPREADS: " << e.what() << std::endl;
    }
}

} // namespace

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig config;

    config.host = getEnvVar("WS_HOST", config.host);
    int port = getEnvVarInt("WS_PORT", config.port);
    if (port > 0 && port <= 65535) {
        config.port = static_cast<uint16_t>(port);
    } else {
        std::cerr << "[Config] WS_PORT out of range: " << port << ", using default: " << config.port << std::endl;
    }

    config.jwtSecret = getEnvVar("JWT_SECRET", "");
    if (config.jwtSecret.empty()) {
        throw std::runtime_error("JWT_SECRET must be set");
    }
    config.jwtIssuer = getEnvVar("JWT_ISSUER", config.jwtIssuer);
    config.jwtAudience = getEnvVar("JWT_AUDIENCE", config.jwtAudience);

    auto& trading = config.trading;
    trading.maintenanceMarginPct = getEnvVarDouble("MAINTENANCE_MARGIN_PCT", trading.maintenanceMarginPct);
    trading.feeRate = getEnvVarDouble("ENTRY_FEE_PCT", trading.feeRate);
    trading.priceStaleMs = getEnvVarInt64("PRICE_STALE_THRESHOLD_MS", trading.priceStaleMs);
    trading.lockTimeoutMs = getEnvVarInt("LOCK_TIMEOUT_MS", trading.lockTimeoutMs);

    auto& book = config.priceBook;
    book.defaultSpreadBps = getEnvVarDouble("DEFAULT_SPREAD_BPS", book.defaultSpreadBps);
    mergeSymbolSpreads(getEnvVar("SYMBOL_SPREADS", ""), book.symbolSpreadsBps);
    book.circuitBreakerThreshold = getEnvVarDouble("CIRCUIT_BREAKER_THRESHOLD_PCT", book.circuitBreakerThreshold);
    book.circuitBreakerResetMs = getEnvVarInt64("CIRCUIT_BREAKER_RESET_MS", book.circuitBreakerResetMs);

    config.priceUpdateThrottleMs = getEnvVarInt64("PRICE_UPDATE_THROTTLE_MS", config.priceUpdateThrottleMs);
    int64_t maxBuffered = getEnvVarInt64("MAX_BUFFERED_AMOUNT", static_cast<int64_t>(config.maxBufferedAmount));
    if (maxBuffered > 0) {
        config.maxBufferedAmount = static_cast<size_t>(maxBuffered);
    }

    config.fundingRate = getEnvVarDouble("FUNDING_RATE", config.fundingRate);
    config.fundingIntervalMs = getEnvVarInt64("FUNDING_INTERVAL_MS", config.fundingIntervalMs);

    config.accountsFile = getEnvVar("ACCOUNTS_FILE", "");
    config.persistenceEnabled = getEnvVarBool("CLICKHOUSE_ENABLED", config.persistenceEnabled);
    config.simulatedFeed = getEnvVarBool("SIMULATED_FEED", config.simulatedFeed);

    std::cout << "[Config] host=" << config.host << " port=" << config.port
              << " staleMs=" << trading.priceStaleMs << " lockTimeoutMs=" << trading.lockTimeoutMs
              << " throttleMs=" << config.priceUpdateThrottleMs << std::endl;
    return config;
}

void EngineConfig::applyArguments(int argc, char* argv[]) {
    if (argc > 1) {
        try {
            int value = std::stoi(argv[1]);
            if (value > 0 && value <= 65535) {
                port = static_cast<uint16_t>(value);
            } else {
                std::cerr << "[Config] Port argument out of range: " << argv[1] << std::endl;
            }
        } catch (const std::exception&) {
            std::cerr << "[Config] Invalid port argument: " << argv[1] << std::endl;
        }
    }
    if (argc > 2) {
        host = argv[2];
    }
}

} // namespace proptrade::infrastructure::config
