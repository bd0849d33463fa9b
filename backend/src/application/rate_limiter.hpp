#pragma once

#include "../domain/types.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace proptrade::application {

struct RateLimitConfig {
    int64_t windowMs;
    int32_t maxRequests;
};

struct RateLimitDecision {
    bool allowed = true;
    int32_t remaining = 0;
    int64_t resetInMs = 0;
};

// Fixed-window throttle keyed by (userId, action)
class RateLimiter {
private:
    struct WindowEntry {
        int32_t count = 0;
        int64_t windowStart = 0;
    };

    std::map<std::string, RateLimitConfig> configs_;
    std::unordered_map<std::string, WindowEntry> windows_;
    mutable std::mutex mutex_;

    const RateLimitConfig& configFor(const std::string& action) const;
    static std::string keyFor(const std::string& userId, const std::string& action);

public:
    static constexpr int64_t MAX_ORDER_AGE_MS = 3000;
    static constexpr int64_t MAX_FUTURE_TOLERANCE_MS = 1000;

    RateLimiter();
    explicit RateLimiter(std::map<std::string, RateLimitConfig> configs);

    RateLimitDecision check(const std::string& userId, const std::string& action, int64_t nowMs);
    RateLimitDecision check(const std::string& userId, const std::string& action) {
        return check(userId, action, proptrade::domain::currentTimeMs());
    }

    int32_t getRemainingRequests(const std::string& userId, const std::string& action, int64_t nowMs) const;
    int64_t getResetTime(const std::string& userId, const std::string& action, int64_t nowMs) const;

    // Drop windows idle for more than twice the longest window
    void cleanup(int64_t nowMs);
    size_t size() const;

    // Replay guard on the client-supplied order timestamp
    static std::optional<proptrade::domain::Rejection> validateTimestamp(std::optional<int64_t> clientTs, int64_t nowMs);
};

} // namespace proptrade::application
