#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>

namespace proptrade::application {

using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;

namespace {

std::map<std::string, RateLimitConfig> defaultConfigs() {
    return {
        {"PLACE_ORDER", {1000, 10}},
        {"MODIFY_POSITION", {1000, 20}},
        {"CLOSE_POSITION", {1000, 20}},
        {"SUBSCRIBE", {1000, 5}},
        {"UNSUBSCRIBE", {1000, 5}},
        {"DEFAULT", {1000, 100}}
    };
}

} // namespace

RateLimiter::RateLimiter() : configs_(defaultConfigs()) {
}

RateLimiter::RateLimiter(std::map<std::string, RateLimitConfig> configs) : configs_(std::move(configs)) {
    if (configs_.find("DEFAULT") == configs_.end()) {
        configs_["DEFAULT"] = {1000, 100};
    }
}

const RateLimitConfig& RateLimiter::configFor(const std::string& action) const {
    auto it = configs_.find(action);
    if (it != configs_.end()) {
        return it->second;
    }
    return configs_.at("DEFAULT");
}

std::string RateLimiter::keyFor(const std::string& userId, const std::string& action) {
    return userId + ":" + action;
}

RateLimitDecision RateLimiter::check(const std::string& userId, const std::string& action, int64_t nowMs) {
    const auto& config = configFor(action);
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entry = windows_[keyFor(userId, action)];
    if (entry.count == 0 || nowMs - entry.windowStart >= config.windowMs) {
        entry.count = 1;
        entry.windowStart = nowMs;
        return {true, config.maxRequests - 1, config.windowMs};
    }

    int64_t resetIn = std::max<int64_t>(0, config.windowMs - (nowMs - entry.windowStart));
    if (entry.count >= config.maxRequests) {
        return {false, 0, resetIn};
    }

    entry.count++;
    return {true, config.maxRequests - entry.count, resetIn};
}

int32_t RateLimiter::getRemainingRequests(const std::string& userId, const std::string& action, int64_t nowMs) const {
    const auto& config = configFor(action);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = windows_.find(keyFor(userId, action));
    if (it == windows_.end() || nowMs - it->second.windowStart >= config.windowMs) {
        return config.maxRequests;
    }
    return std::max(0, config.maxRequests - it->second.count);
}

int64_t RateLimiter::getResetTime(const std::string& userId, const std::string& action, int64_t nowMs) const {
    const auto& config = configFor(action);
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = windows_.find(keyFor(userId, action));
    if (it == windows_.end()) {
        return 0;
    }
    return std::max<int64_t>(0, config.windowMs - (nowMs - it->second.windowStart));
}

void RateLimiter::cleanup(int64_t nowMs) {
    int64_t maxWindowMs = 0;
    for (const auto& [action, config] : configs_) {
        maxWindowMs = std::max(maxWindowMs, config.windowMs);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = windows_.begin(); it != windows_.end();) {
        if (nowMs - it->second.windowStart > maxWindowMs * 2) {
            it = windows_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t RateLimiter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

std::optional<Rejection> RateLimiter::validateTimestamp(std::optional<int64_t> clientTs, int64_t nowMs) {
    if (!clientTs) {
        return Rejection(RejectCode::TIMESTAMP_INVALID, "Order timestamp is required");
    }

    // Compared against shifted bounds so extreme client values cannot overflow
    if (*clientTs < nowMs - MAX_ORDER_AGE_MS) {
        double age = static_cast<double>(nowMs) - static_cast<double>(*clientTs);
        auto seconds = static_cast<int64_t>(std::llround(age / 1000.0));
        return Rejection(RejectCode::TIMESTAMP_INVALID,
                         "Order timestamp expired (" + std::to_string(seconds) + "s old, max " +
                         std::to_string(MAX_ORDER_AGE_MS / 1000) + "s)");
    }
    if (*clientTs > nowMs + MAX_FUTURE_TOLERANCE_MS) {
        return Rejection(RejectCode::TIMESTAMP_INVALID, "Order timestamp is in the future");
    }
    return std::nullopt;
}

} // namespace proptrade::application
