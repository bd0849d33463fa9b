#pragma once

#include "../../domain/interfaces.hpp"
#include <unordered_map>
#include <mutex>
#include <chrono>
#include <memory>

namespace proptrade::infrastructure::cache {

// Successful placements keyed by userId:clientOrderId
class IdempotencyCache : public proptrade::domain::IIdempotencyCache {
private:
    struct CacheEntry {
        proptrade::domain::PlaceOrderResult result;
        std::chrono::steady_clock::time_point expiresAt;

        CacheEntry() = default;
        CacheEntry(const proptrade::domain::PlaceOrderResult& res, std::chrono::steady_clock::time_point exp)
            : result(res), expiresAt(exp) {}

        bool isExpired(std::chrono::steady_clock::time_point now) const {
            return now > expiresAt;
        }
    };

    std::unordered_map<std::string, CacheEntry> cache_;
    mutable std::mutex mutex_;

public:
    IdempotencyCache() = default;
    ~IdempotencyCache() override = default;

    std::optional<proptrade::domain::PlaceOrderResult> get(const std::string& key) override;
    void put(const std::string& key, const proptrade::domain::PlaceOrderResult& result, int32_t ttlMs = 300000) override;

    // Returns the number of entries dropped
    size_t cleanup();

    size_t size() const;
};

} // namespace proptrade::infrastructure::cache
