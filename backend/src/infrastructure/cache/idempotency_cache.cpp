#include "idempotency_cache.hpp"

namespace proptrade::infrastructure::cache {

std::optional<proptrade::domain::PlaceOrderResult> IdempotencyCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }

    if (it->second.isExpired(std::chrono::steady_clock::now())) {
        cache_.erase(it);
        return std::nullopt;
    }

    return it->second.result;
}

void IdempotencyCache::put(const std::string& key, const proptrade::domain::PlaceOrderResult& result, int32_t ttlMs) {
    // Rejections are never replayed
    if (std::holds_alternative<proptrade::domain::Rejection>(result)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto expiresAt = std::chrono::steady_clock::now() + std::chrono::milliseconds(ttlMs);
    cache_[key] = CacheEntry(result, expiresAt);
}

size_t IdempotencyCache::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;
    auto it = cache_.begin();
    while (it != cache_.end()) {
        if (it->second.isExpired(now)) {
            it = cache_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t IdempotencyCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace proptrade::infrastructure::cache
