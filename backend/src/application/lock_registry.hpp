#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace proptrade::application {

// Held lock on one entity. Empty when the bounded wait timed out.
class EntityLock {
private:
    std::shared_ptr<std::timed_mutex> mutex_;
    std::unique_lock<std::timed_mutex> lock_;
    std::string id_;

public:
    EntityLock() = default;
    EntityLock(std::shared_ptr<std::timed_mutex> mutex, std::string id, std::chrono::milliseconds timeout);

    // Members are declared so the lock is released before the mutex reference drops
    EntityLock(EntityLock&&) = default;
    EntityLock& operator=(EntityLock&&) = delete;
    EntityLock(const EntityLock&) = delete;
    EntityLock& operator=(const EntityLock&) = delete;

    explicit operator bool() const { return lock_.owns_lock(); }
    bool owns() const { return lock_.owns_lock(); }
    const std::string& id() const { return id_; }
};

// id -> mutex map for one kind of entity (accounts or positions).
// Acquisition order across registries is always position before account.
class LockRegistry {
private:
    std::unordered_map<std::string, std::shared_ptr<std::timed_mutex>> mutexes_;
    mutable std::mutex mutex_;
    std::chrono::milliseconds timeout_;

    std::shared_ptr<std::timed_mutex> mutexFor(const std::string& id);

public:
    explicit LockRegistry(std::chrono::milliseconds timeout = std::chrono::milliseconds(50));

    EntityLock acquire(const std::string& id);
    EntityLock acquire(const std::string& id, std::chrono::milliseconds timeout);

    // Forget an entity that no longer exists. Holders keep their mutex alive.
    void release(const std::string& id);

    size_t size() const;
    std::chrono::milliseconds timeout() const { return timeout_; }
};

} // namespace proptrade::application
