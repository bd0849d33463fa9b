#include "lock_registry.hpp"

namespace proptrade::application {

EntityLock::EntityLock(std::shared_ptr<std::timed_mutex> mutex, std::string id, std::chrono::milliseconds timeout)
    : mutex_(std::move(mutex)), lock_(*mutex_, std::defer_lock), id_(std::move(id)) {
    lock_.try_lock_for(timeout);
}

LockRegistry::LockRegistry(std::chrono::milliseconds timeout) : timeout_(timeout) {
}

std::shared_ptr<std::timed_mutex> LockRegistry::mutexFor(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = mutexes_[id];
    if (!entry) {
        entry = std::make_shared<std::timed_mutex>();
    }
    return entry;
}

EntityLock LockRegistry::acquire(const std::string& id) {
    return acquire(id, timeout_);
}

EntityLock LockRegistry::acquire(const std::string& id, std::chrono::milliseconds timeout) {
    return EntityLock(mutexFor(id), id, timeout);
}

void LockRegistry::release(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    mutexes_.erase(id);
}

size_t LockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mutexes_.size();
}

} // namespace proptrade::application
