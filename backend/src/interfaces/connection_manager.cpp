#include "connection_manager.hpp"
#include <iostream>

namespace proptrade::interfaces {

using proptrade::domain::IConnectionChannel;
using ChannelList = std::vector<std::pair<std::string, std::shared_ptr<IConnectionChannel>>>;

ConnectionManager::ConnectionManager(ConnectionSettings settings) : settings_(settings) {
}

bool ConnectionManager::isHighFrequency(const std::string& type) {
    return type == "PRICE_UPDATE" || type == "ORDER_BOOK_UPDATE";
}

void ConnectionManager::addConnection(const std::string& connectionId,
                                      std::shared_ptr<IConnectionChannel> channel,
                                      const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = connections_.find(connectionId);
    if (existing != connections_.end()) {
        unindex(existing->second);
        connections_.erase(existing);
    }

    Entry entry;
    entry.info.connectionId = connectionId;
    entry.info.userId = userId;
    entry.channel = std::move(channel);
    if (!userId.empty()) {
        byUser_[userId].insert(connectionId);
    }
    connections_.emplace(connectionId, std::move(entry));
}

void ConnectionManager::unindex(const Entry& entry) {
    const auto& id = entry.info.connectionId;
    auto dropFrom = [&id](std::unordered_map<std::string, std::set<std::string>>& index, const std::string& key) {
        auto it = index.find(key);
        if (it == index.end()) {
            return;
        }
        it->second.erase(id);
        if (it->second.empty()) {
            index.erase(it);
        }
    };

    if (!entry.info.userId.empty()) {
        dropFrom(byUser_, entry.info.userId);
    }
    if (!entry.info.accountId.empty()) {
        dropFrom(byAccount_, entry.info.accountId);
    }
    for (const auto& symbol : entry.info.subscriptions) {
        dropFrom(bySymbol_, symbol);
    }
}

void ConnectionManager::removeConnection(const std::string& connectionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return;
    }
    unindex(it->second);
    connections_.erase(it);
}

bool ConnectionManager::hasConnection(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.count(connectionId) > 0;
}

std::optional<ConnectionInfo> ConnectionManager::getConnection(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

bool ConnectionManager::setUser(const std::string& connectionId, const std::string& userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return false;
    }

    auto& info = it->second.info;
    if (!info.userId.empty()) {
        auto users = byUser_.find(info.userId);
        if (users != byUser_.end()) {
            users->second.erase(connectionId);
            if (users->second.empty()) {
                byUser_.erase(users);
            }
        }
    }
    info.userId = userId;
    if (!userId.empty()) {
        byUser_[userId].insert(connectionId);
    }
    return true;
}

std::optional<std::string> ConnectionManager::userFor(const std::string& connectionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end() || it->second.info.userId.empty()) {
        return std::nullopt;
    }
    return it->second.info.userId;
}

bool ConnectionManager::setAccount(const std::string& connectionId, const std::string& accountId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return false;
    }

    auto& info = it->second.info;
    if (info.accountId == accountId) {
        return true;
    }
    if (!info.accountId.empty()) {
        auto accounts = byAccount_.find(info.accountId);
        if (accounts != byAccount_.end()) {
            accounts->second.erase(connectionId);
            if (accounts->second.empty()) {
                byAccount_.erase(accounts);
            }
        }
    }
    info.accountId = accountId;
    if (!accountId.empty()) {
        byAccount_[accountId].insert(connectionId);
    }
    return true;
}

bool ConnectionManager::subscribe(const std::string& connectionId, const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return false;
    }
    it->second.info.subscriptions.insert(symbol);
    bySymbol_[symbol].insert(connectionId);
    return true;
}

bool ConnectionManager::unsubscribe(const std::string& connectionId, const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connectionId);
    if (it == connections_.end()) {
        return false;
    }
    it->second.info.subscriptions.erase(symbol);
    auto subscribers = bySymbol_.find(symbol);
    if (subscribers != bySymbol_.end()) {
        subscribers->second.erase(connectionId);
        if (subscribers->second.empty()) {
            bySymbol_.erase(subscribers);
        }
    }
    return true;
}

ChannelList ConnectionManager::channelsFor(const std::set<std::string>& ids) const {
    ChannelList targets;
    targets.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            targets.emplace_back(id, it->second.channel);
        }
    }
    return targets;
}

size_t ConnectionManager::deliver(const ChannelList& targets, const nlohmann::json& message, bool applyBackpressure) {
    if (targets.empty()) {
        return 0;
    }

    std::string type = message.value("type", "");
    std::string payload = message.dump();
    size_t delivered = 0;
    std::vector<std::string> failed;

    for (const auto& [id, channel] : targets) {
        if (!channel) {
            failed.push_back(id);
            continue;
        }
        if (applyBackpressure && channel->bufferedAmount() > settings_.maxBufferedAmount) {
            continue;
        }

        bool ok = false;
        try {
            ok = channel->send(type, payload);
        } catch (const std::exception& e) {
            std::cerr << "[ConnectionManager] Send to " << id << " threw: " << e.what() << std::endl;
        }
        if (ok) {
            ++delivered;
        } else {
            failed.push_back(id);
        }
    }

    for (const auto& id : failed) {
        std::cout << "[ConnectionManager] Dropping connection " << id << " after failed send" << std::endl;
        removeConnection(id);
    }
    return delivered;
}

bool ConnectionManager::send(const std::string& connectionId, const nlohmann::json& message) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = channelsFor({connectionId});
    }
    return deliver(targets, message, false) == 1;
}

size_t ConnectionManager::sendToUser(const std::string& userId, const nlohmann::json& message) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byUser_.find(userId);
        if (it == byUser_.end()) {
            return 0;
        }
        targets = channelsFor(it->second);
    }
    return deliver(targets, message, false);
}

size_t ConnectionManager::sendToUser(const std::string& userId,
                                     const nlohmann::json& message,
                                     const std::string& exceptConnectionId) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byUser_.find(userId);
        if (it == byUser_.end()) {
            return 0;
        }
        auto ids = it->second;
        ids.erase(exceptConnectionId);
        targets = channelsFor(ids);
    }
    return deliver(targets, message, false);
}

size_t ConnectionManager::sendToAccount(const std::string& accountId, const nlohmann::json& message) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = byAccount_.find(accountId);
        if (it == byAccount_.end()) {
            return 0;
        }
        targets = channelsFor(it->second);
    }
    return deliver(targets, message, false);
}

size_t ConnectionManager::sendToAll(const nlohmann::json& message) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets.reserve(connections_.size());
        for (const auto& [id, entry] : connections_) {
            targets.emplace_back(id, entry.channel);
        }
    }
    return deliver(targets, message, false);
}

void ConnectionManager::sendToSubscribersNow(const std::string& symbol, const nlohmann::json& message) {
    ChannelList targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bySymbol_.find(symbol);
        if (it == bySymbol_.end()) {
            return;
        }
        targets = channelsFor(it->second);
    }
    deliver(targets, message, isHighFrequency(message.value("type", "")));
}

void ConnectionManager::broadcastToSubscribers(const std::string& symbol, const nlohmann::json& message, int64_t nowMs) {
    std::string type = message.value("type", "");
    if (!isHighFrequency(type)) {
        sendToSubscribersNow(symbol, message);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(throttleMutex_);
        auto& slot = throttle_[symbol + "|" + type];
        if (slot.hasSent && nowMs - slot.lastSentMs < settings_.throttleMs) {
            slot.pending = message;
            return;
        }
        slot.hasSent = true;
        slot.lastSentMs = nowMs;
        slot.pending.reset();
    }
    sendToSubscribersNow(symbol, message);
}

size_t ConnectionManager::flushThrottled(int64_t nowMs) {
    std::vector<std::pair<std::string, nlohmann::json>> due;
    {
        std::lock_guard<std::mutex> lock(throttleMutex_);
        for (auto& [key, slot] : throttle_) {
            if (!slot.pending || nowMs - slot.lastSentMs < settings_.throttleMs) {
                continue;
            }
            due.emplace_back(key.substr(0, key.find('|')), std::move(*slot.pending));
            slot.pending.reset();
            slot.lastSentMs = nowMs;
        }
    }

    for (const auto& [symbol, message] : due) {
        sendToSubscribersNow(symbol, message);
    }
    return due.size();
}

size_t ConnectionManager::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

size_t ConnectionManager::subscriberCount(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bySymbol_.find(symbol);
    return it == bySymbol_.end() ? 0 : it->second.size();
}

} // namespace proptrade::interfaces
