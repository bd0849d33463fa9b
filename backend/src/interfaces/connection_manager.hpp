#pragma once

#include "../domain/interfaces.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace proptrade::interfaces {

struct ConnectionInfo {
    std::string connectionId;
    std::string userId;
    std::string accountId;
    std::set<std::string> subscriptions;
};

struct ConnectionSettings {
    int64_t throttleMs = 50;
    size_t maxBufferedAmount = 65536;
};

// Registry of live connections with user, account and symbol indices.
// Sends never throw; a failed send unregisters the connection.
class ConnectionManager {
private:
    struct Entry {
        ConnectionInfo info;
        std::shared_ptr<proptrade::domain::IConnectionChannel> channel;
    };

    struct ThrottleSlot {
        int64_t lastSentMs = 0;
        bool hasSent = false;
        std::optional<nlohmann::json> pending;
    };

    ConnectionSettings settings_;

    std::unordered_map<std::string, Entry> connections_;
    std::unordered_map<std::string, std::set<std::string>> byUser_;
    std::unordered_map<std::string, std::set<std::string>> byAccount_;
    std::unordered_map<std::string, std::set<std::string>> bySymbol_;
    mutable std::mutex mutex_;

    // Keyed by symbol + '|' + message type
    std::unordered_map<std::string, ThrottleSlot> throttle_;
    std::mutex throttleMutex_;

    void unindex(const Entry& entry);
    std::vector<std::pair<std::string, std::shared_ptr<proptrade::domain::IConnectionChannel>>>
        channelsFor(const std::set<std::string>& ids) const;
    size_t deliver(const std::vector<std::pair<std::string, std::shared_ptr<proptrade::domain::IConnectionChannel>>>& targets,
                   const nlohmann::json& message,
                   bool applyBackpressure);
    void sendToSubscribersNow(const std::string& symbol, const nlohmann::json& message);

public:
    explicit ConnectionManager(ConnectionSettings settings = {});

    static bool isHighFrequency(const std::string& type);

    void addConnection(const std::string& connectionId,
                       std::shared_ptr<proptrade::domain::IConnectionChannel> channel,
                       const std::string& userId = "");
    void removeConnection(const std::string& connectionId);
    bool hasConnection(const std::string& connectionId) const;
    std::optional<ConnectionInfo> getConnection(const std::string& connectionId) const;

    bool setUser(const std::string& connectionId, const std::string& userId);
    std::optional<std::string> userFor(const std::string& connectionId) const;
    bool setAccount(const std::string& connectionId, const std::string& accountId);

    bool subscribe(const std::string& connectionId, const std::string& symbol);
    bool unsubscribe(const std::string& connectionId, const std::string& symbol);

    bool send(const std::string& connectionId, const nlohmann::json& message);
    size_t sendToUser(const std::string& userId, const nlohmann::json& message);
    // Every connection of userId except the one given
    size_t sendToUser(const std::string& userId, const nlohmann::json& message, const std::string& exceptConnectionId);
    size_t sendToAccount(const std::string& accountId, const nlohmann::json& message);
    size_t sendToAll(const nlohmann::json& message);

    // Price and order book updates go through the per-symbol throttle;
    // anything else is sent to the subscribers at once
    void broadcastToSubscribers(const std::string& symbol, const nlohmann::json& message, int64_t nowMs);

    // Sends the latest coalesced update of every window that has elapsed
    size_t flushThrottled(int64_t nowMs);

    size_t connectionCount() const;
    size_t subscriberCount(const std::string& symbol) const;
};

} // namespace proptrade::interfaces
