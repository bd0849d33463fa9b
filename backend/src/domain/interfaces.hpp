#pragma once

#include "types.hpp"
#include <algorithm>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace proptrade::domain {

// Market data
class IPriceSnapshotProvider {
public:
    virtual ~IPriceSnapshotProvider() = default;
    virtual std::optional<PriceSnapshot> getPrice(const std::string& symbol) const = 0;
    virtual bool isPriceStale(const std::string& symbol, int64_t maxAgeMs) const = 0;
};

// Account persistence
class IAccountStore {
public:
    virtual ~IAccountStore() = default;
    virtual std::optional<AccountState> getAccount(const std::string& accountId) const = 0;
    virtual void updateAccount(const AccountState& account) = 0;
    virtual std::vector<std::string> listAccountIds() const = 0;
};

// Fire-and-forget audit trail
class ITradeEventSink {
public:
    virtual ~ITradeEventSink() = default;
    virtual void record(const TradeEvent& event) = 0;
};

class IIdempotencyCache {
public:
    virtual ~IIdempotencyCache() = default;
    virtual std::optional<PlaceOrderResult> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const PlaceOrderResult& result, int32_t ttlMs = 300000) = 0; // 5 min default
};

// Outbound side of one client connection
class IConnectionChannel {
public:
    virtual ~IConnectionChannel() = default;
    // type is the outbound message type, payload its serialized JSON body
    virtual bool send(const std::string& type, const std::string& payload) = 0;
    virtual size_t bufferedAmount() const = 0;
};

// Authentication
struct Principal {
    std::string subject;
    std::vector<std::string> roles;

    Principal() = default;
    Principal(std::string sub, std::vector<std::string> r)
        : subject(std::move(sub)), roles(std::move(r)) {}

    bool hasRole(const std::string& role) const {
        return std::find(roles.begin(), roles.end(), role) != roles.end();
    }
};

class IAuthInspector {
public:
    virtual ~IAuthInspector() = default;
    virtual std::optional<Principal> verify(const std::string& token) = 0;
};

} // namespace proptrade::domain
