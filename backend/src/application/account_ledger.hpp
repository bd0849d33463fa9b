#pragma once

#include "../domain/interfaces.hpp"
#include "lock_registry.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace proptrade::application {

using AccountOutcome = std::variant<proptrade::domain::AccountState, proptrade::domain::Rejection>;

// Per-account balance and margin state with serialized mutation.
// Every mutator takes the EntityLock returned by lock() for that account.
class AccountLedger {
private:
    proptrade::domain::IAccountStore& store_;
    LockRegistry locks_;

    proptrade::domain::AccountState load(const EntityLock& lock) const;
    static void requireHeld(const EntityLock& lock);

public:
    AccountLedger(proptrade::domain::IAccountStore& store, std::chrono::milliseconds lockTimeout);

    // Bounded wait; check the returned lock before use
    EntityLock lock(const std::string& accountId);

    std::optional<proptrade::domain::AccountState> getAccount(const std::string& accountId) const;
    std::vector<std::string> listAccountIds() const;

    // Found, tradable and owned by userId
    AccountOutcome loadForTrading(const EntityLock& lock, const std::string& userId) const;
    AccountOutcome loadOwned(const EntityLock& lock, const std::string& userId) const;

    // Debits margin + entry fee for a new position
    AccountOutcome applyOpen(const EntityLock& lock, const proptrade::domain::MarginRequirement& requirement);

    AccountOutcome reserve(const EntityLock& lock, double amount);
    proptrade::domain::AccountState releaseReservation(const EntityLock& lock, double amount);

    // Returns released margin and realized net P&L to the account
    proptrade::domain::AccountState settleClose(const EntityLock& lock, double marginReleased, double netPnl);

    proptrade::domain::AccountState resetDaily(const EntityLock& lock);
    proptrade::domain::AccountState markBreached(const EntityLock& lock, const std::string& breachType);
};

} // namespace proptrade::application
