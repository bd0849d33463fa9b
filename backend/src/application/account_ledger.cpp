#include "account_ledger.hpp"
#include "../utils/format.hpp"
#include <algorithm>
#include <stdexcept>

namespace proptrade::application {

using proptrade::domain::AccountState;
using proptrade::domain::AccountStatus;
using proptrade::domain::RejectCode;
using proptrade::domain::Rejection;
using proptrade::utils::formatFixed;

AccountLedger::AccountLedger(proptrade::domain::IAccountStore& store, std::chrono::milliseconds lockTimeout)
    : store_(store), locks_(lockTimeout) {
}

EntityLock AccountLedger::lock(const std::string& accountId) {
    return locks_.acquire(accountId);
}

void AccountLedger::requireHeld(const EntityLock& lock) {
    if (!lock.owns()) {
        throw std::logic_error("account mutation without holding the account lock: " + lock.id());
    }
}

AccountState AccountLedger::load(const EntityLock& lock) const {
    requireHeld(lock);
    auto account = store_.getAccount(lock.id());
    if (!account) {
        throw std::logic_error("account vanished while locked: " + lock.id());
    }
    return *account;
}

std::optional<AccountState> AccountLedger::getAccount(const std::string& accountId) const {
    return store_.getAccount(accountId);
}

std::vector<std::string> AccountLedger::listAccountIds() const {
    return store_.listAccountIds();
}

AccountOutcome AccountLedger::loadOwned(const EntityLock& lock, const std::string& userId) const {
    requireHeld(lock);
    auto account = store_.getAccount(lock.id());
    if (!account) {
        return Rejection(RejectCode::ACCOUNT_NOT_FOUND, "Account not found");
    }
    if (account->userId != userId) {
        return Rejection(RejectCode::NOT_OWNER, "Account does not belong to user");
    }
    return *account;
}

AccountOutcome AccountLedger::loadForTrading(const EntityLock& lock, const std::string& userId) const {
    requireHeld(lock);
    auto account = store_.getAccount(lock.id());
    if (!account) {
        return Rejection(RejectCode::ACCOUNT_NOT_FOUND, "Account not found");
    }
    if (!account->canTrade()) {
        return Rejection(RejectCode::ACCOUNT_NOT_ACTIVE, "Account not active: " + proptrade::domain::toString(account->status));
    }
    if (account->userId != userId) {
        return Rejection(RejectCode::NOT_OWNER, "Account does not belong to user");
    }
    return *account;
}

AccountOutcome AccountLedger::applyOpen(const EntityLock& lock, const proptrade::domain::MarginRequirement& requirement) {
    AccountState account = load(lock);

    double totalRequired = requirement.totalRequired();
    if (totalRequired > account.availableMargin) {
        return Rejection(RejectCode::INSUFFICIENT_MARGIN,
                         "Insufficient margin: need " + formatFixed(totalRequired) +
                         ", have " + formatFixed(account.availableMargin));
    }

    account.availableMargin -= totalRequired;
    account.totalMarginUsed += requirement.marginRequired;
    account.currentBalance -= requirement.entryFee;
    account.totalTrades += 1;
    account.totalVolume += requirement.notional;

    store_.updateAccount(account);
    return account;
}

AccountOutcome AccountLedger::reserve(const EntityLock& lock, double amount) {
    AccountState account = load(lock);

    if (amount > account.availableMargin) {
        return Rejection(RejectCode::INSUFFICIENT_MARGIN,
                         "Insufficient margin: need " + formatFixed(amount) +
                         ", have " + formatFixed(account.availableMargin));
    }

    account.availableMargin -= amount;
    store_.updateAccount(account);
    return account;
}

AccountState AccountLedger::releaseReservation(const EntityLock& lock, double amount) {
    AccountState account = load(lock);
    account.availableMargin += amount;
    store_.updateAccount(account);
    return account;
}

AccountState AccountLedger::settleClose(const EntityLock& lock, double marginReleased, double netPnl) {
    AccountState account = load(lock);

    account.currentBalance += netPnl;
    account.availableMargin += marginReleased + netPnl;
    account.totalMarginUsed = std::max(0.0, account.totalMarginUsed - marginReleased);
    account.dailyPnl += netPnl;
    account.currentProfit += netPnl;
    account.peakBalance = std::max(account.peakBalance, account.currentBalance);
    if (netPnl > 0.0) {
        account.winningTrades += 1;
    } else if (netPnl < 0.0) {
        account.losingTrades += 1;
    }

    store_.updateAccount(account);
    return account;
}

AccountState AccountLedger::resetDaily(const EntityLock& lock) {
    AccountState account = load(lock);
    account.dailyStartingBalance = account.currentBalance;
    account.dailyPnl = 0.0;
    store_.updateAccount(account);
    return account;
}

AccountState AccountLedger::markBreached(const EntityLock& lock, const std::string& breachType) {
    AccountState account = load(lock);
    account.status = AccountStatus::BREACHED;
    account.breachType = breachType;
    store_.updateAccount(account);
    return account;
}

} // namespace proptrade::application
