#include "in_memory_account_store.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace proptrade::infrastructure::store {

using proptrade::domain::AccountState;

std::optional<AccountState> InMemoryAccountStore::getAccount(const std::string& accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(accountId);
    if (it == accounts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryAccountStore::updateAccount(const AccountState& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts_[account.accountId] = account;
}

std::vector<std::string> InMemoryAccountStore::listAccountIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(accounts_.size());
    for (const auto& [id, account] : accounts_) {
        ids.push_back(id);
    }
    return ids;
}

size_t InMemoryAccountStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

std::unique_ptr<InMemoryAccountStore> InMemoryAccountStore::loadFromJson(const nlohmann::json& accounts) {
    if (!accounts.is_array()) {
        throw std::invalid_argument("account seed must be a JSON array");
    }

    auto store = std::make_unique<InMemoryAccountStore>();
    for (const auto& entry : accounts) {
        double balance = entry.at("startingBalance").get<double>();
        AccountState account(entry.at("accountId").get<std::string>(),
                             entry.at("userId").get<std::string>(),
                             balance,
                             entry.value("dailyLossLimit", balance * 0.05),
                             entry.value("maxDrawdownLimit", balance * 0.10));

        auto status = proptrade::domain::parseAccountStatus(entry.value("status", std::string("active")));
        if (!status) {
            throw std::invalid_argument("unknown account status for " + account.accountId);
        }
        account.status = *status;
        store->updateAccount(account);
    }
    return store;
}

std::unique_ptr<InMemoryAccountStore> InMemoryAccountStore::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open accounts file: " + path);
    }

    nlohmann::json accounts = nlohmann::json::parse(file);
    auto store = loadFromJson(accounts);
    std::cout << "[AccountStore] Loaded " << store->size() << " accounts from " << path << std::endl;
    return store;
}

std::unique_ptr<InMemoryAccountStore> InMemoryAccountStore::createDemo() {
    auto store = std::make_unique<InMemoryAccountStore>();
    store->updateAccount(AccountState("ACC_DEMO_1", "demo-user-001", 100000.0, 5000.0, 10000.0));
    std::cout << "[AccountStore] Seeded demo account ACC_DEMO_1 for demo-user-001" << std::endl;
    return store;
}

} // namespace proptrade::infrastructure::store
