#pragma once

#include "../../domain/interfaces.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace proptrade::infrastructure::store {

// Process-local account table. Record-level serialization is the ledger's job;
// the internal mutex only guards the map itself.
class InMemoryAccountStore : public proptrade::domain::IAccountStore {
private:
    std::unordered_map<std::string, proptrade::domain::AccountState> accounts_;
    mutable std::mutex mutex_;

public:
    InMemoryAccountStore() = default;
    ~InMemoryAccountStore() override = default;

    std::optional<proptrade::domain::AccountState> getAccount(const std::string& accountId) const override;
    void updateAccount(const proptrade::domain::AccountState& account) override;
    std::vector<std::string> listAccountIds() const override;

    size_t size() const;

    // Seed file: array of {accountId, userId, startingBalance, dailyLossLimit, maxDrawdownLimit, status?}
    static std::unique_ptr<InMemoryAccountStore> loadFromFile(const std::string& path);
    static std::unique_ptr<InMemoryAccountStore> loadFromJson(const nlohmann::json& accounts);
    static std::unique_ptr<InMemoryAccountStore> createDemo();
};

} // namespace proptrade::infrastructure::store
