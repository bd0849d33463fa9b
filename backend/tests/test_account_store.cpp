#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "infrastructure/store/in_memory_account_store.hpp"
#include <algorithm>

using namespace proptrade::infrastructure::store;
using namespace proptrade::domain;
using Catch::Approx;

TEST_CASE("InMemoryAccountStore - Seeding", "[store]") {
    SECTION("Limits default to 5% and 10% of the starting balance") {
        auto store = InMemoryAccountStore::loadFromJson(nlohmann::json::array({
            {{"accountId", "ACC_1"}, {"userId", "user-1"}, {"startingBalance", 50000.0}},
            {{"accountId", "ACC_2"}, {"userId", "user-2"}, {"startingBalance", 10000.0},
             {"dailyLossLimit", 300.0}, {"status", "step1_passed"}}
        }));

        REQUIRE(store->size() == 2);
        auto first = *store->getAccount("ACC_1");
        REQUIRE(first.dailyLossLimit == Approx(2500.0));
        REQUIRE(first.maxDrawdownLimit == Approx(5000.0));
        REQUIRE(first.availableMargin == Approx(50000.0));
        REQUIRE(first.status == AccountStatus::ACTIVE);

        auto second = *store->getAccount("ACC_2");
        REQUIRE(second.dailyLossLimit == Approx(300.0));
        REQUIRE(second.status == AccountStatus::STEP1_PASSED);
        REQUIRE(second.canTrade());
    }

    SECTION("Malformed seeds throw") {
        REQUIRE_THROWS_AS(InMemoryAccountStore::loadFromJson(nlohmann::json::object()), std::invalid_argument);
        REQUIRE_THROWS_AS(InMemoryAccountStore::loadFromJson(nlohmann::json::array({
            {{"accountId", "ACC_1"}, {"userId", "user-1"}, {"startingBalance", 1000.0}, {"status", "frozen"}}
        })), std::invalid_argument);
        REQUIRE_THROWS(InMemoryAccountStore::loadFromJson(nlohmann::json::array({{{"accountId", "ACC_1"}}})));
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(InMemoryAccountStore::loadFromFile("/nonexistent/accounts.json"), std::runtime_error);
    }

    SECTION("Demo account") {
        auto store = InMemoryAccountStore::createDemo();
        auto demo = store->getAccount("ACC_DEMO_1");
        REQUIRE(demo.has_value());
        REQUIRE(demo->userId == "demo-user-001");
        REQUIRE(demo->currentBalance == Approx(100000.0));
    }
}

TEST_CASE("InMemoryAccountStore - Updates", "[store]") {
    InMemoryAccountStore store;
    AccountState account("ACC_1", "user-1", 1000.0, 50.0, 100.0);
    store.updateAccount(account);

    account.currentBalance = 1200.0;
    store.updateAccount(account);
    store.updateAccount(AccountState("ACC_2", "user-2", 1000.0, 50.0, 100.0));

    REQUIRE(store.getAccount("ACC_1")->currentBalance == Approx(1200.0));
    REQUIRE_FALSE(store.getAccount("ACC_3").has_value());

    auto ids = store.listAccountIds();
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<std::string>{"ACC_1", "ACC_2"});
}
