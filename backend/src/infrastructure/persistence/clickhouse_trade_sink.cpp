#include "clickhouse_trade_sink.hpp"
#include "../config/engine_config.hpp"
#include <chrono>
#include <iostream>
#include <sstream>
#include <cpr/cpr.h>

namespace proptrade::infrastructure::persistence {

using proptrade::domain::TradeEvent;

ClickHouseTradeEventSink::ClickHouseTradeEventSink(ClickHouseSettings settings)
    : settings_(std::move(settings)), connected_(false), stopWriter_(false), written_(0), dropped_(0) {

    std::cout << "[EventSink] Initializing ClickHouse sink - host: " << settings_.host
              << ", port: " << settings_.port << ", database: " << settings_.database
              << ", user: " << settings_.user << std::endl;

    connected_ = connect() && createTables();
    if (!connected_) {
        std::cout << "[EventSink] ClickHouse unavailable, will retry from the writer thread" << std::endl;
    }

    startWriterThread();
}

ClickHouseTradeEventSink::~ClickHouseTradeEventSink() {
    stopWriterThread();
}

std::unique_ptr<ClickHouseTradeEventSink> ClickHouseTradeEventSink::createFromEnvironment() {
    using proptrade::infrastructure::config::getEnvVar;
    using proptrade::infrastructure::config::getEnvVarInt;

    ClickHouseSettings settings;
    settings.host = getEnvVar("CLICKHOUSE_HOST", settings.host);
    settings.port = getEnvVarInt("CLICKHOUSE_PORT", settings.port);
    settings.database = getEnvVar("CLICKHOUSE_DATABASE", settings.database);
    settings.user = getEnvVar("CLICKHOUSE_USER", settings.user);
    settings.password = getEnvVar("CLICKHOUSE_PASSWORD", settings.password);
    return std::make_unique<ClickHouseTradeEventSink>(std::move(settings));
}

std::string ClickHouseTradeEventSink::url() const {
    return "http://" + settings_.host + ":" + std::to_string(settings_.port);
}

bool ClickHouseTradeEventSink::execute(const std::string& sql, const std::string& operation) const {
    try {
        auto response = cpr::Post(cpr::Url{url()},
                                  cpr::Parameters{{"user", settings_.user}, {"password", settings_.password}},
                                  cpr::Body{sql},
                                  cpr::Timeout{5000});
        if (response.status_code == 200) {
            return true;
        }
        std::cerr << "[EventSink] " << operation << " failed (status: " << response.status_code << "): "
                  << (response.error ? response.error.message : response.text) << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EventSink] " << operation << " exception: " << e.what() << std::endl;
        return false;
    }
}

bool ClickHouseTradeEventSink::connect() {
    try {
        auto response = cpr::Get(cpr::Url{url() + "/ping"}, cpr::Timeout{2000});
        if (response.status_code == 200) {
            std::cout << "[EventSink] HTTP connection successful" << std::endl;
            return true;
        }
        std::cerr << "[EventSink] HTTP connection failed (status: " << response.status_code << ")" << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[EventSink] Connection failed: " << e.what() << std::endl;
        return false;
    }
}

bool ClickHouseTradeEventSink::createTables() {
    if (!execute("CREATE DATABASE IF NOT EXISTS " + settings_.database, "Create database")) {
        return false;
    }

    std::string createEventsTable = R"(
        CREATE TABLE IF NOT EXISTS )" + settings_.database + R"(.trade_events (
            id String,
            type LowCardinality(String),
            account_id String,
            user_id String,
            position_id String,
            order_id String,
            symbol LowCardinality(String),
            side LowCardinality(String),
            quantity Float64,
            price Float64,
            margin Float64,
            fee Float64,
            pnl Float64,
            reason String,
            ts DateTime64(3)
        ) ENGINE = MergeTree()
        ORDER BY (account_id, ts)
        PARTITION BY toYYYYMM(ts)
    )";

    if (!execute(createEventsTable, "Create trade_events table")) {
        return false;
    }
    std::cout << "[EventSink] trade_events table created/checked successfully" << std::endl;
    return true;
}

nlohmann::json ClickHouseTradeEventSink::toRow(const TradeEvent& event) {
    return {
        {"id", event.id},
        {"type", proptrade::domain::toString(event.type)},
        {"account_id", event.accountId},
        {"user_id", event.userId},
        {"position_id", event.positionId},
        {"order_id", event.orderId},
        {"symbol", event.symbol},
        {"side", event.side ? proptrade::domain::toString(*event.side) : ""},
        {"quantity", event.quantity},
        {"price", event.price},
        {"margin", event.margin},
        {"fee", event.fee},
        {"pnl", event.pnl},
        {"reason", event.reason},
        // DateTime64(3) accepts fractional epoch seconds
        {"ts", static_cast<double>(event.timestamp) / 1000.0}
    };
}

std::string ClickHouseTradeEventSink::buildInsert(const std::string& database, const std::vector<TradeEvent>& batch) {
    std::ostringstream sql;
    sql << "INSERT INTO " << database << ".trade_events FORMAT JSONEachRow\n";
    for (const auto& event : batch) {
        sql << toRow(event).dump() << "\n";
    }
    return sql.str();
}

void ClickHouseTradeEventSink::record(const TradeEvent& event) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (queue_.size() >= settings_.maxQueued) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(event);
    }
    queueCond_.notify_one();
}

void ClickHouseTradeEventSink::startWriterThread() {
    stopWriter_ = false;
    writerThread_ = std::thread(&ClickHouseTradeEventSink::writerLoop, this);
    std::cout << "[EventSink] Writer thread started." << std::endl;
}

void ClickHouseTradeEventSink::stopWriterThread() {
    std::cout << "[EventSink] Stopping writer thread..." << std::endl;
    stopWriter_ = true;
    queueCond_.notify_one();
    if (writerThread_.joinable()) {
        writerThread_.join();
        std::cout << "[EventSink] Writer thread stopped." << std::endl;
    }
}

void ClickHouseTradeEventSink::writerLoop() {
    while (true) {
        std::vector<TradeEvent> batch;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCond_.wait_for(lock, std::chrono::seconds(1), [this] { return !queue_.empty() || stopWriter_; });

            if (stopWriter_ && queue_.empty()) {
                break;
            }

            while (!queue_.empty() && batch.size() < settings_.batchSize) {
                batch.push_back(std::move(queue_.front()));
                queue_.pop_front();
            }
        }

        if (!batch.empty()) {
            flushBatch(batch);
        }
    }

    std::cout << "[EventSink] Writer thread exiting, " << written_ << " events written, "
              << dropped_ << " dropped." << std::endl;
}

void ClickHouseTradeEventSink::flushBatch(const std::vector<TradeEvent>& batch) {
    if (!connected_) {
        connected_ = connect() && createTables();
    }
    if (!connected_) {
        std::cerr << "[EventSink] Not connected, dropping " << batch.size() << " events" << std::endl;
        dropped_ += batch.size();
        return;
    }

    if (execute(buildInsert(settings_.database, batch), "Insert trade events")) {
        written_ += batch.size();
    } else {
        dropped_ += batch.size();
        connected_ = false;
    }
}

} // namespace proptrade::infrastructure::persistence
