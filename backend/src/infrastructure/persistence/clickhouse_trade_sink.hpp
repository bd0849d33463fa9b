#pragma once

#include "../../domain/interfaces.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

namespace proptrade::infrastructure::persistence {

struct ClickHouseSettings {
    std::string host = "localhost";
    int port = 8123;
    std::string database = "proptrade";
    std::string user = "default";
    std::string password;
    size_t batchSize = 200;
    size_t maxQueued = 100000;
};

// Audit trail over the ClickHouse HTTP interface. record() only enqueues;
// a writer thread drains the queue in JSONEachRow batches.
class ClickHouseTradeEventSink : public proptrade::domain::ITradeEventSink {
private:
    ClickHouseSettings settings_;
    std::atomic<bool> connected_;

    std::deque<proptrade::domain::TradeEvent> queue_;
    std::mutex queueMutex_;
    std::condition_variable queueCond_;
    std::thread writerThread_;
    std::atomic<bool> stopWriter_;
    std::atomic<uint64_t> written_;
    std::atomic<uint64_t> dropped_;

    std::string url() const;
    bool execute(const std::string& sql, const std::string& operation) const;

    void startWriterThread();
    void stopWriterThread();
    void writerLoop();
    void flushBatch(const std::vector<proptrade::domain::TradeEvent>& batch);

public:
    explicit ClickHouseTradeEventSink(ClickHouseSettings settings);
    ~ClickHouseTradeEventSink() override;

    static std::unique_ptr<ClickHouseTradeEventSink> createFromEnvironment();

    static nlohmann::json toRow(const proptrade::domain::TradeEvent& event);
    static std::string buildInsert(const std::string& database,
                                   const std::vector<proptrade::domain::TradeEvent>& batch);

    bool connect();
    bool createTables();
    bool isConnected() const { return connected_; }

    void record(const proptrade::domain::TradeEvent& event) override;

    uint64_t writtenCount() const { return written_; }
    uint64_t droppedCount() const { return dropped_; }
};

} // namespace proptrade::infrastructure::persistence
