#pragma once

#include "session_channel.hpp"
#include "trading_engine.hpp"
#include <binaryrpc/core/app.hpp>
#include <binaryrpc/core/framework_api.hpp>
#include <binaryrpc/core/rpc/rpc_context.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace proptrade::interfaces {

// WebSocket front end over binaryrpc. Each inbound message type is one RPC
// method; pushes are queued per session and written by the outbox thread.
class TradingServer {
private:
    TradingEngine& engine_;
    binaryrpc::App* app_;

    std::string host_;
    uint16_t port_;
    std::string sessionSecret_;

    std::unordered_map<std::string, std::shared_ptr<SessionChannel>> channels_;
    std::mutex channelsMutex_;

    std::thread outboxThread_;
    std::atomic<bool> running_;

    void setupMiddleware();
    void setupHandlers();

    void ensureConnection(const std::string& sessionId);
    void handleMessage(const std::string& type, const std::vector<uint8_t>& data, binaryrpc::RpcContext& context);
    void reply(binaryrpc::RpcContext& context, const std::string& type, const nlohmann::json& message);

    void outboxLoop();
    void drainOutboxes();

public:
    static constexpr int OUTBOX_INTERVAL_MS = 5;

    TradingServer(TradingEngine& engine, std::string host, uint16_t port, std::string sessionSecret);
    ~TradingServer();

    TradingServer(const TradingServer&) = delete;
    TradingServer& operator=(const TradingServer&) = delete;

    bool initialize();
    // Blocks until stop()
    void start();
    void stop();
};

} // namespace proptrade::interfaces
