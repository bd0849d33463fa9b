#include "trading_server.hpp"
#include "messages.hpp"
#include "../utils/parser.hpp"
#include <binaryrpc/binaryrpc.hpp>
#include <binaryrpc/core/protocol/msgpack_protocol.hpp>
#include <binaryrpc/core/strategies/linear_backoff.hpp>
#include <binaryrpc/core/util/logger.hpp>
#include <binaryrpc/core/util/qos.hpp>
#include <binaryrpc/transports/websocket/websocket_transport.hpp>
#include <uwebsockets/App.h>
#include <openssl/sha.h>
#include <array>
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <random>
#include <sstream>

namespace proptrade::interfaces {

namespace {

// Connections are identified at the handshake and authenticated later by AUTH.
// A client resuming a session passes back its 32-hex-digit sessionToken.
class EngineHandshakeInspector : public binaryrpc::IHandshakeInspector {
private:
    std::string secret_;
    std::mt19937_64 generator_{std::random_device{}()};
    std::mutex generatorMutex_;

    static std::string urlDecode(const std::string& str) {
        std::string result;
        for (size_t i = 0; i < str.length(); ++i) {
            if (str[i] == '%' && i + 2 < str.length()) {
                int value = 0;
                std::istringstream iss(str.substr(i + 1, 2));
                iss >> std::hex >> value;
                result += static_cast<char>(value);
                i += 2;
            } else if (str[i] == '+') {
                result += ' ';
            } else {
                result += str[i];
            }
        }
        return result;
    }

    static std::optional<std::array<std::uint8_t, 16>> parseHexToken(const std::string& hex) {
        if (hex.size() != 32) {
            return std::nullopt;
        }
        std::array<std::uint8_t, 16> token{};
        for (size_t i = 0; i < token.size(); ++i) {
            unsigned int byte = 0;
            std::istringstream iss(hex.substr(i * 2, 2));
            if (!(iss >> std::hex >> byte)) {
                return std::nullopt;
            }
            token[i] = static_cast<std::uint8_t>(byte);
        }
        return token;
    }

    std::array<std::uint8_t, 16> generateSessionToken(const std::string& clientId, const std::string& deviceId) {
        uint64_t nonce;
        {
            std::lock_guard<std::mutex> lock(generatorMutex_);
            nonce = generator_();
        }
        auto nowMs = proptrade::domain::currentTimeMs();
        std::string raw = clientId + ":" + deviceId + ":" + std::to_string(nowMs) + ":" +
                          std::to_string(nonce) + ":" + secret_;

        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(raw.data()), raw.size(), hash);

        std::array<std::uint8_t, 16> token{};
        for (size_t i = 0; i < token.size(); ++i) {
            token[i] = hash[i];
        }
        return token;
    }

public:
    explicit EngineHandshakeInspector(std::string secret) : secret_(std::move(secret)) {}

    std::optional<binaryrpc::ClientIdentity> extract(uWS::HttpRequest& req) override {
        std::map<std::string, std::string> params;
        std::string query = std::string(req.getQuery());
        std::istringstream stream(query);
        std::string pair;
        while (std::getline(stream, pair, '&')) {
            auto eqPos = pair.find('=');
            if (eqPos != std::string::npos) {
                params[urlDecode(pair.substr(0, eqPos))] = urlDecode(pair.substr(eqPos + 1));
            }
        }

        std::string clientId = params["clientId"];
        if (clientId.empty()) {
            std::lock_guard<std::mutex> lock(generatorMutex_);
            clientId = "client-" + std::to_string(generator_() % 1000000000ULL);
        }
        std::string deviceId = params["deviceId"];
        if (deviceId.empty()) {
            deviceId = std::string(req.getHeader("x-device-id"));
        }

        binaryrpc::ClientIdentity identity;
        identity.clientId = clientId;
        identity.deviceId = static_cast<int>(std::hash<std::string>{}(deviceId.empty() ? clientId : deviceId) % 1000000);

        auto resumed = parseHexToken(params["sessionToken"]);
        identity.sessionToken = resumed ? *resumed : generateSessionToken(clientId, deviceId);
        return identity;
    }

    bool authorize(const binaryrpc::ClientIdentity&, const uWS::HttpRequest&) override {
        return true;
    }

    std::string rejectReason() const override {
        return "Handshake rejected";
    }
};

} // namespace

TradingServer::TradingServer(TradingEngine& engine, std::string host, uint16_t port, std::string sessionSecret)
    : engine_(engine), app_(nullptr), host_(std::move(host)), port_(port),
      sessionSecret_(std::move(sessionSecret)), running_(false) {
}

TradingServer::~TradingServer() {
    stop();
}

bool TradingServer::initialize() {
    try {
        binaryrpc::Logger::inst().setLevel(binaryrpc::LogLevel::Error);

        app_ = &binaryrpc::App::getInstance();
        auto& sessionManager = app_->getSessionManager();

        // Ping every 30 s, frames up to 5 MB
        auto transport = std::make_unique<binaryrpc::WebSocketTransport>(sessionManager, 30, 5 * 1024 * 1024);
        transport->setHandshakeInspector(std::make_shared<EngineHandshakeInspector>(sessionSecret_));

        binaryrpc::ReliableOptions opts;
        opts.level = binaryrpc::QoSLevel::AtLeastOnce;
        opts.baseRetryMs = 100;
        opts.maxRetry = 5;
        opts.maxBackoffMs = 2000;
        opts.sessionTtlMs = 30000;
        opts.backoffStrategy = std::make_shared<binaryrpc::LinearBackoff>(
            std::chrono::milliseconds(opts.baseRetryMs),
            std::chrono::milliseconds(opts.maxBackoffMs)
        );
        transport->setReliable(opts);

        app_->setProtocol(std::make_unique<binaryrpc::MsgPackProtocol>());
        app_->setTransport(std::move(transport));

        setupMiddleware();
        setupHandlers();

        std::cout << "[TradingServer] Initialized - QoS AtLeastOnce, MsgPack protocol, "
                  << inboundMessageTypes().size() << " message types" << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[TradingServer] Failed to initialize: " << e.what() << std::endl;
        return false;
    }
}

void TradingServer::setupMiddleware() {
    app_->use([this](binaryrpc::Session& session, const std::string&, std::vector<uint8_t>&, binaryrpc::NextFunc next) {
        ensureConnection(session.id());
        next();
    });
}

void TradingServer::setupHandlers() {
    for (const auto& type : inboundMessageTypes()) {
        app_->registerRPC(type, [this, type](const std::vector<uint8_t>& data, binaryrpc::RpcContext& context) {
            handleMessage(type, data, context);
        });
    }
}

void TradingServer::ensureConnection(const std::string& sessionId) {
    std::shared_ptr<SessionChannel> channel;
    {
        std::lock_guard<std::mutex> lock(channelsMutex_);
        auto it = channels_.find(sessionId);
        if (it != channels_.end() && !it->second->isClosed()) {
            return;
        }
        channel = std::make_shared<SessionChannel>(sessionId, engine_.config().maxBufferedAmount);
        channels_[sessionId] = channel;
    }
    engine_.connections().addConnection(sessionId, channel);
    std::cout << "[TradingServer] Session connected: " << sessionId << std::endl;
}

void TradingServer::handleMessage(const std::string& type, const std::vector<uint8_t>& data, binaryrpc::RpcContext& context) {
    try {
        std::string sessionId = context.session().id();
        ensureConnection(sessionId);

        auto payload = proptrade::utils::parsePayload(data);
        if (!payload) {
            reply(context, "ERROR", outbound::error("Invalid message format"));
            return;
        }

        auto response = engine_.dispatcher().dispatch(sessionId, type, *payload, proptrade::domain::currentTimeMs());
        if (!response.is_null()) {
            reply(context, response.value("type", type), response);
        }
    } catch (const std::exception& e) {
        std::cerr << "[TradingServer] Error handling " << type << ": " << e.what() << std::endl;
        reply(context, "ERROR", outbound::error("Internal server error"));
    }
}

void TradingServer::reply(binaryrpc::RpcContext& context, const std::string& type, const nlohmann::json& message) {
    std::string body = message.dump();
    std::vector<uint8_t> bytes(body.begin(), body.end());
    context.reply(app_->getProtocol()->serialize(type, bytes));
}

void TradingServer::drainOutboxes() {
    std::vector<std::shared_ptr<SessionChannel>> channels;
    {
        std::lock_guard<std::mutex> lock(channelsMutex_);
        channels.reserve(channels_.size());
        for (const auto& [id, channel] : channels_) {
            channels.push_back(channel);
        }
    }

    auto& api = app_->getFrameworkApi();
    SessionChannel::Writer writer = [this, &api](const std::string& sessionId,
                                                 const std::string& type,
                                                 const std::string& payload) {
        std::vector<uint8_t> bytes(payload.begin(), payload.end());
        return api.sendTo(sessionId, app_->getProtocol()->serialize(type, bytes));
    };

    for (const auto& channel : channels) {
        if (channel->bufferedAmount() > 0) {
            channel->drain(writer);
        }
        if (channel->isClosed()) {
            engine_.connections().removeConnection(channel->sessionId());
            std::lock_guard<std::mutex> lock(channelsMutex_);
            auto it = channels_.find(channel->sessionId());
            if (it != channels_.end() && it->second == channel) {
                channels_.erase(it);
            }
            std::cout << "[TradingServer] Session closed: " << channel->sessionId() << std::endl;
        }
    }
}

void TradingServer::outboxLoop() {
    while (running_) {
        try {
            drainOutboxes();
        } catch (const std::exception& e) {
            std::cerr << "[TradingServer] Outbox error: " << e.what() << std::endl;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(OUTBOX_INTERVAL_MS));
    }
}

void TradingServer::start() {
    if (!app_) {
        std::cerr << "[TradingServer] Not initialized. Call initialize() first." << std::endl;
        return;
    }

    running_ = true;
    engine_.startWorkers();
    outboxThread_ = std::thread(&TradingServer::outboxLoop, this);

    std::cout << "[TradingServer] Listening on " << host_ << ":" << port_ << std::endl;
    try {
        app_->run(port_);
    } catch (const std::exception& e) {
        std::cerr << "[TradingServer] Failed to run transport: " << e.what() << std::endl;
        running_ = false;
    }

    while (running_) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    std::cout << "[TradingServer] Server stopped" << std::endl;
}

void TradingServer::stop() {
    bool wasRunning = running_.exchange(false);
    if (outboxThread_.joinable()) {
        outboxThread_.join();
    }
    engine_.stopWorkers();
    if (app_ && wasRunning) {
        app_->stop();
    }
}

} // namespace proptrade::interfaces
