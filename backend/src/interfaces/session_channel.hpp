#pragma once

#include "../domain/interfaces.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

namespace proptrade::interfaces {

// Outbound queue of one transport session. Producers enqueue from any thread;
// the transport drains it and reports a dead session by returning false.
class SessionChannel : public proptrade::domain::IConnectionChannel {
public:
    using Writer = std::function<bool(const std::string& sessionId, const std::string& type, const std::string& payload)>;

private:
    struct Frame {
        std::string type;
        std::string payload;
    };

    std::string sessionId_;
    std::deque<Frame> outbox_;
    size_t bufferedBytes_;
    size_t maxBufferedBytes_;
    mutable std::mutex mutex_;
    std::atomic<bool> closed_;

public:
    SessionChannel(std::string sessionId, size_t maxBufferedBytes);
    ~SessionChannel() override = default;

    const std::string& sessionId() const { return sessionId_; }

    // False once the session is closed or its outbox is full
    bool send(const std::string& type, const std::string& payload) override;
    size_t bufferedAmount() const override;

    // Writes queued frames in order; stops and closes on the first failed write
    size_t drain(const Writer& writer);

    void close() { closed_ = true; }
    bool isClosed() const { return closed_; }
};

} // namespace proptrade::interfaces
