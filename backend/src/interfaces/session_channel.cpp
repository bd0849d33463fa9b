#include "session_channel.hpp"
#include <iostream>

namespace proptrade::interfaces {

SessionChannel::SessionChannel(std::string sessionId, size_t maxBufferedBytes)
    : sessionId_(std::move(sessionId)), bufferedBytes_(0), maxBufferedBytes_(maxBufferedBytes), closed_(false) {
}

bool SessionChannel::send(const std::string& type, const std::string& payload) {
    if (closed_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // Hard cap well above the broadcast threshold; a client this far behind is gone
    if (bufferedBytes_ + payload.size() > maxBufferedBytes_ * 4) {
        std::cerr << "[SessionChannel] Outbox overflow for session " << sessionId_ << std::endl;
        closed_ = true;
        return false;
    }
    bufferedBytes_ += payload.size();
    outbox_.push_back({type, payload});
    return true;
}

size_t SessionChannel::bufferedAmount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bufferedBytes_;
}

size_t SessionChannel::drain(const Writer& writer) {
    std::deque<Frame> frames;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frames.swap(outbox_);
        bufferedBytes_ = 0;
    }

    size_t written = 0;
    for (const auto& frame : frames) {
        if (closed_ || !writer(sessionId_, frame.type, frame.payload)) {
            closed_ = true;
            break;
        }
        ++written;
    }
    return written;
}

} // namespace proptrade::interfaces
