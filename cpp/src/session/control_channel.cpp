#include "geo_debugger/session/control_channel.hpp"

namespace geo_debugger {

std::pair<ControlSender, ControlReceiver> make_control_channel() {
    auto state = std::make_shared<detail::ChannelState>();
    return {ControlSender(state), ControlReceiver(state)};
}

ControlSender& ControlSender::operator=(ControlSender&& other) noexcept {
    if (this != &other) {
        disconnect();
        state_ = std::move(other.state_);
    }
    return *this;
}

ControlSender::~ControlSender() {
    disconnect();
}

void ControlSender::send(ControlMessage message) {
    if (!state_) {
        throw ChannelDisconnected("ControlSender::send: sender was moved from");
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive) {
            throw ChannelDisconnected("ControlSender::send: receiver disconnected");
        }
        state_->queue.push_back(message);
    }
    state_->cv.notify_one();
}

void ControlSender::preempt(ControlMessage message) {
    if (!state_) {
        throw ChannelDisconnected("ControlSender::preempt: sender was moved from");
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->receiver_alive) {
            throw ChannelDisconnected("ControlSender::preempt: receiver disconnected");
        }
        state_->queue.clear();
        state_->queue.push_back(message);
    }
    state_->cv.notify_one();
}

void ControlSender::disconnect() {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->sender_alive = false;
    }
    state_->cv.notify_all();
    state_.reset();
}

ControlReceiver& ControlReceiver::operator=(ControlReceiver&& other) noexcept {
    if (this != &other) {
        disconnect();
        state_ = std::move(other.state_);
    }
    return *this;
}

ControlReceiver::~ControlReceiver() {
    disconnect();
}

ControlMessage ControlReceiver::recv() {
    if (!state_) {
        throw ChannelDisconnected("ControlReceiver::recv: receiver was moved from");
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return !state_->queue.empty() || !state_->sender_alive; });
    if (state_->queue.empty()) {
        throw ChannelDisconnected("ControlReceiver::recv: sender disconnected");
    }
    ControlMessage message = state_->queue.front();
    state_->queue.pop_front();
    return message;
}

size_t ControlReceiver::pending() const {
    if (!state_) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->queue.size();
}

void ControlReceiver::disconnect() {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->receiver_alive = false;
        state_->queue.clear();
    }
    state_.reset();
}

}  // namespace geo_debugger
