#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace geo_debugger {

enum class ControlMessage {
    Next,  // advance one step
    Quit   // leave the worker loop
};

// The other end of the channel is gone. The session teardown protocol rules
// this out, so it is treated as an internal invariant violation.
class ChannelDisconnected : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

struct ChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<ControlMessage> queue;
    bool sender_alive{true};
    bool receiver_alive{true};
};

}  // namespace detail

class ControlSender;
class ControlReceiver;

// Single-producer single-consumer FIFO of control messages.
// Unbounded: callers bound the number of in-flight Next messages themselves.
[[nodiscard]] std::pair<ControlSender, ControlReceiver> make_control_channel();

// Producer end (UI thread)
class ControlSender {
public:
    ControlSender(ControlSender&& other) noexcept = default;
    ControlSender& operator=(ControlSender&& other) noexcept;
    ControlSender(const ControlSender&) = delete;
    ControlSender& operator=(const ControlSender&) = delete;
    ~ControlSender();

    // Enqueue without waiting for the consumer.
    // Throws ChannelDisconnected if the receiver is gone.
    void send(ControlMessage message);

    // Drop every message still waiting, then enqueue this one.
    // A step already taken by the consumer is not affected.
    // Throws ChannelDisconnected if the receiver is gone.
    void preempt(ControlMessage message);

private:
    friend std::pair<ControlSender, ControlReceiver> make_control_channel();
    explicit ControlSender(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state)) {}

    void disconnect();

    std::shared_ptr<detail::ChannelState> state_;
};

// Consumer end (worker thread)
class ControlReceiver {
public:
    ControlReceiver(ControlReceiver&& other) noexcept = default;
    ControlReceiver& operator=(ControlReceiver&& other) noexcept;
    ControlReceiver(const ControlReceiver&) = delete;
    ControlReceiver& operator=(const ControlReceiver&) = delete;
    ~ControlReceiver();

    // Block until a message arrives.
    // Throws ChannelDisconnected if the queue is empty and the sender is gone.
    [[nodiscard]] ControlMessage recv();

    // Number of messages waiting
    [[nodiscard]] size_t pending() const;

private:
    friend std::pair<ControlSender, ControlReceiver> make_control_channel();
    explicit ControlReceiver(std::shared_ptr<detail::ChannelState> state) : state_(std::move(state)) {}

    void disconnect();

    std::shared_ptr<detail::ChannelState> state_;
};

}  // namespace geo_debugger
