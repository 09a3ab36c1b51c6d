#pragma once

#include "control_channel.hpp"
#include "figure_slot.hpp"
#include "../core/flags.hpp"
#include "../engine/engine.hpp"
#include "../problem/problem.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include <utility>

namespace geo_debugger {

enum class SessionState {
    Active,       // worker accepts Next
    Terminating,  // Quit sent, worker not joined yet
    Terminated    // worker joined
};

// Handle to one running generation.
//
// Owns the control sender, the shared flags and figure slot, and the worker
// thread. Quit is sent exactly once, from close(), and replaces any queued
// Next: the worker finishes at most the step it is running. The destructor
// closes and joins, so a session never leaks its worker; callers that must
// not wait close() first and destroy the session once finished().
class Session {
public:
    Session(
        EnginePtr engine,
        FigureTemplate figure,
        std::shared_ptr<const GenerationFlags> flags,
        double max_adjustment,
        bool verbose = false
    );

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    // Start a session on the standard adjustment engine
    [[nodiscard]] static std::unique_ptr<Session> start(
        const Problem& problem,
        size_t worker_count,
        double max_adjustment,
        bool verbose = false
    );

    // Send one Next. Returns false (nothing sent) once the session is closed.
    bool request_step();

    // True while a requested step has not produced its figure yet
    [[nodiscard]] bool has_outstanding_step() const;

    [[nodiscard]] uint64_t requested_steps() const { return requested_; }
    [[nodiscard]] uint64_t completed_steps() const { return slot_->completed_steps(); }

    // Send Quit (first call only), dropping queued steps. Does not wait.
    void close();

    // Wait for the worker thread to exit. Closes first if needed.
    void join();

    // Worker loop has returned; join() will not block
    [[nodiscard]] bool finished() const { return worker_done_.load(std::memory_order_acquire); }

    // Process-unique, never reused within a run
    [[nodiscard]] uint64_t id() const { return id_; }

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool closed() const { return state() != SessionState::Active; }

    [[nodiscard]] const GenerationFlags& flags() const { return *flags_; }
    [[nodiscard]] const std::shared_ptr<const GenerationFlags>& shared_flags() const { return flags_; }
    [[nodiscard]] const LatestFigureSlot& slot() const { return *slot_; }

private:
    Session(
        std::pair<ControlSender, ControlReceiver> channel,
        EnginePtr engine,
        FigureTemplate figure,
        std::shared_ptr<const GenerationFlags> flags,
        double max_adjustment,
        bool verbose
    );

    uint64_t id_;
    ControlSender control_;
    std::shared_ptr<const GenerationFlags> flags_;
    std::shared_ptr<LatestFigureSlot> slot_;
    std::atomic<bool> worker_done_{false};
    std::thread worker_;
    uint64_t requested_{0};
    bool quit_sent_{false};
    bool verbose_;
};

}  // namespace geo_debugger
