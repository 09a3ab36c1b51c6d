#include "geo_debugger/session/session.hpp"
#include "geo_debugger/engine/adjustment_engine.hpp"
#include "geo_debugger/session/generation_worker.hpp"
#include <iostream>
#include <stdexcept>

namespace geo_debugger {

namespace {

std::atomic<uint64_t> next_session_id{1};

}  // namespace

Session::Session(
    EnginePtr engine,
    FigureTemplate figure,
    std::shared_ptr<const GenerationFlags> flags,
    double max_adjustment,
    bool verbose
)
    : Session(make_control_channel(), std::move(engine), std::move(figure), std::move(flags), max_adjustment, verbose)
{}

Session::Session(
    std::pair<ControlSender, ControlReceiver> channel,
    EnginePtr engine,
    FigureTemplate figure,
    std::shared_ptr<const GenerationFlags> flags,
    double max_adjustment,
    bool verbose
)
    : id_(next_session_id.fetch_add(1, std::memory_order_relaxed))
    , control_(std::move(channel.first))
    , flags_(std::move(flags))
    , slot_(std::make_shared<LatestFigureSlot>())
    , verbose_(verbose)
{
    if (!flags_) {
        throw std::invalid_argument("Session: flags are null");
    }

    GenerationWorker worker(
        std::move(engine),
        std::move(channel.second),
        max_adjustment,
        std::move(figure),
        slot_,
        verbose_
    );
    worker_ = std::thread([this, worker = std::move(worker)]() mutable {
        worker.run();
        worker_done_.store(true, std::memory_order_release);
    });

    if (verbose_) {
        std::cout << "[Session] started (max adjustment " << max_adjustment << ")\n";
    }
}

Session::~Session() {
    join();
}

std::unique_ptr<Session> Session::start(
    const Problem& problem,
    size_t worker_count,
    double max_adjustment,
    bool verbose
) {
    auto shared_problem = std::make_shared<const Problem>(problem);
    auto flags = std::make_shared<const GenerationFlags>(problem.flags());
    auto engine = std::make_unique<AdjustmentEngine>(shared_problem, worker_count, verbose);
    return std::make_unique<Session>(
        std::move(engine),
        problem.figure(),
        std::move(flags),
        max_adjustment,
        verbose
    );
}

bool Session::request_step() {
    if (quit_sent_) {
        return false;
    }
    control_.send(ControlMessage::Next);
    ++requested_;
    return true;
}

bool Session::has_outstanding_step() const {
    return slot_->completed_steps() < requested_;
}

void Session::close() {
    if (quit_sent_) {
        return;
    }
    quit_sent_ = true;
    control_.preempt(ControlMessage::Quit);
    if (verbose_) {
        std::cout << "[Session] quit sent after " << requested_ << " requested steps\n";
    }
}

void Session::join() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

SessionState Session::state() const {
    if (!quit_sent_) {
        return SessionState::Active;
    }
    return worker_.joinable() ? SessionState::Terminating : SessionState::Terminated;
}

}  // namespace geo_debugger
