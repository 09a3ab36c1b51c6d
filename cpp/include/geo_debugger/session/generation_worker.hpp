#pragma once

#include "control_channel.hpp"
#include "figure_slot.hpp"
#include "../engine/engine.hpp"
#include <memory>

namespace geo_debugger {

// Owns the engine on the worker thread and runs one cycle per Next message
class GenerationWorker {
public:
    GenerationWorker(
        EnginePtr engine,
        ControlReceiver control,
        double max_adjustment,
        FigureTemplate figure,
        std::shared_ptr<LatestFigureSlot> slot,
        bool verbose = false
    );

    GenerationWorker(GenerationWorker&&) noexcept = default;
    GenerationWorker& operator=(GenerationWorker&&) noexcept = default;

    // Receive loop; returns on Quit.
    // A disconnected channel escapes as ChannelDisconnected.
    void run();

private:
    EnginePtr engine_;
    ControlReceiver control_;
    double max_adjustment_;
    FigureTemplate figure_;
    std::shared_ptr<LatestFigureSlot> slot_;
    bool verbose_;
};

}  // namespace geo_debugger
