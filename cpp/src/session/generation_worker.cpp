#include "geo_debugger/session/generation_worker.hpp"
#include <iostream>
#include <stdexcept>

namespace geo_debugger {

GenerationWorker::GenerationWorker(
    EnginePtr engine,
    ControlReceiver control,
    double max_adjustment,
    FigureTemplate figure,
    std::shared_ptr<LatestFigureSlot> slot,
    bool verbose
)
    : engine_(std::move(engine))
    , control_(std::move(control))
    , max_adjustment_(max_adjustment)
    , figure_(std::move(figure))
    , slot_(std::move(slot))
    , verbose_(verbose)
{
    if (!engine_) {
        throw std::invalid_argument("GenerationWorker: engine is null");
    }
    if (!slot_) {
        throw std::invalid_argument("GenerationWorker: figure slot is null");
    }
}

void GenerationWorker::run() {
    const Magnitudes magnitudes = engine_->bake_magnitudes(max_adjustment_);
    if (verbose_) {
        std::cout << "[GenerationWorker] started, " << magnitudes.size()
                  << " magnitudes up to " << max_adjustment_ << "\n";
    }

    uint64_t steps = 0;
    while (true) {
        switch (control_.recv()) {
            case ControlMessage::Quit:
                if (verbose_) {
                    std::cout << "[GenerationWorker] quit after " << steps << " steps\n";
                }
                return;
            case ControlMessage::Next: {
                engine_->cycle(magnitudes);
                FigureSnapshot snap;
                snap.figure = engine_->materialize(figure_);
                snap.step = ++steps;
                snap.error = engine_->error();
                slot_->store(std::move(snap));
                break;
            }
        }
    }
}

}  // namespace geo_debugger
