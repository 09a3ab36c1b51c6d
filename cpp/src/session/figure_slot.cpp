#include "geo_debugger/session/figure_slot.hpp"
#include <utility>

namespace geo_debugger {

void LatestFigureSlot::store(FigureSnapshot snapshot) {
    uint64_t step = snapshot.step;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::swap(latest_, snapshot);
    }
    completed_.store(step, std::memory_order_release);
}

FigureSnapshot LatestFigureSlot::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::optional<FigureSnapshot> LatestFigureSlot::try_snapshot() const {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }
    return latest_;
}

}  // namespace geo_debugger
