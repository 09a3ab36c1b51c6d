#pragma once

#include "../core/figure.hpp"
#include <atomic>
#include <cstdint>
#include <limits>
#include <mutex>
#include <optional>

namespace geo_debugger {

struct FigureSnapshot {
    Figure figure;
    uint64_t step{0};
    double error{std::numeric_limits<double>::infinity()};
};

// Single-slot hand-off of the latest completed figure.
// The worker replaces the value, the renderer copies it out. The lock is
// held only for the swap or the copy, never across engine or render work.
class LatestFigureSlot {
public:
    LatestFigureSlot() = default;
    LatestFigureSlot(const LatestFigureSlot&) = delete;
    LatestFigureSlot& operator=(const LatestFigureSlot&) = delete;

    // Replace the held snapshot (the previous value is released after unlocking)
    void store(FigureSnapshot snapshot);

    // Copy the held snapshot out
    [[nodiscard]] FigureSnapshot snapshot() const;

    // Copy out without waiting; nullopt when the worker holds the lock
    [[nodiscard]] std::optional<FigureSnapshot> try_snapshot() const;

    // Step of the newest stored snapshot, readable without locking
    [[nodiscard]] uint64_t completed_steps() const {
        return completed_.load(std::memory_order_acquire);
    }

private:
    mutable std::mutex mutex_;
    FigureSnapshot latest_;
    std::atomic<uint64_t> completed_{0};
};

}  // namespace geo_debugger
