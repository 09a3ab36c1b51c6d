#pragma once

#include "../core/figure.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace geo_debugger {

class Engine;

// Unique pointer alias for engines
using EnginePtr = std::unique_ptr<Engine>;

// Adjustment magnitudes baked once per session, one per candidate worker
using Magnitudes = std::vector<double>;

// Figure generator driven one cycle at a time.
// Engine state is owned by a single thread; implementations need no locking.
class Engine {
public:
    virtual ~Engine() = default;

    // Precompute adjustment magnitudes (called once before the first cycle)
    [[nodiscard]] virtual Magnitudes bake_magnitudes(double max_adjustment) const = 0;

    // Apply one refinement step in-place
    virtual void cycle(const Magnitudes& magnitudes) = 0;

    // Build a figure snapshot from the current state
    [[nodiscard]] virtual Figure materialize(const FigureTemplate& figure) const = 0;

    // Current total error (lower is better)
    [[nodiscard]] virtual double error() const = 0;

    // Number of cycles applied so far
    [[nodiscard]] virtual uint64_t iteration() const = 0;

    // Clone engine (deep copy)
    [[nodiscard]] virtual EnginePtr clone() const = 0;
};

}  // namespace geo_debugger
