#pragma once

#include <cstdint>

namespace geo_debugger {

// Generation flags loaded with the problem definition.
// Immutable once a session starts; shared read-only by the worker and the renderer.
struct GenerationFlags {
    uint64_t seed{42};
    bool point_bounds{false};   // clamp points to the unit square
    double margin{0.1};         // projection padding, fraction of the viewport per side
    bool display_dots{true};
    double label_size{18.0};
};

}  // namespace geo_debugger
