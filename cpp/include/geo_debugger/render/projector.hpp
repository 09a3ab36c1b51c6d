#pragma once

#include "../core/figure.hpp"
#include "../core/flags.hpp"
#include "../core/types.hpp"
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace geo_debugger {

// Drawable area in pixels, origin top-left, y pointing down
struct Viewport {
    double width{0.0};
    double height{0.0};
};

struct DrawLabel {
    Vec2 position;
    std::string content;
};

struct DrawPoint {
    Vec2 position;
    bool display_dot{true};
    std::optional<DrawLabel> label;
};

// Infinite line, already clipped to the viewport
struct DrawLine {
    Vec2 a;
    Vec2 b;
    std::optional<DrawLabel> label;
};

struct DrawSegment {
    Vec2 a;
    Vec2 b;
    std::optional<DrawLabel> label;
};

// Ray from its origin to the viewport edge
struct DrawRay {
    Vec2 a;
    Vec2 b;
    std::optional<DrawLabel> label;
};

struct DrawCircle {
    Vec2 center;
    double radius{0.0};
    std::optional<DrawLabel> label;
};

using DrawItem = std::variant<DrawPoint, DrawLine, DrawSegment, DrawRay, DrawCircle>;

struct ProjectedFigure {
    std::vector<DrawItem> items;
};

// Uniform model-to-screen mapping (model y up, screen y down)
struct ScreenTransform {
    double scale{1.0};
    Vec2 model_center;
    Vec2 screen_center;

    [[nodiscard]] Vec2 to_screen(const Vec2& p) const {
        return Vec2{
            screen_center.x + (p.x - model_center.x) * scale,
            screen_center.y - (p.y - model_center.y) * scale
        };
    }
};

// Model-space bounds of everything the figure draws
[[nodiscard]] AABB figure_bounds(const Figure& figure);

// Fit the figure into the viewport, leaving flags.margin padding on each side
[[nodiscard]] ScreenTransform fit_transform(const Figure& figure, const GenerationFlags& flags, const Viewport& viewport);

// Clip the line p + t*d (t in [t_min, +inf)) to the viewport; nullopt if it misses
[[nodiscard]] std::optional<std::pair<Vec2, Vec2>> clip_to_viewport(
    const Vec2& p, const Vec2& d, double t_min, const Viewport& viewport);

// Project a figure to screen-space draw items. Called once per frame; the
// result is never cached, so viewport changes are picked up on the next frame.
[[nodiscard]] ProjectedFigure project(const Figure& figure, const GenerationFlags& flags, const Viewport& viewport);

}  // namespace geo_debugger
