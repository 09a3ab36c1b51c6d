#pragma once

#include "projector.hpp"
#include "../session/figure_slot.hpp"
#include <cstddef>
#include <string>

namespace geo_debugger {

class Session;

// Drawing surface the render loop paints on (screen coordinates)
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual void dot(const Vec2& center, double radius) = 0;
    virtual void line(const Vec2& a, const Vec2& b, double thickness) = 0;
    virtual void circle(const Vec2& center, double radius, double thickness) = 0;
    virtual void text(const Vec2& position, const std::string& content, double size) = 0;
};

// Per-frame figure pipeline: read the slot, project, draw.
class RenderLoop {
public:
    static constexpr double kDotRadius = 2.0;
    static constexpr double kStrokeThickness = 1.0;

    // Draw the session's latest figure into the viewport. Returns the number
    // of draw items painted (0 without a session).
    size_t frame(const Session* session, const Viewport& viewport, Canvas& canvas);

    // Paint already projected items
    static size_t draw(const ProjectedFigure& figure, const GenerationFlags& flags, Canvas& canvas);

    // Step of the figure drawn by the last frame
    [[nodiscard]] uint64_t drawn_step() const { return last_.step; }
    [[nodiscard]] double drawn_error() const { return last_.error; }

    // Frames that redrew the previous figure because the slot was busy
    [[nodiscard]] uint64_t stale_frames() const { return stale_frames_; }

private:
    // Last snapshot read from the slot, reused when the slot is busy
    FigureSnapshot last_;
    uint64_t last_session_id_{0};  // 0: none
    uint64_t stale_frames_{0};
};

}  // namespace geo_debugger
