#include "geo_debugger/render/render_loop.hpp"
#include "geo_debugger/session/session.hpp"
#include <type_traits>
#include <variant>

namespace geo_debugger {

namespace {

void draw_label(const std::optional<DrawLabel>& label, double size, Canvas& canvas) {
    if (label) {
        canvas.text(label->position, label->content, size);
    }
}

}  // namespace

size_t RenderLoop::frame(const Session* session, const Viewport& viewport, Canvas& canvas) {
    if (!session || session->closed()) {
        last_ = FigureSnapshot{};
        last_session_id_ = 0;
        return 0;
    }

    if (session->id() != last_session_id_) {
        last_ = FigureSnapshot{};
        last_session_id_ = session->id();
    }

    // Never wait on the worker: keep last frame's figure if the slot is busy
    if (auto snap = session->slot().try_snapshot()) {
        last_ = std::move(*snap);
    } else {
        ++stale_frames_;
    }

    ProjectedFigure projected = project(last_.figure, session->flags(), viewport);
    return draw(projected, session->flags(), canvas);
}

size_t RenderLoop::draw(const ProjectedFigure& figure, const GenerationFlags& flags, Canvas& canvas) {
    for (const auto& item : figure.items) {
        std::visit([&](const auto& it) {
            using T = std::decay_t<decltype(it)>;
            if constexpr (std::is_same_v<T, DrawPoint>) {
                if (it.display_dot) {
                    canvas.dot(it.position, kDotRadius);
                }
            } else if constexpr (std::is_same_v<T, DrawCircle>) {
                canvas.circle(it.center, it.radius, kStrokeThickness);
            } else {
                canvas.line(it.a, it.b, kStrokeThickness);
            }
            draw_label(it.label, flags.label_size, canvas);
        }, item);
    }
    return figure.items.size();
}

}  // namespace geo_debugger
