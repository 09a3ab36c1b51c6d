#include "geo_debugger/render/projector.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace geo_debugger {

namespace {

constexpr double kPointLabelOffset = 6.0;
constexpr double kLineLabelOffset = 8.0;
constexpr double kMinExtent = 1e-9;

std::optional<DrawLabel> make_label(const std::optional<Label>& label, const Vec2& position) {
    if (!label) {
        return std::nullopt;
    }
    return DrawLabel{position, label->content};
}

// Label for a drawn piece: its midpoint pushed off along the normal
std::optional<DrawLabel> piece_label(const std::optional<Label>& label, const Vec2& a, const Vec2& b) {
    if (!label) {
        return std::nullopt;
    }
    Vec2 mid = (a + b) * 0.5;
    Vec2 normal = (b - a).perpendicular().normalized();
    return DrawLabel{mid + normal * kLineLabelOffset, label->content};
}

struct ItemProjector {
    const ScreenTransform& transform;
    const GenerationFlags& flags;
    const Viewport& viewport;
    std::vector<DrawItem>& out;

    void operator()(const PointItem& item) const {
        Vec2 pos = transform.to_screen(item.position);
        out.emplace_back(DrawPoint{
            pos,
            item.display_dot && flags.display_dots,
            make_label(item.label, pos + Vec2{kPointLabelOffset, -kPointLabelOffset})
        });
    }

    void operator()(const LineItem& item) const {
        Vec2 a = transform.to_screen(item.a);
        Vec2 b = transform.to_screen(item.b);
        if ((b - a).length_squared() < kMinExtent) {
            return;
        }
        auto piece = clip_to_viewport(a, b - a, -std::numeric_limits<double>::infinity(), viewport);
        if (!piece) {
            return;
        }
        out.emplace_back(DrawLine{piece->first, piece->second, piece_label(item.label, piece->first, piece->second)});
    }

    void operator()(const SegmentItem& item) const {
        Vec2 a = transform.to_screen(item.a);
        Vec2 b = transform.to_screen(item.b);
        out.emplace_back(DrawSegment{a, b, piece_label(item.label, a, b)});
    }

    void operator()(const RayItem& item) const {
        Vec2 a = transform.to_screen(item.origin);
        Vec2 b = transform.to_screen(item.through);
        if ((b - a).length_squared() < kMinExtent) {
            return;
        }
        auto piece = clip_to_viewport(a, b - a, 0.0, viewport);
        if (!piece) {
            return;
        }
        out.emplace_back(DrawRay{piece->first, piece->second, piece_label(item.label, piece->first, piece->second)});
    }

    void operator()(const CircleItem& item) const {
        Vec2 center = transform.to_screen(item.center);
        double radius = item.radius * transform.scale;
        out.emplace_back(DrawCircle{
            center,
            radius,
            make_label(item.label, center - Vec2{0.0, radius + kPointLabelOffset})
        });
    }
};

}  // namespace

AABB figure_bounds(const Figure& figure) {
    AABB bounds;
    for (const auto& item : figure.items) {
        std::visit([&bounds](const auto& it) {
            using T = std::decay_t<decltype(it)>;
            if constexpr (std::is_same_v<T, PointItem>) {
                bounds.expand(it.position);
            } else if constexpr (std::is_same_v<T, RayItem>) {
                bounds.expand(it.origin);
                bounds.expand(it.through);
            } else if constexpr (std::is_same_v<T, CircleItem>) {
                bounds.expand(it.center - Vec2{it.radius, it.radius});
                bounds.expand(it.center + Vec2{it.radius, it.radius});
            } else {
                bounds.expand(it.a);
                bounds.expand(it.b);
            }
        }, item);
    }
    return bounds;
}

ScreenTransform fit_transform(const Figure& figure, const GenerationFlags& flags, const Viewport& viewport) {
    ScreenTransform transform;
    transform.screen_center = Vec2{viewport.width * 0.5, viewport.height * 0.5};

    AABB bounds = figure_bounds(figure);
    if (bounds.empty()) {
        return transform;
    }
    transform.model_center = bounds.center();

    Vec2 size = bounds.size();
    double avail_w = viewport.width * (1.0 - 2.0 * flags.margin);
    double avail_h = viewport.height * (1.0 - 2.0 * flags.margin);
    double scale = std::numeric_limits<double>::infinity();
    if (size.x > kMinExtent) {
        scale = std::min(scale, avail_w / size.x);
    }
    if (size.y > kMinExtent) {
        scale = std::min(scale, avail_h / size.y);
    }
    if (std::isfinite(scale) && scale > 0.0) {
        transform.scale = scale;
    }
    return transform;
}

std::optional<std::pair<Vec2, Vec2>> clip_to_viewport(
    const Vec2& p, const Vec2& d, double t_min, const Viewport& viewport
) {
    double t0 = t_min;
    double t1 = std::numeric_limits<double>::infinity();

    // Liang-Barsky: each edge constrains den * t <= num
    auto clip_edge = [&t0, &t1](double den, double num) {
        if (std::abs(den) < kMinExtent) {
            return num >= 0.0;
        }
        double r = num / den;
        if (den < 0.0) {
            if (r > t1) return false;
            t0 = std::max(t0, r);
        } else {
            if (r < t0) return false;
            t1 = std::min(t1, r);
        }
        return true;
    };

    if (!clip_edge(-d.x, p.x) ||
        !clip_edge(d.x, viewport.width - p.x) ||
        !clip_edge(-d.y, p.y) ||
        !clip_edge(d.y, viewport.height - p.y)) {
        return std::nullopt;
    }
    if (!std::isfinite(t0) || !std::isfinite(t1) || t1 < t0) {
        return std::nullopt;
    }
    return std::make_pair(p + d * t0, p + d * t1);
}

ProjectedFigure project(const Figure& figure, const GenerationFlags& flags, const Viewport& viewport) {
    ProjectedFigure projected;
    projected.items.reserve(figure.size());

    ScreenTransform transform = fit_transform(figure, flags, viewport);
    ItemProjector projector{transform, flags, viewport, projected.items};
    for (const auto& item : figure.items) {
        std::visit(projector, item);
    }
    return projected;
}

}  // namespace geo_debugger
