#include "geo_debugger/core/figure.hpp"
#include <stdexcept>
#include <string>

namespace geo_debugger {

namespace {

const Vec2& point_at(const std::vector<Vec2>& points, const Directive& directive, size_t slot) {
    if (slot >= directive.points.size() || directive.points[slot] >= points.size()) {
        throw std::out_of_range(
            std::string("materialize_template: ") + directive_kind_name(directive.kind) +
            " directive references a point outside the point set");
    }
    return points[directive.points[slot]];
}

}  // namespace

Figure materialize_template(const FigureTemplate& figure, const std::vector<Vec2>& points) {
    Figure out;
    out.items.reserve(figure.size());

    for (const auto& directive : figure.directives) {
        switch (directive.kind) {
            case DirectiveKind::Point:
                out.items.emplace_back(PointItem{
                    point_at(points, directive, 0), directive.display_dot, directive.label});
                break;
            case DirectiveKind::Line:
                out.items.emplace_back(LineItem{
                    point_at(points, directive, 0), point_at(points, directive, 1), directive.label});
                break;
            case DirectiveKind::Segment:
                out.items.emplace_back(SegmentItem{
                    point_at(points, directive, 0), point_at(points, directive, 1), directive.label});
                break;
            case DirectiveKind::Ray:
                out.items.emplace_back(RayItem{
                    point_at(points, directive, 0), point_at(points, directive, 1), directive.label});
                break;
            case DirectiveKind::Circle: {
                const Vec2& center = point_at(points, directive, 0);
                const Vec2& through = point_at(points, directive, 1);
                out.items.emplace_back(CircleItem{center, (through - center).length(), directive.label});
                break;
            }
        }
    }

    return out;
}

const char* directive_kind_name(DirectiveKind kind) {
    switch (kind) {
        case DirectiveKind::Point: return "point";
        case DirectiveKind::Line: return "line";
        case DirectiveKind::Segment: return "segment";
        case DirectiveKind::Ray: return "ray";
        case DirectiveKind::Circle: return "circle";
        default: return "unknown";
    }
}

}  // namespace geo_debugger
