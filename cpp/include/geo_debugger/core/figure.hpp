#pragma once

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace geo_debugger {

struct Label {
    std::string content;

    [[nodiscard]] bool operator==(const Label& other) const = default;
};

// Model-space figure items. Coordinates are resolution independent.
struct PointItem {
    Vec2 position;
    bool display_dot{true};
    std::optional<Label> label;

    [[nodiscard]] bool operator==(const PointItem& other) const = default;
};

// Infinite line through a and b
struct LineItem {
    Vec2 a;
    Vec2 b;
    std::optional<Label> label;

    [[nodiscard]] bool operator==(const LineItem& other) const = default;
};

struct SegmentItem {
    Vec2 a;
    Vec2 b;
    std::optional<Label> label;

    [[nodiscard]] bool operator==(const SegmentItem& other) const = default;
};

struct RayItem {
    Vec2 origin;
    Vec2 through;
    std::optional<Label> label;

    [[nodiscard]] bool operator==(const RayItem& other) const = default;
};

struct CircleItem {
    Vec2 center;
    double radius{0.0};
    std::optional<Label> label;

    [[nodiscard]] bool operator==(const CircleItem& other) const = default;
};

using FigureItem = std::variant<PointItem, LineItem, SegmentItem, RayItem, CircleItem>;

// Abstract figure produced by the engine once per step
struct Figure {
    std::vector<FigureItem> items;

    [[nodiscard]] size_t size() const { return items.size(); }
    [[nodiscard]] bool empty() const { return items.empty(); }

    [[nodiscard]] bool operator==(const Figure& other) const = default;
};

// Drawing directives referencing problem points by index.
// The engine materializes them into a Figure using its current point set.
enum class DirectiveKind {
    Point,
    Line,
    Segment,
    Ray,
    Circle
};

struct Directive {
    DirectiveKind kind{DirectiveKind::Point};
    // Point: {p}, Line/Segment: {a, b}, Ray: {origin, through}, Circle: {center, through}
    std::vector<size_t> points;
    bool display_dot{true};
    std::optional<Label> label;
};

struct FigureTemplate {
    std::vector<Directive> directives;

    [[nodiscard]] size_t size() const { return directives.size(); }
};

// Build a Figure from the template and a point set indexed like the problem points
[[nodiscard]] Figure materialize_template(const FigureTemplate& figure, const std::vector<Vec2>& points);

[[nodiscard]] const char* directive_kind_name(DirectiveKind kind);

}  // namespace geo_debugger
