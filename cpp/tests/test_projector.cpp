#include <catch2/catch.hpp>
#include "geo_debugger/render/projector.hpp"
#include <cmath>
#include <limits>

using namespace geo_debugger;
using Catch::Detail::Approx;

namespace {

// Model bounds (0,0)-(2,1); on a 1000x500 viewport with margin 0.1 the
// scale is 400 and the model center (1, 0.5) lands on (500, 250).
Figure framed_figure() {
    Figure figure;
    figure.items.emplace_back(PointItem{Vec2(0.0, 0.0), true, Label{"O"}});
    figure.items.emplace_back(PointItem{Vec2(2.0, 1.0), true, std::nullopt});
    return figure;
}

void require_near(const Vec2& actual, const Vec2& expected) {
    REQUIRE(actual.x == Approx(expected.x).margin(1e-9));
    REQUIRE(actual.y == Approx(expected.y).margin(1e-9));
}

}  // namespace

TEST_CASE("Fit transform", "[projector]") {
    GenerationFlags flags;
    Viewport viewport{1000.0, 500.0};

    SECTION("Fits the figure inside the margins") {
        ScreenTransform t = fit_transform(framed_figure(), flags, viewport);
        REQUIRE(t.scale == Approx(400.0));
        require_near(t.to_screen(Vec2(0.0, 0.0)), Vec2(100.0, 450.0));
        require_near(t.to_screen(Vec2(2.0, 1.0)), Vec2(900.0, 50.0));
        require_near(t.to_screen(Vec2(1.0, 0.5)), Vec2(500.0, 250.0));
    }

    SECTION("Model y points up") {
        ScreenTransform t = fit_transform(framed_figure(), flags, viewport);
        REQUIRE(t.to_screen(Vec2(0.0, 1.0)).y < t.to_screen(Vec2(0.0, 0.0)).y);
    }

    SECTION("Margin flag") {
        flags.margin = 0.0;
        ScreenTransform t = fit_transform(framed_figure(), flags, viewport);
        REQUIRE(t.scale == Approx(500.0));
    }

    SECTION("Empty figure") {
        ScreenTransform t = fit_transform(Figure{}, flags, viewport);
        REQUIRE(t.scale == 1.0);
        require_near(t.screen_center, Vec2(500.0, 250.0));
    }

    SECTION("Single point is centered") {
        Figure figure;
        figure.items.emplace_back(PointItem{Vec2(3.0, -7.0), true, std::nullopt});
        ScreenTransform t = fit_transform(figure, flags, viewport);
        REQUIRE(std::isfinite(t.scale));
        require_near(t.to_screen(Vec2(3.0, -7.0)), Vec2(500.0, 250.0));
    }

    SECTION("Circles count with their radius") {
        Figure figure;
        figure.items.emplace_back(CircleItem{Vec2(0.0, 0.0), 1.0, std::nullopt});
        AABB bounds = figure_bounds(figure);
        REQUIRE(bounds.min == Vec2(-1.0, -1.0));
        REQUIRE(bounds.max == Vec2(1.0, 1.0));
    }
}

TEST_CASE("Viewport clipping", "[projector]") {
    Viewport viewport{100.0, 50.0};
    constexpr double kInf = std::numeric_limits<double>::infinity();

    SECTION("Infinite line spans the viewport") {
        auto piece = clip_to_viewport(Vec2(10.0, 25.0), Vec2(1.0, 0.0), -kInf, viewport);
        REQUIRE(piece.has_value());
        require_near(piece->first, Vec2(0.0, 25.0));
        require_near(piece->second, Vec2(100.0, 25.0));
    }

    SECTION("Diagonal line") {
        auto piece = clip_to_viewport(Vec2(0.0, 0.0), Vec2(1.0, 1.0), -kInf, viewport);
        REQUIRE(piece.has_value());
        require_near(piece->first, Vec2(0.0, 0.0));
        require_near(piece->second, Vec2(50.0, 50.0));
    }

    SECTION("Ray starts at its origin") {
        auto piece = clip_to_viewport(Vec2(40.0, 10.0), Vec2(0.0, 2.0), 0.0, viewport);
        REQUIRE(piece.has_value());
        require_near(piece->first, Vec2(40.0, 10.0));
        require_near(piece->second, Vec2(40.0, 50.0));
    }

    SECTION("Ray pointing away misses") {
        REQUIRE_FALSE(clip_to_viewport(Vec2(-10.0, 10.0), Vec2(-1.0, 0.0), 0.0, viewport));
    }

    SECTION("Line outside misses") {
        REQUIRE_FALSE(clip_to_viewport(Vec2(0.0, -5.0), Vec2(1.0, 0.0), -kInf, viewport));
    }
}

TEST_CASE("Project figure", "[projector]") {
    GenerationFlags flags;
    Viewport viewport{1000.0, 500.0};

    SECTION("Points and labels") {
        ProjectedFigure projected = project(framed_figure(), flags, viewport);
        REQUIRE(projected.items.size() == 2);

        const auto& origin = std::get<DrawPoint>(projected.items[0]);
        require_near(origin.position, Vec2(100.0, 450.0));
        REQUIRE(origin.display_dot);
        REQUIRE(origin.label.has_value());
        REQUIRE(origin.label->content == "O");
        require_near(origin.label->position, Vec2(106.0, 444.0));

        REQUIRE_FALSE(std::get<DrawPoint>(projected.items[1]).label.has_value());
    }

    SECTION("Dots can be switched off") {
        flags.display_dots = false;
        ProjectedFigure projected = project(framed_figure(), flags, viewport);
        REQUIRE_FALSE(std::get<DrawPoint>(projected.items[0]).display_dot);
    }

    SECTION("Lines are clipped, segments are not") {
        Figure figure = framed_figure();
        figure.items.emplace_back(LineItem{Vec2(0.0, 0.5), Vec2(2.0, 0.5), std::nullopt});
        figure.items.emplace_back(SegmentItem{Vec2(0.0, 0.0), Vec2(2.0, 1.0), Label{"s"}});
        figure.items.emplace_back(RayItem{Vec2(1.0, 0.5), Vec2(2.0, 0.5), std::nullopt});

        ProjectedFigure projected = project(figure, flags, viewport);
        REQUIRE(projected.items.size() == 5);

        const auto& line = std::get<DrawLine>(projected.items[2]);
        require_near(line.a, Vec2(0.0, 250.0));
        require_near(line.b, Vec2(1000.0, 250.0));

        const auto& segment = std::get<DrawSegment>(projected.items[3]);
        require_near(segment.a, Vec2(100.0, 450.0));
        require_near(segment.b, Vec2(900.0, 50.0));
        REQUIRE(segment.label.has_value());
        REQUIRE((segment.label->position - Vec2(500.0, 250.0)).length() == Approx(8.0));

        const auto& ray = std::get<DrawRay>(projected.items[4]);
        require_near(ray.a, Vec2(500.0, 250.0));
        require_near(ray.b, Vec2(1000.0, 250.0));
    }

    SECTION("Degenerate lines and rays are dropped") {
        Figure figure = framed_figure();
        figure.items.emplace_back(LineItem{Vec2(1.0, 1.0), Vec2(1.0, 1.0), std::nullopt});
        figure.items.emplace_back(RayItem{Vec2(0.5, 0.5), Vec2(0.5, 0.5), std::nullopt});

        ProjectedFigure projected = project(figure, flags, viewport);
        REQUIRE(projected.items.size() == 2);
    }

    SECTION("Circles scale with the figure") {
        Figure figure = framed_figure();
        figure.items.emplace_back(CircleItem{Vec2(1.0, 0.5), 0.5, Label{"k"}});

        ProjectedFigure projected = project(figure, flags, viewport);
        const auto& circle = std::get<DrawCircle>(projected.items[2]);
        require_near(circle.center, Vec2(500.0, 250.0));
        REQUIRE(circle.radius == Approx(200.0));
        REQUIRE(circle.label.has_value());
        require_near(circle.label->position, Vec2(500.0, 44.0));
    }

    SECTION("Viewport changes take effect immediately") {
        Figure figure = framed_figure();
        ProjectedFigure small = project(figure, flags, viewport);
        ProjectedFigure large = project(figure, flags, Viewport{2000.0, 1000.0});

        require_near(std::get<DrawPoint>(small.items[1]).position, Vec2(900.0, 50.0));
        require_near(std::get<DrawPoint>(large.items[1]).position, Vec2(1800.0, 100.0));
    }

    SECTION("Empty figure projects to nothing") {
        REQUIRE(project(Figure{}, flags, viewport).items.empty());
    }
}
