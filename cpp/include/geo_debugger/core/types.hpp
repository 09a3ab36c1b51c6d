#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

namespace geo_debugger {

// 2D vector in model or screen space
struct Vec2 {
    double x{0.0};
    double y{0.0};

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    [[nodiscard]] constexpr Vec2 operator+(const Vec2& other) const {
        return Vec2{x + other.x, y + other.y};
    }

    [[nodiscard]] constexpr Vec2 operator-(const Vec2& other) const {
        return Vec2{x - other.x, y - other.y};
    }

    [[nodiscard]] constexpr Vec2 operator*(double scalar) const {
        return Vec2{x * scalar, y * scalar};
    }

    [[nodiscard]] constexpr Vec2 operator/(double scalar) const {
        return Vec2{x / scalar, y / scalar};
    }

    constexpr Vec2& operator+=(const Vec2& other) {
        x += other.x;
        y += other.y;
        return *this;
    }

    [[nodiscard]] constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    [[nodiscard]] constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    [[nodiscard]] constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    [[nodiscard]] double length() const {
        return std::sqrt(x * x + y * y);
    }

    [[nodiscard]] constexpr double length_squared() const {
        return x * x + y * y;
    }

    [[nodiscard]] Vec2 normalized() const {
        double len = length();
        if (len < EPS) return Vec2{0.0, 0.0};
        return Vec2{x / len, y / len};
    }

    [[nodiscard]] constexpr Vec2 perpendicular() const {
        return Vec2{-y, x};
    }

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    static constexpr double EPS = 1e-12;
};

[[nodiscard]] inline constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

// Axis-aligned bounding box
struct AABB {
    Vec2 min{std::numeric_limits<double>::max(), std::numeric_limits<double>::max()};
    Vec2 max{std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};

    constexpr AABB() = default;
    constexpr AABB(const Vec2& min_, const Vec2& max_) : min(min_), max(max_) {}

    void expand(const Vec2& point) {
        min.x = std::min(min.x, point.x);
        min.y = std::min(min.y, point.y);
        max.x = std::max(max.x, point.x);
        max.y = std::max(max.y, point.y);
    }

    [[nodiscard]] bool empty() const {
        return min.x > max.x || min.y > max.y;
    }

    [[nodiscard]] Vec2 center() const {
        return Vec2{(min.x + max.x) * 0.5, (min.y + max.y) * 0.5};
    }

    [[nodiscard]] Vec2 size() const {
        return Vec2{max.x - min.x, max.y - min.y};
    }

    [[nodiscard]] bool contains(const Vec2& point) const {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y;
    }
};

// Common constants
constexpr double PI = 3.14159265358979323846;

}  // namespace geo_debugger
