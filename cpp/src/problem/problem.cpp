#include "geo_debugger/problem/problem.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace geo_debugger {

namespace {

// Squared sine of the angle between two directions, 0 when either is degenerate
double sin2_between(const Vec2& u, const Vec2& v) {
    double denom = u.length_squared() * v.length_squared();
    if (denom < Vec2::EPS) return 0.0;
    double c = u.cross(v);
    return (c * c) / denom;
}

double cos2_between(const Vec2& u, const Vec2& v) {
    double denom = u.length_squared() * v.length_squared();
    if (denom < Vec2::EPS) return 0.0;
    double d = u.dot(v);
    return (d * d) / denom;
}

}  // namespace

size_t Rule::rule_arity(RuleType type) {
    switch (type) {
        case RuleType::Distance: return 2;
        case RuleType::Angle: return 3;
        case RuleType::Collinear: return 3;
        case RuleType::Parallel: return 4;
        case RuleType::Perpendicular: return 4;
        case RuleType::OnCircle: return 3;
        default: return 0;
    }
}

size_t Problem::add_point(std::string name) {
    if (find_point(name)) {
        throw std::invalid_argument("Problem::add_point: duplicate point " + name);
    }
    point_names_.push_back(std::move(name));
    return point_names_.size() - 1;
}

void Problem::add_rule(const Rule& rule) {
    for (size_t i = 0; i < rule.arity(); ++i) {
        if (rule.points[i] >= point_names_.size()) {
            throw std::out_of_range(std::string("Problem::add_rule: ") + rule_type_name(rule.type) +
                                    " references an unknown point");
        }
    }
    rules_.push_back(rule);
}

std::optional<size_t> Problem::find_point(const std::string& name) const {
    auto it = std::find(point_names_.begin(), point_names_.end(), name);
    if (it == point_names_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - point_names_.begin());
}

double Problem::error(const std::vector<Vec2>& points) const {
    double total = 0.0;
    for (const auto& rule : rules_) {
        total += rule_error(rule, points);
    }
    return total;
}

double Problem::error(const std::vector<Vec2>& points, std::vector<double>& point_errors) const {
    point_errors.assign(points.size(), 0.0);
    double total = 0.0;
    for (const auto& rule : rules_) {
        double e = rule_error(rule, points);
        total += e;
        for (size_t i = 0; i < rule.arity(); ++i) {
            point_errors[rule.points[i]] += e;
        }
    }
    return total;
}

double rule_error(const Rule& rule, const std::vector<Vec2>& points) {
    const auto& p = rule.points;
    switch (rule.type) {
        case RuleType::Distance: {
            double d = (points[p[1]] - points[p[0]]).length() - rule.value;
            return d * d;
        }
        case RuleType::Angle: {
            Vec2 u = points[p[0]] - points[p[1]];
            Vec2 v = points[p[2]] - points[p[1]];
            if (u.length_squared() < Vec2::EPS || v.length_squared() < Vec2::EPS) {
                // Undefined angle: penalize as if it were as far from target as possible
                double d = std::max(rule.value, PI - rule.value);
                return d * d;
            }
            double theta = std::atan2(std::abs(u.cross(v)), u.dot(v));
            double d = theta - rule.value;
            return d * d;
        }
        case RuleType::Collinear:
            return sin2_between(points[p[1]] - points[p[0]], points[p[2]] - points[p[0]]);
        case RuleType::Parallel:
            return sin2_between(points[p[1]] - points[p[0]], points[p[3]] - points[p[2]]);
        case RuleType::Perpendicular:
            return cos2_between(points[p[1]] - points[p[0]], points[p[3]] - points[p[2]]);
        case RuleType::OnCircle: {
            double d = (points[p[0]] - points[p[1]]).length() - (points[p[2]] - points[p[1]]).length();
            return d * d;
        }
        default:
            return 0.0;
    }
}

const char* rule_type_name(RuleType type) {
    switch (type) {
        case RuleType::Distance: return "distance";
        case RuleType::Angle: return "angle";
        case RuleType::Collinear: return "collinear";
        case RuleType::Parallel: return "parallel";
        case RuleType::Perpendicular: return "perpendicular";
        case RuleType::OnCircle: return "on_circle";
        default: return "unknown";
    }
}

}  // namespace geo_debugger
