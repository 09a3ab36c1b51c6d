#pragma once

#include "../core/figure.hpp"
#include "../core/flags.hpp"
#include "../core/types.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace geo_debugger {

// Rule types understood by the generator
enum class RuleType {
    Distance,       // |P0 P1| == value
    Angle,          // angle P0 P1 P2 (vertex P1) == value radians
    Collinear,      // P0, P1, P2 on one line
    Parallel,       // P0P1 || P2P3
    Perpendicular,  // P0P1 _|_ P2P3
    OnCircle        // |P0 P1| == |P2 P1| (P0 on circle centered P1 through P2)
};

struct Rule {
    RuleType type{RuleType::Distance};
    std::array<size_t, 4> points{};
    double value{0.0};

    [[nodiscard]] size_t arity() const { return rule_arity(type); }

    [[nodiscard]] static size_t rule_arity(RuleType type);
};

// Problem definition: named points, rules over them, drawing template and flags
class Problem {
public:
    Problem() = default;

    // Add a named point; returns its index
    size_t add_point(std::string name);
    void add_rule(const Rule& rule);

    [[nodiscard]] std::optional<size_t> find_point(const std::string& name) const;

    [[nodiscard]] size_t num_points() const { return point_names_.size(); }
    [[nodiscard]] const std::vector<std::string>& point_names() const { return point_names_; }
    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

    [[nodiscard]] const FigureTemplate& figure() const { return figure_; }
    [[nodiscard]] FigureTemplate& figure() { return figure_; }

    [[nodiscard]] const GenerationFlags& flags() const { return flags_; }
    [[nodiscard]] GenerationFlags& flags() { return flags_; }

    // Total rule error for a point set
    [[nodiscard]] double error(const std::vector<Vec2>& points) const;

    // Total error plus each point's share (sum of errors of the rules it takes part in)
    double error(const std::vector<Vec2>& points, std::vector<double>& point_errors) const;

private:
    std::vector<std::string> point_names_;
    std::vector<Rule> rules_;
    FigureTemplate figure_;
    GenerationFlags flags_;
};

// Error of a single rule
[[nodiscard]] double rule_error(const Rule& rule, const std::vector<Vec2>& points);

[[nodiscard]] const char* rule_type_name(RuleType type);

}  // namespace geo_debugger
