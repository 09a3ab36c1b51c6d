#pragma once

#include "problem.hpp"
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace geo_debugger {

// Raised when a problem definition cannot be loaded.
// line() is 1-based; 0 means the failure is not tied to a line.
class ProblemLoadError : public std::runtime_error {
public:
    ProblemLoadError(size_t line, const std::string& message);

    [[nodiscard]] size_t line() const { return line_; }

private:
    size_t line_;
};

// Parse a problem definition:
//
//   flag <seed|point_bounds|margin|display_dots|label_size> <value>
//   point <name>
//   distance A B <length>
//   angle A B C <degrees>        (vertex B)
//   collinear A B C
//   parallel A B C D
//   perpendicular A B C D
//   on_circle P C R              (P on the circle centered C through R)
//   draw point A ["label"]
//   draw label A "label"
//   draw line|segment|ray A B ["label"]
//   draw circle C R ["label"]
//
// '#' starts a comment.
[[nodiscard]] Problem load_problem(std::string_view text);

[[nodiscard]] Problem load_problem_file(const std::filesystem::path& path);

}  // namespace geo_debugger
