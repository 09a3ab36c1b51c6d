#pragma once

#include <string>

namespace geo_debugger {

// Application defaults; the command line may override the start form values
struct DebuggerConfig {
    int window_width = 1280;
    int window_height = 720;
    std::string window_title = "Geo Debugger";
    float panel_width = 300.0f;      // right-hand strip kept free of the figure
    int frame_interval_ms = 16;
    std::string font_path = "cpp/apps/DejaVuSansMono.ttf";
    float font_size = 18.0f;

    std::string problem_file;
    std::string worker_count = "512";
    std::string max_adjustment = "0.5";
    bool verbose = false;
};

// geo_debugger [--verbose] [--workers N] [--max-adjustment X] [problem.geo]
// Throws std::invalid_argument on unknown options or missing values.
[[nodiscard]] DebuggerConfig parse_debugger_args(int argc, const char* const* argv);

[[nodiscard]] std::string debugger_usage(const std::string& program);

}  // namespace geo_debugger
