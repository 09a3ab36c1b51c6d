#include "geo_debugger/core/config.hpp"
#include <stdexcept>
#include <string_view>

namespace geo_debugger {

DebuggerConfig parse_debugger_args(int argc, const char* const* argv) {
    DebuggerConfig config;

    auto value_of = [&](int& i, std::string_view option) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(std::string(option) + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--workers") {
            config.worker_count = value_of(i, arg);
        } else if (arg == "--max-adjustment") {
            config.max_adjustment = value_of(i, arg);
        } else if (!arg.empty() && arg.front() == '-') {
            throw std::invalid_argument("unknown option " + std::string(arg));
        } else if (config.problem_file.empty()) {
            config.problem_file = std::string(arg);
        } else {
            throw std::invalid_argument("more than one problem file given");
        }
    }
    return config;
}

std::string debugger_usage(const std::string& program) {
    return "usage: " + program + " [--verbose] [--workers N] [--max-adjustment X] [problem.geo]";
}

}  // namespace geo_debugger
