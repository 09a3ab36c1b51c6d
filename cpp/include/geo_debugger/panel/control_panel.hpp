#pragma once

#include "../session/session.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace geo_debugger {

// Positive integer up to AdjustmentEngine::kMaxWorkers, whole string
// ("512" ok; "-3", "0", "4x", "100000000000" rejected)
[[nodiscard]] std::optional<size_t> parse_worker_count(std::string_view text);

// Positive finite real, whole string ("0.5" ok; "0", "-1", "abc" rejected)
[[nodiscard]] std::optional<double> parse_max_adjustment(std::string_view text);

// Pre-session fields and their validation results
struct StartForm {
    std::string file;
    std::string worker_count{"512"};
    std::string max_adjustment{"0.5"};

    bool file_valid{true};
    bool worker_count_valid{true};
    bool max_adjustment_valid{true};
    std::string file_error;
    std::string session_error;  // start failed after the fields validated
};

struct NoSession {
    StartForm form;
};

struct ActiveSession {
    std::unique_ptr<Session> session;
    bool run{false};
    StartForm form;  // restored when the session ends
};

using PanelState = std::variant<NoSession, ActiveSession>;

// Control panel state machine. Either the start form or the session
// controls exist, never both.
class ControlPanel {
public:
    explicit ControlPanel(StartForm form = {}, bool verbose = false);

    // Validate all start fields independently; start a session iff all pass.
    // Returns true when a session was started. A start that fails for lack
    // of memory or threads leaves the form in place with session_error set.
    bool generate();

    // Single step; only while active and not running continuously
    bool next_step();

    void run();
    void stop();

    // End the session and return to the start form. Quit replaces any
    // queued steps; the session is retired without waiting for its worker.
    void quit();

    // Called once per frame after the panel is shown. Joins retired sessions
    // whose worker has exited. In continuous mode, sends Next only when the
    // previous step has produced its figure.
    void on_frame();

    // Quit sessions whose worker has not been joined yet. The remainder is
    // joined when the panel is destroyed.
    [[nodiscard]] size_t retired_sessions() const { return retired_.size(); }

    [[nodiscard]] bool active() const { return std::holds_alternative<ActiveSession>(state_); }
    [[nodiscard]] bool running() const;

    // Start form, null while a session is active
    [[nodiscard]] StartForm* form();
    [[nodiscard]] const StartForm* form() const;

    // Session, null while no session exists
    [[nodiscard]] Session* session();
    [[nodiscard]] const Session* session() const;

    [[nodiscard]] const PanelState& state() const { return state_; }

private:
    PanelState state_;
    std::vector<std::unique_ptr<Session>> retired_;
    bool verbose_;

    void reap_retired();
};

}  // namespace geo_debugger
