#include "geo_debugger/panel/control_panel.hpp"
#include "geo_debugger/core/parse.hpp"
#include "geo_debugger/engine/adjustment_engine.hpp"
#include "geo_debugger/problem/loader.hpp"
#include <algorithm>
#include <iostream>
#include <new>
#include <stdexcept>
#include <system_error>

namespace geo_debugger {

std::optional<size_t> parse_worker_count(std::string_view text) {
    auto value = parse_unsigned(text);
    if (!value || *value == 0 || *value > AdjustmentEngine::kMaxWorkers) {
        return std::nullopt;
    }
    return static_cast<size_t>(*value);
}

std::optional<double> parse_max_adjustment(std::string_view text) {
    auto value = parse_real(text);
    if (!value || *value <= 0.0) {
        return std::nullopt;
    }
    return value;
}

ControlPanel::ControlPanel(StartForm form, bool verbose)
    : state_(NoSession{std::move(form)})
    , verbose_(verbose)
{}

bool ControlPanel::generate() {
    auto* idle = std::get_if<NoSession>(&state_);
    if (!idle) {
        return false;
    }
    reap_retired();
    StartForm& form = idle->form;
    form.session_error.clear();

    auto worker_count = parse_worker_count(form.worker_count);
    auto max_adjustment = parse_max_adjustment(form.max_adjustment);

    std::optional<Problem> problem;
    form.file_error.clear();
    if (form.file.empty()) {
        form.file_error = "No file selected";
    } else {
        try {
            problem = load_problem_file(form.file);
        } catch (const ProblemLoadError& e) {
            form.file_error = e.what();
            std::cerr << "[ControlPanel] " << form.file << ": " << e.what() << "\n";
        }
    }

    form.file_valid = problem.has_value();
    form.worker_count_valid = worker_count.has_value();
    form.max_adjustment_valid = max_adjustment.has_value();

    if (!problem || !worker_count || !max_adjustment) {
        return false;
    }

    std::unique_ptr<Session> session;
    try {
        session = Session::start(*problem, *worker_count, *max_adjustment, verbose_);
    } catch (const std::length_error& e) {
        form.worker_count_valid = false;
        form.session_error = e.what();
    } catch (const std::bad_alloc&) {
        form.worker_count_valid = false;
        form.session_error = "not enough memory for " + form.worker_count + " workers";
    } catch (const std::system_error& e) {
        form.session_error = std::string("could not start the worker thread: ") + e.what();
    }
    if (!session) {
        std::cerr << "[ControlPanel] session not started: " << form.session_error << "\n";
        return false;
    }
    if (verbose_) {
        std::cout << "[ControlPanel] session started: " << form.file
                  << " workers=" << *worker_count
                  << " max_adjustment=" << *max_adjustment << "\n";
    }
    state_ = ActiveSession{std::move(session), false, std::move(form)};
    return true;
}

bool ControlPanel::next_step() {
    auto* active = std::get_if<ActiveSession>(&state_);
    if (!active || active->run) {
        return false;
    }
    return active->session->request_step();
}

void ControlPanel::run() {
    if (auto* active = std::get_if<ActiveSession>(&state_)) {
        active->run = true;
    }
}

void ControlPanel::stop() {
    if (auto* active = std::get_if<ActiveSession>(&state_)) {
        active->run = false;
    }
}

void ControlPanel::quit() {
    auto* active = std::get_if<ActiveSession>(&state_);
    if (!active) {
        return;
    }
    StartForm form = std::move(active->form);
    active->session->close();
    retired_.push_back(std::move(active->session));
    state_ = NoSession{std::move(form)};
    if (verbose_) {
        std::cout << "[ControlPanel] session closed\n";
    }
}

void ControlPanel::reap_retired() {
    auto done = std::remove_if(retired_.begin(), retired_.end(), [](const auto& session) {
        return session->finished();
    });
    // Destroying a finished session joins a thread that has already returned
    retired_.erase(done, retired_.end());
}

void ControlPanel::on_frame() {
    reap_retired();
    auto* active = std::get_if<ActiveSession>(&state_);
    if (!active || !active->run) {
        return;
    }
    if (!active->session->has_outstanding_step()) {
        active->session->request_step();
    }
}

bool ControlPanel::running() const {
    const auto* active = std::get_if<ActiveSession>(&state_);
    return active && active->run;
}

StartForm* ControlPanel::form() {
    auto* idle = std::get_if<NoSession>(&state_);
    return idle ? &idle->form : nullptr;
}

const StartForm* ControlPanel::form() const {
    const auto* idle = std::get_if<NoSession>(&state_);
    return idle ? &idle->form : nullptr;
}

Session* ControlPanel::session() {
    auto* active = std::get_if<ActiveSession>(&state_);
    return active ? active->session.get() : nullptr;
}

const Session* ControlPanel::session() const {
    const auto* active = std::get_if<ActiveSession>(&state_);
    return active ? active->session.get() : nullptr;
}

}  // namespace geo_debugger
