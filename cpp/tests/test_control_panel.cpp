#include <catch2/catch.hpp>
#include "geo_debugger/panel/control_panel.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using namespace geo_debugger;
using Catch::Detail::Approx;

namespace {

std::string write_problem(const std::string& name, const std::string& text) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path.string();
}

std::string valid_problem_file() {
    return write_problem("geo_debugger_panel_valid.geo",
        "point A\npoint B\npoint C\n"
        "distance A B 1\n"
        "angle A B C 45\n"
        "draw segment A B\n"
        "draw ray B C\n");
}

StartForm form_with(std::string file, std::string workers = "512", std::string bound = "0.5") {
    StartForm form;
    form.file = std::move(file);
    form.worker_count = std::move(workers);
    form.max_adjustment = std::move(bound);
    return form;
}

}  // namespace

TEST_CASE("Start field parsing", "[panel]") {
    SECTION("Worker count") {
        REQUIRE(parse_worker_count("512") == 512u);
        REQUIRE(parse_worker_count("1") == 1u);
        REQUIRE_FALSE(parse_worker_count("-3"));
        REQUIRE_FALSE(parse_worker_count("0"));
        REQUIRE_FALSE(parse_worker_count("4x"));
        REQUIRE_FALSE(parse_worker_count("2.5"));
        REQUIRE_FALSE(parse_worker_count(""));
        REQUIRE(parse_worker_count("1048576") == 1048576u);
        REQUIRE_FALSE(parse_worker_count("1048577"));
        REQUIRE_FALSE(parse_worker_count("100000000000"));
        REQUIRE_FALSE(parse_worker_count("99999999999999999999999"));
    }

    SECTION("Max adjustment") {
        REQUIRE(parse_max_adjustment("0.5") == 0.5);
        REQUIRE(parse_max_adjustment("3") == 3.0);
        REQUIRE_FALSE(parse_max_adjustment("0"));
        REQUIRE_FALSE(parse_max_adjustment("-1"));
        REQUIRE_FALSE(parse_max_adjustment("abc"));
        REQUIRE_FALSE(parse_max_adjustment(""));
    }
}

TEST_CASE("Generate validates every field", "[panel]") {
    const std::string file = valid_problem_file();

    SECTION("Defaults") {
        ControlPanel panel;
        REQUIRE_FALSE(panel.active());
        REQUIRE(panel.form() != nullptr);
        REQUIRE(panel.form()->worker_count == "512");
        REQUIRE(panel.form()->max_adjustment == "0.5");
        REQUIRE(panel.session() == nullptr);
    }

    SECTION("Valid fields start a session") {
        ControlPanel panel(form_with(file));
        REQUIRE(panel.generate());
        REQUIRE(panel.active());
        REQUIRE(panel.form() == nullptr);
        REQUIRE(panel.session() != nullptr);
        REQUIRE_FALSE(panel.running());
        REQUIRE(std::holds_alternative<ActiveSession>(panel.state()));
    }

    SECTION("Negative worker count") {
        ControlPanel panel(form_with(file, "-3"));
        REQUIRE_FALSE(panel.generate());
        REQUIRE_FALSE(panel.active());

        const StartForm* form = panel.form();
        REQUIRE(form != nullptr);
        REQUIRE(form->file_valid);
        REQUIRE_FALSE(form->worker_count_valid);
        REQUIRE(form->max_adjustment_valid);
        REQUIRE(form->worker_count == "-3");
    }

    SECTION("Zero worker count") {
        ControlPanel panel(form_with(file, "0"));
        REQUIRE_FALSE(panel.generate());
        REQUIRE_FALSE(panel.form()->worker_count_valid);
    }

    SECTION("Worker count above the engine limit") {
        ControlPanel panel(form_with(file, "100000000000"));
        bool started = true;
        REQUIRE_NOTHROW(started = panel.generate());
        REQUIRE_FALSE(started);
        REQUIRE_FALSE(panel.active());
        REQUIRE_FALSE(panel.form()->worker_count_valid);
        REQUIRE(panel.form()->session_error.empty());
    }

    SECTION("Start that cannot allocate its workers") {
        std::string text;
        for (int i = 0; i < 100; ++i) {
            text += "point P" + std::to_string(i) + "\n";
        }
        std::string wide = write_problem("geo_debugger_panel_wide.geo", text);

        // Passes field parsing, fails the engine's candidate budget
        ControlPanel panel(form_with(wide, "1048576"));
        bool started = true;
        REQUIRE_NOTHROW(started = panel.generate());
        REQUIRE_FALSE(started);
        REQUIRE_FALSE(panel.active());
        REQUIRE(panel.session() == nullptr);

        const StartForm* form = panel.form();
        REQUIRE(form != nullptr);
        REQUIRE(form->file_valid);
        REQUIRE_FALSE(form->worker_count_valid);
        REQUIRE_FALSE(form->session_error.empty());

        // A workable count clears the error
        panel.form()->worker_count = "4";
        REQUIRE(panel.generate());
        panel.quit();
        REQUIRE(panel.form()->session_error.empty());
    }

    SECTION("Bad adjustment bound") {
        ControlPanel panel(form_with(file, "512", "-0.5"));
        REQUIRE_FALSE(panel.generate());
        REQUIRE(panel.form()->worker_count_valid);
        REQUIRE_FALSE(panel.form()->max_adjustment_valid);
    }

    SECTION("No file selected") {
        ControlPanel panel(form_with(""));
        REQUIRE_FALSE(panel.generate());
        REQUIRE_FALSE(panel.form()->file_valid);
        REQUIRE(panel.form()->file_error == "No file selected");
    }

    SECTION("Unloadable file") {
        std::string broken = write_problem("geo_debugger_panel_broken.geo", "point A\ndistance A Z 1\n");
        ControlPanel panel(form_with(broken));
        REQUIRE_FALSE(panel.generate());
        REQUIRE_FALSE(panel.form()->file_valid);
        REQUIRE(panel.form()->file_error.find("line 2") != std::string::npos);
        REQUIRE(panel.form()->worker_count_valid);
    }

    SECTION("All fields are reported at once") {
        ControlPanel panel(form_with("", "many", "big"));
        REQUIRE_FALSE(panel.generate());
        REQUIRE_FALSE(panel.form()->file_valid);
        REQUIRE_FALSE(panel.form()->worker_count_valid);
        REQUIRE_FALSE(panel.form()->max_adjustment_valid);
    }

    SECTION("Fixing a field clears its error") {
        ControlPanel panel(form_with(file, "-3"));
        REQUIRE_FALSE(panel.generate());
        panel.form()->worker_count = "16";
        REQUIRE(panel.generate());
        REQUIRE(panel.active());
    }
}

TEST_CASE("Session controls", "[panel]") {
    const std::string file = valid_problem_file();
    ControlPanel panel(form_with(file, "8", "0.5"));
    REQUIRE(panel.generate());
    Session* session = panel.session();
    REQUIRE(session != nullptr);

    SECTION("Generate is ignored while active") {
        REQUIRE_FALSE(panel.generate());
        REQUIRE(panel.session() == session);
    }

    SECTION("Next step sends one command") {
        REQUIRE(panel.next_step());
        REQUIRE(session->requested_steps() == 1);
    }

    SECTION("Next step is disabled while running") {
        panel.run();
        REQUIRE(panel.running());
        REQUIRE_FALSE(panel.next_step());
        REQUIRE(session->requested_steps() == 0);
    }

    SECTION("Continuous run keeps at most one step in flight") {
        panel.run();
        for (int frame = 0; frame < 200; ++frame) {
            panel.on_frame();
            REQUIRE(session->requested_steps() <= session->completed_steps() + 1);
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        REQUIRE(session->requested_steps() > 1);
    }

    SECTION("Stop halts continuous run") {
        panel.run();
        panel.on_frame();
        panel.stop();
        REQUIRE_FALSE(panel.running());

        uint64_t requested = session->requested_steps();
        for (int frame = 0; frame < 10; ++frame) {
            panel.on_frame();
        }
        REQUIRE(session->requested_steps() == requested);
        REQUIRE(panel.next_step());
    }

    SECTION("Idle frames send nothing") {
        for (int frame = 0; frame < 10; ++frame) {
            panel.on_frame();
        }
        REQUIRE(session->requested_steps() == 0);
    }

    SECTION("Quit does not wait for queued steps") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(panel.next_step());
        }
        auto t0 = std::chrono::steady_clock::now();
        panel.quit();
        auto elapsed = std::chrono::steady_clock::now() - t0;

        REQUIRE(elapsed < std::chrono::milliseconds(50));
        REQUIRE_FALSE(panel.active());
        REQUIRE(panel.retired_sessions() == 1);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (panel.retired_sessions() > 0 && std::chrono::steady_clock::now() < deadline) {
            panel.on_frame();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        REQUIRE(panel.retired_sessions() == 0);
    }

    SECTION("Quit restores the start form") {
        panel.next_step();
        panel.quit();

        REQUIRE_FALSE(panel.active());
        REQUIRE(panel.session() == nullptr);
        REQUIRE_FALSE(panel.running());

        const StartForm* form = panel.form();
        REQUIRE(form != nullptr);
        REQUIRE(form->file == file);
        REQUIRE(form->worker_count == "8");
        REQUIRE(form->max_adjustment == "0.5");

        // Quit again is a no-op; a new session can be started
        panel.quit();
        REQUIRE(panel.generate());
        REQUIRE(panel.active());
    }
}
