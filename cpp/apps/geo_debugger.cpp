#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "geo_debugger/geo_debugger.hpp"

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl2.h"

#include <GLFW/glfw3.h>

using namespace geo_debugger;

namespace {

// Paints draw items on the ImGui background layer, black on white
class ImGuiCanvas : public Canvas {
public:
    explicit ImGuiCanvas(ImDrawList* draw_list) : dl_(draw_list) {}

    void dot(const Vec2& center, double radius) override {
        dl_->AddCircleFilled(to_im(center), static_cast<float>(radius), kInk);
    }

    void line(const Vec2& a, const Vec2& b, double thickness) override {
        dl_->AddLine(to_im(a), to_im(b), kInk, static_cast<float>(thickness));
    }

    void circle(const Vec2& center, double radius, double thickness) override {
        dl_->AddCircle(to_im(center), static_cast<float>(radius), kInk, 0, static_cast<float>(thickness));
    }

    void text(const Vec2& position, const std::string& content, double size) override {
        dl_->AddText(ImGui::GetFont(), static_cast<float>(size), to_im(position), kInk, content.c_str());
    }

private:
    static constexpr ImU32 kInk = IM_COL32(0, 0, 0, 255);
    ImDrawList* dl_;

    static ImVec2 to_im(const Vec2& p) {
        return ImVec2(static_cast<float>(p.x), static_cast<float>(p.y));
    }
};

// Edits the string in place; ImGui asks for more room through the callback
int resize_string(ImGuiInputTextCallbackData* data) {
    if (data->EventFlag == ImGuiInputTextFlags_CallbackResize) {
        auto* value = static_cast<std::string*>(data->UserData);
        value->resize(static_cast<size_t>(data->BufTextLen));
        data->Buf = value->data();
    }
    return 0;
}

bool input_text(const char* label, std::string& value) {
    return ImGui::InputText(label, value.data(), value.capacity() + 1,
                            ImGuiInputTextFlags_CallbackResize, resize_string, &value);
}

void error_row(const char* title, const char* detail) {
    ImGui::TextColored(ImVec4(1.0f, 0.0f, 0.0f, 1.0f), "%s", title);
    ImGui::TableSetColumnIndex(1);
    ImGui::TextUnformatted(detail);
}

// Directory browser for picking a problem file
struct FileBrowser {
    std::filesystem::path directory = std::filesystem::current_path();
    std::vector<std::filesystem::directory_entry> entries;
    bool stale = true;

    void refresh() {
        entries.clear();
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
            if (entry.is_directory(ec) || entry.path().extension() == ".geo") {
                entries.push_back(entry);
            }
        }
        if (ec) {
            std::cerr << "[FileBrowser] " << directory.string() << ": " << ec.message() << "\n";
        }
        std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
            return a.path().filename() < b.path().filename();
        });
        stale = false;
    }

    // Returns true once a file was picked
    bool show(std::string& selected) {
        bool picked = false;
        if (!ImGui::BeginPopup("Open problem")) {
            return false;
        }
        if (stale) {
            refresh();
        }
        ImGui::TextUnformatted(directory.string().c_str());
        ImGui::Separator();
        if (directory.has_parent_path() && directory != directory.root_path() && ImGui::Selectable("..")) {
            directory = directory.parent_path();
            stale = true;
        }
        std::error_code ec;
        for (const auto& entry : entries) {
            std::string name = entry.path().filename().string();
            bool is_dir = entry.is_directory(ec);
            if (is_dir) {
                name += "/";
            }
            if (ImGui::Selectable(name.c_str(), false, ImGuiSelectableFlags_DontClosePopups)) {
                if (is_dir) {
                    directory = entry.path();
                    stale = true;
                } else {
                    selected = entry.path().string();
                    picked = true;
                    ImGui::CloseCurrentPopup();
                }
            }
        }
        ImGui::EndPopup();
        return picked;
    }
};

void show_start_form(ControlPanel& panel, StartForm& form, FileBrowser& browser) {
    bool open_browser = false;
    if (ImGui::BeginTable("file-data", 2, ImGuiTableFlags_SizingFixedFit | ImGuiTableFlags_RowBg)) {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted("File:");
        ImGui::TableSetColumnIndex(1);
        input_text("##file", form.file);
        ImGui::SameLine();
        open_browser = ImGui::Button(form.file.empty() ? "Open" : "Change");

        if (!form.file_valid) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            error_row("Invalid file", form.file_error.c_str());
        }

        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted("Worker count:");
        ImGui::TableSetColumnIndex(1);
        input_text("##worker-count", form.worker_count);

        if (!form.worker_count_valid) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            error_row("Invalid worker count", "Must be a positive integer up to 1048576.");
        }

        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted("Maximum adjustment:");
        ImGui::TableSetColumnIndex(1);
        input_text("##max-adjustment", form.max_adjustment);

        if (!form.max_adjustment_valid) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            error_row("Invalid max adjustment", "Must be a positive float");
        }

        if (!form.session_error.empty()) {
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            error_row("Could not start", form.session_error.c_str());
        }

        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(1);
        bool generate = ImGui::Button("Generate");
        ImGui::EndTable();

        if (generate) {
            // form is gone once the session starts
            panel.generate();
            return;
        }
    }

    if (open_browser) {
        browser.stale = true;
        ImGui::OpenPopup("Open problem");
    }
    browser.show(form.file);
}

void show_session_controls(ControlPanel& panel, const RenderLoop& render_loop) {
    if (ImGui::Button("Quit")) {
        panel.quit();
        return;
    }

    if (panel.running()) {
        if (ImGui::Button("Stop")) {
            panel.stop();
        }
    } else {
        if (ImGui::Button("Run")) {
            panel.run();
        }
        ImGui::SameLine();
        if (ImGui::Button("Next step")) {
            panel.next_step();
        }
    }

    if (const Session* session = panel.session()) {
        ImGui::Text("Step: %llu / %llu",
            static_cast<unsigned long long>(render_loop.drawn_step()),
            static_cast<unsigned long long>(session->requested_steps()));
        ImGui::Text("Error: %.6g", render_loop.drawn_error());
    }
}

}  // namespace

int main(int argc, char** argv) {
    DebuggerConfig config;
    try {
        config = parse_debugger_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << debugger_usage(argv[0]) << "\n";
        return 2;
    }

    if (!glfwInit()) {
        std::cerr << "[geo_debugger] glfwInit failed\n";
        return 1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    GLFWwindow* window = glfwCreateWindow(
        config.window_width, config.window_height, config.window_title.c_str(), nullptr, nullptr);
    if (!window) {
        std::cerr << "[geo_debugger] failed to create window\n";
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    std::error_code font_ec;
    if (std::filesystem::exists(config.font_path, font_ec)) {
        io.Fonts->AddFontFromFileTTF(config.font_path.c_str(), config.font_size);
    }
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    ImGui::StyleColorsLight();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL2_Init();

    StartForm initial_form;
    initial_form.file = config.problem_file;
    initial_form.worker_count = config.worker_count;
    initial_form.max_adjustment = config.max_adjustment;

    ControlPanel panel(initial_form, config.verbose);
    RenderLoop render_loop;
    FileBrowser browser;

    const auto frame_interval = std::chrono::milliseconds(config.frame_interval_ms);
    auto last_frame_time = std::chrono::steady_clock::now() - frame_interval;
    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();
        auto now = std::chrono::steady_clock::now();
        if (now - last_frame_time < frame_interval) {
            std::this_thread::sleep_for(frame_interval - (now - last_frame_time));
            continue;
        }
        last_frame_time = now;

        ImGui_ImplOpenGL2_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        // Figure first, projected fresh for the current window size
        Viewport viewport{
            std::max(0.0, static_cast<double>(io.DisplaySize.x - config.panel_width)),
            static_cast<double>(io.DisplaySize.y)
        };
        ImGuiCanvas canvas(ImGui::GetBackgroundDrawList());
        render_loop.frame(panel.session(), viewport, canvas);

        // Then the panel, which may queue the next step
        ImGui::SetNextWindowPos(ImVec2(io.DisplaySize.x - config.panel_width, 0.0f), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowSize(ImVec2(config.panel_width, 0.0f), ImGuiCond_FirstUseEver);
        ImGui::Begin("Start generating");
        if (StartForm* form = panel.form()) {
            show_start_form(panel, *form, browser);
        } else {
            show_session_controls(panel, render_loop);
        }
        ImGui::End();
        panel.on_frame();

        ImGui::Render();
        int display_w = 0;
        int display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(1.0f, 1.0f, 1.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL2_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }

    // Quit any running session; its worker is joined when panel goes out of scope
    panel.quit();

    ImGui_ImplOpenGL2_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
