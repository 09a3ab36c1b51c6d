#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <type_traits>

#include "geo_debugger/geo_debugger.hpp"

namespace py = pybind11;

namespace {

py::object label_to_py(const std::optional<geo_debugger::Label>& label) {
    if (!label) {
        return py::none();
    }
    return py::str(label->content);
}

py::object draw_label_to_py(const std::optional<geo_debugger::DrawLabel>& label) {
    if (!label) {
        return py::none();
    }
    py::dict d;
    d["position"] = py::make_tuple(label->position.x, label->position.y);
    d["content"] = label->content;
    return d;
}

py::tuple xy(const geo_debugger::Vec2& v) {
    return py::make_tuple(v.x, v.y);
}

py::list figure_to_py(const geo_debugger::Figure& figure) {
    py::list out;
    for (const auto& item : figure.items) {
        std::visit([&out](const auto& it) {
            using T = std::decay_t<decltype(it)>;
            py::dict d;
            if constexpr (std::is_same_v<T, geo_debugger::PointItem>) {
                d["kind"] = "point";
                d["position"] = xy(it.position);
                d["display_dot"] = it.display_dot;
            } else if constexpr (std::is_same_v<T, geo_debugger::RayItem>) {
                d["kind"] = "ray";
                d["origin"] = xy(it.origin);
                d["through"] = xy(it.through);
            } else if constexpr (std::is_same_v<T, geo_debugger::CircleItem>) {
                d["kind"] = "circle";
                d["center"] = xy(it.center);
                d["radius"] = it.radius;
            } else {
                d["kind"] = std::is_same_v<T, geo_debugger::LineItem> ? "line" : "segment";
                d["a"] = xy(it.a);
                d["b"] = xy(it.b);
            }
            d["label"] = label_to_py(it.label);
            out.append(d);
        }, item);
    }
    return out;
}

py::list projected_to_py(const geo_debugger::ProjectedFigure& figure) {
    py::list out;
    for (const auto& item : figure.items) {
        std::visit([&out](const auto& it) {
            using T = std::decay_t<decltype(it)>;
            py::dict d;
            if constexpr (std::is_same_v<T, geo_debugger::DrawPoint>) {
                d["kind"] = "point";
                d["position"] = xy(it.position);
                d["display_dot"] = it.display_dot;
            } else if constexpr (std::is_same_v<T, geo_debugger::DrawCircle>) {
                d["kind"] = "circle";
                d["center"] = xy(it.center);
                d["radius"] = it.radius;
            } else {
                if constexpr (std::is_same_v<T, geo_debugger::DrawLine>) {
                    d["kind"] = "line";
                } else if constexpr (std::is_same_v<T, geo_debugger::DrawRay>) {
                    d["kind"] = "ray";
                } else {
                    d["kind"] = "segment";
                }
                d["a"] = xy(it.a);
                d["b"] = xy(it.b);
            }
            d["label"] = draw_label_to_py(it.label);
            out.append(d);
        }, item);
    }
    return out;
}

}  // namespace

PYBIND11_MODULE(geo_debugger_cpp, m) {
    m.doc() = "Geo debugger generation sessions and figure projection";

    py::register_exception<geo_debugger::ProblemLoadError>(m, "ProblemLoadError", PyExc_ValueError);

    // GenerationFlags
    py::class_<geo_debugger::GenerationFlags>(m, "GenerationFlags")
        .def(py::init<>())
        .def_readwrite("seed", &geo_debugger::GenerationFlags::seed)
        .def_readwrite("point_bounds", &geo_debugger::GenerationFlags::point_bounds)
        .def_readwrite("margin", &geo_debugger::GenerationFlags::margin)
        .def_readwrite("display_dots", &geo_debugger::GenerationFlags::display_dots)
        .def_readwrite("label_size", &geo_debugger::GenerationFlags::label_size);

    // Problem
    py::class_<geo_debugger::Problem>(m, "Problem")
        .def("num_points", &geo_debugger::Problem::num_points)
        .def("point_names", &geo_debugger::Problem::point_names)
        .def("num_rules", [](const geo_debugger::Problem& self) { return self.rules().size(); })
        .def_property_readonly("flags",
            [](const geo_debugger::Problem& self) { return self.flags(); });

    m.def("load_problem", [](const std::string& text) { return geo_debugger::load_problem(text); },
        py::arg("text"));
    m.def("load_problem_file", &geo_debugger::load_problem_file, py::arg("path"));

    py::enum_<geo_debugger::SessionState>(m, "SessionState")
        .value("Active", geo_debugger::SessionState::Active)
        .value("Terminating", geo_debugger::SessionState::Terminating)
        .value("Terminated", geo_debugger::SessionState::Terminated);

    // Session
    py::class_<geo_debugger::Session, std::unique_ptr<geo_debugger::Session>>(m, "Session")
        .def_static("start", &geo_debugger::Session::start,
            py::arg("problem"), py::arg("worker_count") = 512, py::arg("max_adjustment") = 0.5,
            py::arg("verbose") = false)
        .def("request_step", &geo_debugger::Session::request_step)
        .def("has_outstanding_step", &geo_debugger::Session::has_outstanding_step)
        .def("requested_steps", &geo_debugger::Session::requested_steps)
        .def("completed_steps", &geo_debugger::Session::completed_steps)
        .def("close", &geo_debugger::Session::close)
        .def("join", &geo_debugger::Session::join, py::call_guard<py::gil_scoped_release>())
        .def("state", &geo_debugger::Session::state)
        .def("finished", &geo_debugger::Session::finished)
        .def_property_readonly("id", &geo_debugger::Session::id)
        .def_property_readonly("flags", &geo_debugger::Session::flags)
        .def("snapshot", [](const geo_debugger::Session& self) {
            geo_debugger::FigureSnapshot snap = self.slot().snapshot();
            py::dict d;
            d["step"] = snap.step;
            d["error"] = snap.error;
            d["figure"] = figure_to_py(snap.figure);
            return d;
        })
        .def("project", [](const geo_debugger::Session& self, double width, double height) {
            geo_debugger::FigureSnapshot snap = self.slot().snapshot();
            return projected_to_py(geo_debugger::project(snap.figure, self.flags(), {width, height}));
        }, py::arg("width"), py::arg("height"));
}
