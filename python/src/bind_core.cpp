#include "bind_forward.hpp"
#include <erlangcore/erlangcore.hpp>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

using namespace erlangcore;

// ---------------------------------------------------------------------------
// bind_core  --  queueing formulas, engine entry points, StaffingCalculator
// ---------------------------------------------------------------------------
void bind_core(py::module_& m) {

    // ===================================================================
    // Traffic and shrinkage
    // ===================================================================
    m.def("traffic_intensity",
          py::overload_cast<double, double, double>(&traffic_intensity),
          py::arg("volume"), py::arg("aht"), py::arg("interval_seconds"));
    m.def("effective_aht", &effective_aht, py::arg("aht"), py::arg("concurrency"));
    m.def("occupancy", &occupancy, py::arg("traffic"), py::arg("agents"));
    m.def("fte", &fte, py::arg("productive_agents"), py::arg("shrinkage"));
    m.def("effective_shrinkage", &effective_shrinkage,
          py::arg("shrinkage"), py::arg("productivity_modifier"));
    m.def("normalize_model", &normalize_model, py::arg("name"));

    // ===================================================================
    // Queueing formulas
    // ===================================================================
    m.def("erlang_b", &erlang_b, py::arg("agents"), py::arg("traffic"));
    m.def("required_lines", &required_lines,
          py::arg("traffic"), py::arg("target_blocking"), py::arg("max_lines") = 10000);
    m.def("erlang_c", &erlang_c, py::arg("agents"), py::arg("traffic"));
    m.def("service_level", &service_level,
          py::arg("agents"), py::arg("traffic"), py::arg("aht"), py::arg("threshold_seconds"));
    m.def("average_speed_of_answer", &average_speed_of_answer,
          py::arg("agents"), py::arg("traffic"), py::arg("aht"));
    m.def("wait_probability_with_abandonment", &wait_probability_with_abandonment,
          py::arg("agents"), py::arg("traffic"), py::arg("theta"));
    m.def("erlang_a", &erlang_a,
          py::arg("agents"), py::arg("traffic"), py::arg("aht"),
          py::arg("threshold_seconds"), py::arg("average_patience"));

    // ===================================================================
    // Engine
    // ===================================================================
    m.def("calculate_staffing_metrics", &calculate_staffing_metrics,
          py::arg("workload"), py::arg("constraints"), py::arg("behavior"),
          py::arg("search") = SearchConfig{});
    m.def("calculate_staffing",
          [](const std::string& model, const WorkloadInput& w, const Constraints& c,
             const Behavior& b, const SearchConfig& s) {
              return calculate_staffing(model, w, c, b, s);
          },
          py::arg("model"), py::arg("workload"), py::arg("constraints"),
          py::arg("behavior"), py::arg("search") = SearchConfig{});
    m.def("calculate_achievable_metrics",
          [](const std::string& model, AgentCount fixed_agents, const WorkloadInput& w,
             const Constraints& c, const Behavior& b) {
              return calculate_achievable_metrics(model, fixed_agents, w, c, b);
          },
          py::arg("model"), py::arg("fixed_agents"), py::arg("workload"),
          py::arg("constraints"), py::arg("behavior"));
    m.def("project",
          [](ErlangVariant v, AgentCount agents, const WorkloadInput& w,
             const Constraints& c, const Behavior& b) {
              return project(v, agents, w, c, b);
          },
          py::arg("model"), py::arg("agents"), py::arg("workload"),
          py::arg("constraints"), py::arg("behavior"));
    m.def("validate_calculation_inputs", &validate_calculation_inputs,
          py::arg("inputs"), py::arg("limits") = ValidationLimits{});

    // ===================================================================
    // StaffingSearch
    // ===================================================================
    py::class_<StaffingSearch>(m, "StaffingSearch")
        .def(py::init<SearchConfig>(), py::arg("config") = SearchConfig{})
        .def("solve_agents", &StaffingSearch::solve_agents,
             py::arg("traffic"), py::arg("aht"), py::arg("target_service_level"),
             py::arg("threshold_seconds"), py::arg("max_occupancy"))
        .def("min_agents", &StaffingSearch::min_agents,
             py::arg("traffic"), py::arg("max_occupancy"))
        .def("max_agents", &StaffingSearch::max_agents,
             py::arg("traffic"), py::arg("max_occupancy"));

    // ===================================================================
    // StaffingCalculator
    // ===================================================================
    py::class_<StaffingCalculator>(m, "StaffingCalculator")
        .def(py::init<Config>(), py::arg("config") = Config{})
        .def("calculate", &StaffingCalculator::calculate, py::arg("inputs"),
             py::call_guard<py::gil_scoped_release>())
        .def("set_monitor", &StaffingCalculator::set_monitor, py::arg("monitor"))
        .def("config", &StaffingCalculator::config,
             py::return_value_policy::reference_internal);
}
