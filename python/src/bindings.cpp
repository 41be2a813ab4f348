#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <erlangcore/erlangcore.hpp>

using namespace erlangcore;

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_erlangcore, m) {
    m.doc() = "erlangcore: Erlang B/C/A contact-center staffing engine";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_core(m);
    bind_monitors(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<ErlangVariant>(m, "ErlangVariant")
        .value("B", ErlangVariant::B)
        .value("C", ErlangVariant::C)
        .value("A", ErlangVariant::A)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("CalculationRequested",  EventType::CalculationRequested)
        .value("InputsRejected",        EventType::InputsRejected)
        .value("StaffingSolved",        EventType::StaffingSolved)
        .value("TargetInfeasible",      EventType::TargetInfeasible)
        .value("ModelParameterMissing", EventType::ModelParameterMissing)
        .value("AchievableEvaluated",   EventType::AchievableEvaluated)
        .value("OccupancyCapApplied",   EventType::OccupancyCapApplied)
        .value("UnstableStaffing",      EventType::UnstableStaffing)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Inputs -----------------------------------------------------------

    py::class_<WorkloadInput>(m, "WorkloadInput")
        .def(py::init<>())
        .def(py::init([](double volume, double aht, double interval_minutes) {
                 return WorkloadInput{volume, aht, interval_minutes};
             }),
             py::arg("volume"), py::arg("aht"), py::arg("interval_minutes") = 30.0)
        .def_readwrite("volume",           &WorkloadInput::volume)
        .def_readwrite("aht",              &WorkloadInput::aht)
        .def_readwrite("interval_minutes", &WorkloadInput::interval_minutes)
        .def("interval_seconds", &WorkloadInput::interval_seconds);

    py::class_<Constraints>(m, "Constraints")
        .def(py::init<>())
        .def_readwrite("target_service_level", &Constraints::target_service_level)
        .def_readwrite("threshold_seconds",    &Constraints::threshold_seconds)
        .def_readwrite("max_occupancy",        &Constraints::max_occupancy);

    py::class_<Behavior>(m, "Behavior")
        .def(py::init<>())
        .def_readwrite("shrinkage",                &Behavior::shrinkage)
        .def_readwrite("average_patience_seconds", &Behavior::average_patience_seconds)
        .def_readwrite("concurrency",              &Behavior::concurrency);

    py::class_<CalculationInputs>(m, "CalculationInputs")
        .def(py::init<>())
        .def_readwrite("model",                 &CalculationInputs::model)
        .def_readwrite("workload",              &CalculationInputs::workload)
        .def_readwrite("constraints",           &CalculationInputs::constraints)
        .def_readwrite("behavior",              &CalculationInputs::behavior)
        .def_readwrite("fixed_agents",          &CalculationInputs::fixed_agents)
        .def_readwrite("productivity_modifier", &CalculationInputs::productivity_modifier);

    // ---- Configuration ----------------------------------------------------

    py::class_<SearchConfig>(m, "SearchConfig")
        .def(py::init<>())
        .def_readwrite("traffic_multiplier", &SearchConfig::traffic_multiplier)
        .def_readwrite("min_headroom",       &SearchConfig::min_headroom)
        .def_readwrite("low_traffic_floor",  &SearchConfig::low_traffic_floor);

    py::class_<ValidationLimits>(m, "ValidationLimits")
        .def(py::init<>())
        .def_readwrite("volume_min",           &ValidationLimits::volume_min)
        .def_readwrite("volume_max",           &ValidationLimits::volume_max)
        .def_readwrite("aht_min",              &ValidationLimits::aht_min)
        .def_readwrite("aht_max",              &ValidationLimits::aht_max)
        .def_readwrite("threshold_min",        &ValidationLimits::threshold_min)
        .def_readwrite("threshold_max",        &ValidationLimits::threshold_max)
        .def_readwrite("shrinkage_max",        &ValidationLimits::shrinkage_max)
        .def_readwrite("max_occupancy_min",    &ValidationLimits::max_occupancy_min)
        .def_readwrite("max_occupancy_max",    &ValidationLimits::max_occupancy_max)
        .def_readwrite("patience_min",         &ValidationLimits::patience_min)
        .def_readwrite("patience_max",         &ValidationLimits::patience_max)
        .def_readwrite("interval_minutes_min", &ValidationLimits::interval_minutes_min)
        .def_readwrite("interval_minutes_max", &ValidationLimits::interval_minutes_max);

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("search",                 &Config::search)
        .def_readwrite("limits",                 &Config::limits)
        .def_readwrite("throw_on_invalid_input", &Config::throw_on_invalid_input)
        .def_readwrite("evaluate_achievable",    &Config::evaluate_achievable);

    // ---- Results ----------------------------------------------------------

    py::class_<StaffingMetrics>(m, "StaffingMetrics")
        .def(py::init<>())
        .def_readwrite("model",                 &StaffingMetrics::model)
        .def_readwrite("traffic_intensity",     &StaffingMetrics::traffic_intensity)
        .def_readwrite("required_agents",       &StaffingMetrics::required_agents)
        .def_readwrite("total_fte",             &StaffingMetrics::total_fte)
        .def_readwrite("service_level",         &StaffingMetrics::service_level)
        .def_readwrite("asa",                   &StaffingMetrics::asa)
        .def_readwrite("occupancy",             &StaffingMetrics::occupancy)
        .def_readwrite("can_achieve_target",    &StaffingMetrics::can_achieve_target)
        .def_readwrite("blocking_probability",  &StaffingMetrics::blocking_probability)
        .def_readwrite("abandonment_rate",      &StaffingMetrics::abandonment_rate)
        .def_readwrite("expected_abandonments", &StaffingMetrics::expected_abandonments)
        .def_readwrite("answered_contacts",     &StaffingMetrics::answered_contacts)
        .def("__repr__", [](const StaffingMetrics& s) {
            return "<StaffingMetrics model=" + std::string(to_string(s.model))
                 + " agents=" + std::to_string(s.required_agents)
                 + " fte=" + std::to_string(s.total_fte) + ">";
        });

    py::class_<AchievableMetrics>(m, "AchievableMetrics")
        .def(py::init<>())
        .def_readwrite("model",                             &AchievableMetrics::model)
        .def_readwrite("traffic_intensity",                 &AchievableMetrics::traffic_intensity)
        .def_readwrite("service_level",                     &AchievableMetrics::service_level)
        .def_readwrite("asa",                               &AchievableMetrics::asa)
        .def_readwrite("occupancy",                         &AchievableMetrics::occupancy)
        .def_readwrite("effective_agents",                  &AchievableMetrics::effective_agents)
        .def_readwrite("actual_agents",                     &AchievableMetrics::actual_agents)
        .def_readwrite("total_fte",                         &AchievableMetrics::total_fte)
        .def_readwrite("occupancy_cap_applied",             &AchievableMetrics::occupancy_cap_applied)
        .def_readwrite("occupancy_penalty",                 &AchievableMetrics::occupancy_penalty)
        .def_readwrite("required_agents_for_max_occupancy", &AchievableMetrics::required_agents_for_max_occupancy)
        .def_readwrite("agent_shortfall",                   &AchievableMetrics::agent_shortfall)
        .def_readwrite("blocking_probability",              &AchievableMetrics::blocking_probability)
        .def_readwrite("abandonment_rate",                  &AchievableMetrics::abandonment_rate)
        .def_readwrite("expected_abandonments",             &AchievableMetrics::expected_abandonments);

    py::class_<Projection>(m, "Projection")
        .def(py::init<>())
        .def_readwrite("service_level",        &Projection::service_level)
        .def_readwrite("asa",                  &Projection::asa)
        .def_readwrite("occupancy",            &Projection::occupancy)
        .def_readwrite("wait_probability",     &Projection::wait_probability)
        .def_readwrite("blocking_probability", &Projection::blocking_probability)
        .def_readwrite("abandonment_rate",     &Projection::abandonment_rate);

    py::class_<ErlangAResult>(m, "ErlangAResult")
        .def(py::init<>())
        .def_readwrite("wait_probability",        &ErlangAResult::wait_probability)
        .def_readwrite("service_level",           &ErlangAResult::service_level)
        .def_readwrite("asa",                     &ErlangAResult::asa)
        .def_readwrite("abandonment_probability", &ErlangAResult::abandonment_probability)
        .def_readwrite("patience_ratio",          &ErlangAResult::patience_ratio);

    py::class_<ValidationError>(m, "ValidationError")
        .def(py::init<>())
        .def_readwrite("field",   &ValidationError::field)
        .def_readwrite("message", &ValidationError::message);

    py::class_<ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readwrite("valid",  &ValidationResult::valid)
        .def_readwrite("errors", &ValidationResult::errors);

    py::class_<CalculationResult>(m, "CalculationResult")
        .def(py::init<>())
        .def_readwrite("staffing",   &CalculationResult::staffing)
        .def_readwrite("achievable", &CalculationResult::achievable)
        .def_readwrite("validation", &CalculationResult::validation);

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",              &MonitorEvent::type)
        .def_readwrite("timestamp",         &MonitorEvent::timestamp)
        .def_readwrite("message",           &MonitorEvent::message)
        .def_readwrite("model",             &MonitorEvent::model)
        .def_readwrite("traffic_intensity", &MonitorEvent::traffic_intensity)
        .def_readwrite("agents",            &MonitorEvent::agents)
        .def_readwrite("service_level",     &MonitorEvent::service_level)
        .def_readwrite("occupancy",         &MonitorEvent::occupancy)
        .def_readwrite("duration_us",       &MonitorEvent::duration_us);

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("total_calculations",         &MetricsMonitor::Metrics::total_calculations)
        .def_readwrite("solved",                     &MetricsMonitor::Metrics::solved)
        .def_readwrite("infeasible",                 &MetricsMonitor::Metrics::infeasible)
        .def_readwrite("rejected_inputs",            &MetricsMonitor::Metrics::rejected_inputs)
        .def_readwrite("missing_parameters",         &MetricsMonitor::Metrics::missing_parameters)
        .def_readwrite("achievable_evaluations",     &MetricsMonitor::Metrics::achievable_evaluations)
        .def_readwrite("occupancy_cap_applications", &MetricsMonitor::Metrics::occupancy_cap_applications)
        .def_readwrite("unstable_staffing",          &MetricsMonitor::Metrics::unstable_staffing)
        .def_readwrite("average_solve_duration_us",  &MetricsMonitor::Metrics::average_solve_duration_us);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_ErlangCoreError =
        py::register_exception<ErlangCoreException>(m, "ErlangCoreError", PyExc_RuntimeError);

    // Derived from ErlangCoreError
    static auto py_InvalidConfigError =
        py::register_exception<InvalidConfigException>(m, "InvalidConfigError", py_ErlangCoreError.ptr());
    static auto py_InvalidInputError =
        py::register_exception<InvalidInputException>(m, "InvalidInputError", py_ErlangCoreError.ptr());
}
