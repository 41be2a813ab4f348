#include "erlangcore/monitor.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace erlangcore {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::CalculationRequested:  return "CalculationRequested";
        case EventType::InputsRejected:        return "InputsRejected";
        case EventType::StaffingSolved:        return "StaffingSolved";
        case EventType::TargetInfeasible:      return "TargetInfeasible";
        case EventType::ModelParameterMissing: return "ModelParameterMissing";
        case EventType::AchievableEvaluated:   return "AchievableEvaluated";
        case EventType::OccupancyCapApplied:   return "OccupancyCapApplied";
        case EventType::UnstableStaffing:      return "UnstableStaffing";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::InputsRejected:
        case EventType::TargetInfeasible:
        case EventType::ModelParameterMissing:
        case EventType::OccupancyCapApplied:
        case EventType::UnstableStaffing:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && event.type == EventType::CalculationRequested) return;

    std::ostringstream line;
    line << "[erlangcore] " << to_string(event.type);

    if (event.model.has_value()) {
        line << " model=" << to_string(event.model.value());
    }
    line << std::fixed;
    if (event.traffic_intensity.has_value()) {
        line << " erlangs=" << std::setprecision(2) << event.traffic_intensity.value();
    }
    if (event.agents.has_value()) {
        line << " agents=" << event.agents.value();
    }
    if (event.service_level.has_value()) {
        line << " sl=" << std::setprecision(1) << event.service_level.value() * 100.0 << "%";
    }
    if (event.occupancy.has_value()) {
        line << " occ=" << std::setprecision(1) << event.occupancy.value() * 100.0 << "%";
    }
    if (verbosity_ == Verbosity::Debug && event.duration_us.has_value()) {
        line << " took=" << std::setprecision(1) << event.duration_us.value() << "us";
    }

    if (!event.message.empty()) {
        line << " | " << event.message;
    }
    line << "\n";

    // std::cout formatting state is left untouched
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line.str();
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::CalculationRequested:
            metrics_.total_calculations++;
            break;
        case EventType::InputsRejected:
            metrics_.rejected_inputs++;
            break;
        case EventType::StaffingSolved:
            metrics_.solved++;
            break;
        case EventType::TargetInfeasible:
            metrics_.infeasible++;
            break;
        case EventType::ModelParameterMissing:
            metrics_.missing_parameters++;
            break;
        case EventType::AchievableEvaluated:
            metrics_.achievable_evaluations++;
            break;
        case EventType::OccupancyCapApplied:
            metrics_.occupancy_cap_applications++;
            break;
        case EventType::UnstableStaffing:
            metrics_.unstable_staffing++;
            break;
    }

    if (event.duration_us.has_value()) {
        duration_sample_count_++;
        duration_sum_us_ += event.duration_us.value();
        metrics_.average_solve_duration_us =
            duration_sum_us_ / static_cast<double>(duration_sample_count_);
    }

    if (occupancy_cb_ && event.occupancy.has_value() &&
        event.occupancy.value() > occupancy_threshold_) {
        occupancy_cb_("Occupancy " + std::to_string(event.occupancy.value() * 100.0) +
                      "% exceeds threshold");
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    duration_sample_count_ = 0;
    duration_sum_us_ = 0.0;
}

void MetricsMonitor::set_occupancy_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    occupancy_threshold_ = threshold;
    occupancy_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

} // namespace erlangcore
