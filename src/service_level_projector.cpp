#include "erlangcore/service_level_projector.hpp"
#include "erlangcore/erlang_a.hpp"
#include "erlangcore/erlang_b.hpp"
#include "erlangcore/erlang_c.hpp"
#include "erlangcore/exceptions.hpp"
#include "erlangcore/traffic_model.hpp"

#include <algorithm>
#include <string>

namespace erlangcore {

// ========== ErlangBModel ==========

Projection ErlangBModel::project(AgentCount agents, double traffic, double /*aht*/,
                                 double /*threshold_seconds*/) const
{
    Projection p;
    double blocking = erlang_b(agents, traffic);

    p.blocking_probability = blocking;
    p.service_level = std::clamp(1.0 - blocking, 0.0, 1.0);
    p.asa = 0.0;  // Blocked contacts are lost, never queued
    p.wait_probability = 0.0;

    // Occupancy counts only the traffic actually carried
    double carried = traffic * (1.0 - blocking);
    p.occupancy = occupancy(carried, agents);
    return p;
}

// ========== ErlangCModel ==========

Projection ErlangCModel::project(AgentCount agents, double traffic, double aht,
                                 double threshold_seconds) const
{
    Projection p;
    p.wait_probability = erlang_c(agents, traffic);
    p.service_level = service_level(agents, traffic, aht, threshold_seconds);
    p.asa = average_speed_of_answer(agents, traffic, aht);
    p.occupancy = occupancy(traffic, agents);

    if (traffic > 0.0 && static_cast<double>(agents) <= traffic) {
        p.service_level = 0.0;
    }
    return p;
}

// ========== ErlangAModel ==========

ErlangAModel::ErlangAModel(double average_patience)
    : average_patience_(average_patience)
{
    if (!(average_patience_ > 0.0)) {
        throw InvalidConfigException("Erlang A requires a positive average patience, got " +
                                     std::to_string(average_patience_));
    }
}

Projection ErlangAModel::project(AgentCount agents, double traffic, double aht,
                                 double threshold_seconds) const
{
    Projection p;
    p.occupancy = occupancy(traffic, agents);

    double theta = patience_ratio(average_patience_, aht);
    p.wait_probability = wait_probability_with_abandonment(agents, traffic, theta);
    p.service_level = service_level_with_abandonment(agents, traffic, aht,
                                                     threshold_seconds, average_patience_);
    p.asa = asa_with_abandonment(agents, traffic, aht, average_patience_);
    p.abandonment_rate = abandonment_probability(agents, traffic, theta);
    return p;
}

// ========== Factory ==========

std::unique_ptr<QueueModel> make_queue_model(ErlangVariant variant,
                                             const Behavior& behavior)
{
    switch (variant) {
        case ErlangVariant::B:
            return std::make_unique<ErlangBModel>();
        case ErlangVariant::C:
            return std::make_unique<ErlangCModel>();
        case ErlangVariant::A:
            if (!behavior.average_patience_seconds.has_value() ||
                !(*behavior.average_patience_seconds > 0.0)) {
                return nullptr;
            }
            return std::make_unique<ErlangAModel>(*behavior.average_patience_seconds);
    }
    return nullptr;
}

std::optional<Projection> project(ErlangVariant variant, AgentCount agents,
                                  const WorkloadInput& workload,
                                  const Constraints& constraints,
                                  const Behavior& behavior)
{
    auto model = make_queue_model(variant, behavior);
    if (!model) {
        return std::nullopt;
    }

    double aht = effective_aht(workload.aht, behavior.concurrency);
    double traffic = traffic_intensity(workload.volume, aht, workload.interval_seconds());
    return model->project(agents, traffic, aht, constraints.threshold_seconds);
}

} // namespace erlangcore
