#pragma once

#include "erlangcore/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace erlangcore {

// Performance of one candidate agent count under a given model
struct Projection {
    double service_level{1.0};
    double asa{0.0};
    double occupancy{0.0};
    double wait_probability{0.0};
    std::optional<double> blocking_probability;
    std::optional<double> abandonment_rate;
};

// Abstract queueing model: agents -> performance
class QueueModel {
public:
    virtual ~QueueModel() = default;

    virtual Projection project(AgentCount agents, double traffic, double aht,
                               double threshold_seconds) const = 0;

    virtual ErlangVariant variant() const = 0;
    virtual std::string name() const = 0;
};

// Loss system. Service level is the success rate 1 - blocking; ASA is 0.
class ErlangBModel : public QueueModel {
public:
    Projection project(AgentCount agents, double traffic, double aht,
                       double threshold_seconds) const override;
    ErlangVariant variant() const override { return ErlangVariant::B; }
    std::string name() const override { return "Erlang B"; }
};

class ErlangCModel : public QueueModel {
public:
    Projection project(AgentCount agents, double traffic, double aht,
                       double threshold_seconds) const override;
    ErlangVariant variant() const override { return ErlangVariant::C; }
    std::string name() const override { return "Erlang C"; }
};

class ErlangAModel : public QueueModel {
public:
    explicit ErlangAModel(double average_patience);

    Projection project(AgentCount agents, double traffic, double aht,
                       double threshold_seconds) const override;
    ErlangVariant variant() const override { return ErlangVariant::A; }
    std::string name() const override { return "Erlang A"; }

    double average_patience() const noexcept { return average_patience_; }

private:
    double average_patience_;
};

// nullptr when the model needs a parameter `behavior` does not carry
std::unique_ptr<QueueModel> make_queue_model(ErlangVariant variant,
                                             const Behavior& behavior);

// One-shot projection for a workload. Empty when the model cannot be built.
std::optional<Projection> project(ErlangVariant variant, AgentCount agents,
                                  const WorkloadInput& workload,
                                  const Constraints& constraints,
                                  const Behavior& behavior);

} // namespace erlangcore
