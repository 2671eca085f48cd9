#pragma once
#include "agent_types.hpp"
#include <optional>
#include <mutex>
#include <chrono>

namespace deskmcp {

// Load value used when an instance cannot be sampled.
constexpr double kNeutralLoad = 50.0;

// Ranks instances of one logical agent for load balancing. Lower is better.
// Sampling is best-effort: nullopt means "unknown".
class LoadMetricProvider {
public:
    virtual ~LoadMetricProvider() = default;
    virtual std::optional<double> sample(const AgentRegistration& instance) = 0;
};

// Uses the load each agent last reported (registration, UpdateAgentStatus or
// Ping replies), as stored in the registry entry.
class ReportedLoadMetric : public LoadMetricProvider {
public:
    std::optional<double> sample(const AgentRegistration& instance) override {
        if (instance.cpu_usage < 0.0) return std::nullopt;
        return instance.cpu_usage;
    }
};

// CPU usage of the calling process, in percent of one core, averaged over the
// interval since the previous sample.
class ProcessCpuSampler {
public:
    ProcessCpuSampler();
    double sample();

private:
    std::mutex mutex_;
    double last_cpu_s_ = 0.0;
    std::chrono::steady_clock::time_point last_wall_;
    double last_value_ = 0.0;

    static double process_cpu_seconds();
};

} // namespace deskmcp
