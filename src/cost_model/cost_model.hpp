/**
 * @file cost_model.hpp
 * @brief Latency and energy of serving a task from a given location.
 * @author Dimitris Kafetzis
 *
 * Pure functions of (task, location) under a fixed CostConfig. Locations a
 * task may not use are reported with an infeasible latency sentinel rather
 * than an error, so candidates can still be ranked against each other.
 *
 * Units: sizes in KB, rates in Mbps, latency in ms, energy in mJ.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

namespace edge_twin {

struct Task;

/// Latency reported for a location that cannot serve the task.
inline constexpr double kInfeasibleLatencyMs = 9999.0;

/// Any latency at or above this value is treated as unserviceable.
inline constexpr double kFeasibilityThresholdMs = 9000.0;

[[nodiscard]] constexpr bool is_served(double latency_ms) noexcept {
    return latency_ms < kFeasibilityThresholdMs;
}

/**
 * @brief Serialized transfer time of `size_kb` over a link of `rate_mbps`.
 *
 * The factor 8 converts byte-oriented sizes into bit-time.
 */
[[nodiscard]] constexpr double transfer_time(double size_kb, double rate_mbps) noexcept {
    return size_kb / rate_mbps * 8.0;
}

/**
 * @brief Stateless cost evaluator bound to one network/power profile.
 */
class CostModel {
public:
    explicit CostModel(CostConfig config = {}) : config_(config) {}

    [[nodiscard]] double latency(const Task& task, Location location) const noexcept;
    [[nodiscard]] double energy(const Task& task, Location location) const noexcept;

    /// Cloud execution time of `cycles` in ms.
    [[nodiscard]] double cloud_execution_time(double cycles) const noexcept;

    [[nodiscard]] const CostConfig& config() const noexcept { return config_; }

private:
    CostConfig config_;
};

}  // namespace edge_twin
