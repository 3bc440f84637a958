/**
 * @file task.hpp
 * @brief Offloadable task generated by a vehicle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <optional>

namespace edge_twin {

/**
 * @brief A unit of offloadable work.
 *
 * Size and compute attributes are fixed at creation. `nearest_node` and
 * `allocation` are refreshed every cycle; `allocation` is unset until the
 * optimizer result for the current cycle has been applied.
 */
struct Task {
    TaskId id;
    VehicleId owner;
    NodeId nearest_node;

    double input_size_kb{0.0};
    double output_size_kb{0.0};
    double compute_cycles{0.0};
    bool time_bounded{false};

    std::optional<Location> allocation;
    double latency_ms{0.0};
    double energy_mj{0.0};

    /// True if `loc` is in this task's permitted location subset.
    [[nodiscard]] bool permits(Location loc) const noexcept {
        return is_permitted(loc, time_bounded);
    }
};

}  // namespace edge_twin
