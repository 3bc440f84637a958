/**
 * @file physical_state.hpp
 * @brief Per-cycle snapshot of the physical environment.
 * @author Dimitris Kafetzis
 *
 * Produced by a physical source (simulator, trace replay) and consumed by the
 * twin store. Plain values only; no references into the producer.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace edge_twin {

struct VehicleRecord {
    VehicleId id;
    double x{0.0};
    double y{0.0};
    double speed_kmh{0.0};
    NodeId connected_node;
    uint32_t task_count{0};
};

struct NodeRecord {
    NodeId id;
    uint32_t load{0};
    uint32_t vehicles_served{0};
    double utilization_pct{0.0};
    uint32_t cached_tasks{0};
};

struct PhysicalSnapshot {
    uint64_t step{0};
    std::string source = "unknown";
    std::vector<VehicleRecord> vehicles;
    std::vector<NodeRecord> nodes;

    [[nodiscard]] std::unordered_set<VehicleId> active_vehicle_ids() const {
        std::unordered_set<VehicleId> ids;
        ids.reserve(vehicles.size());
        for (const auto& v : vehicles) ids.insert(v.id);
        return ids;
    }
};

}  // namespace edge_twin
