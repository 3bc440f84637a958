/**
 * @file simulator.hpp
 * @brief Standalone physical-environment simulator.
 * @author Dimitris Kafetzis
 *
 * Stand-in for an external road simulator: vehicles random-walk inside a
 * rectangle, attach to their nearest edge node and own a handful of tasks
 * stored in a TaskArena. A fraction of tasks is resampled periodically to
 * emulate task churn.
 */

#pragma once

#include "core/config.hpp"
#include "workload/physical_state.hpp"
#include "workload/task_arena.hpp"

#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace edge_twin {

class StandaloneSimulator {
public:
    /// Builds `config.simulation.num_vehicles` vehicles and their tasks.
    explicit StandaloneSimulator(const Config& config);

    /// Advance one step (1 s) and return the resulting snapshot.
    PhysicalSnapshot step();

    /// Snapshot of the current state without advancing.
    [[nodiscard]] PhysicalSnapshot state() const;

    // ── Churn hooks ───────────────────────────
    /// False when `id` is already simulated.
    bool add_vehicle(const VehicleId& id, double x, double y, double speed_kmh, double heading);
    bool remove_vehicle(const VehicleId& id);

    /// Load feedback carried by the next snapshot's node records.
    void set_node_load(const NodeId& node, uint32_t load, uint32_t cached_tasks);

    [[nodiscard]] TaskArena& arena() noexcept { return arena_; }
    [[nodiscard]] const TaskArena& arena() const noexcept { return arena_; }
    [[nodiscard]] uint64_t time_step() const noexcept { return time_step_; }
    [[nodiscard]] size_t vehicle_count() const noexcept { return vehicles_.size(); }

    [[nodiscard]] static constexpr std::string_view source() noexcept { return "Standalone"; }

private:
    struct Vehicle {
        VehicleId id;
        double x{0.0};
        double y{0.0};
        double speed_kmh{0.0};
        double heading{0.0};
        NodeId connected_node;
    };

    struct NodeFeedback {
        uint32_t load{0};
        uint32_t cached_tasks{0};
    };

    void move(Vehicle& vehicle, double dt);
    [[nodiscard]] NodeId nearest_node(double x, double y) const;
    void spawn_tasks(const Vehicle& vehicle);
    [[nodiscard]] Task sample_task(TaskId id, const VehicleId& owner, const NodeId& node);
    void refresh_tasks();

    SimulationConfig sim_;
    TaskConfig task_cfg_;
    std::vector<EdgeNodeSpec> nodes_;

    std::mt19937 rng_;
    uint64_t time_step_{0};
    uint64_t task_counter_{0};
    std::vector<Vehicle> vehicles_;
    std::unordered_map<NodeId, NodeFeedback> feedback_;
    TaskArena arena_;
};

}  // namespace edge_twin
