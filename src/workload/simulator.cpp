/**
 * @file simulator.cpp
 * @brief StandaloneSimulator: random-walk mobility, nearest-node association
 *        and periodic task churn.
 * @author Dimitris Kafetzis
 */

#include "workload/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <numbers>
#include <numeric>

namespace edge_twin {

namespace {

constexpr double kStepSeconds = 1.0;
constexpr double kHeadingJitter = 0.15;        // rad per step
constexpr double kUtilizationCapacity = 20.0;  // load units at 100 %

std::mt19937 make_rng(uint64_t seed) {
    if (seed != 0) return std::mt19937(static_cast<std::mt19937::result_type>(seed));
    std::random_device rd;
    return std::mt19937(rd());
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

StandaloneSimulator::StandaloneSimulator(const Config& config)
    : sim_(config.simulation)
    , task_cfg_(config.tasks)
    , nodes_(config.infrastructure.edge_nodes)
    , rng_(make_rng(config.simulation.seed)) {
    std::uniform_real_distribution<double> x_dist(sim_.x_min, sim_.x_max);
    std::uniform_real_distribution<double> y_dist(sim_.y_min, sim_.y_max);
    std::uniform_real_distribution<double> speed_dist(sim_.speed_min_kmh, sim_.speed_max_kmh);
    std::uniform_real_distribution<double> heading_dist(0.0, 2.0 * std::numbers::pi);

    for (uint32_t i = 0; i < sim_.num_vehicles; ++i) {
        double x = x_dist(rng_);
        double y = y_dist(rng_);
        double speed = speed_dist(rng_);
        double heading = heading_dist(rng_);
        add_vehicle(std::format("v_{}", i), x, y, speed, heading);
    }
}

bool StandaloneSimulator::add_vehicle(const VehicleId& id, double x, double y,
                                      double speed_kmh, double heading) {
    // Vehicles may own no tasks, so the arena cannot tell whether an id is taken
    if (std::any_of(vehicles_.begin(), vehicles_.end(),
                    [&id](const Vehicle& v) { return v.id == id; })) {
        return false;
    }

    Vehicle vehicle{
        .id = id,
        .x = x,
        .y = y,
        .speed_kmh = speed_kmh,
        .heading = heading,
        .connected_node = nearest_node(x, y)
    };
    spawn_tasks(vehicle);
    vehicles_.push_back(std::move(vehicle));
    return true;
}

bool StandaloneSimulator::remove_vehicle(const VehicleId& id) {
    auto it = std::find_if(vehicles_.begin(), vehicles_.end(),
                           [&id](const Vehicle& v) { return v.id == id; });
    if (it == vehicles_.end()) return false;

    arena_.remove_owner(id);
    vehicles_.erase(it);
    return true;
}

void StandaloneSimulator::set_node_load(const NodeId& node, uint32_t load, uint32_t cached_tasks) {
    feedback_[node] = NodeFeedback{load, cached_tasks};
}

// ─────────────────────────────────────────────
// Step
// ─────────────────────────────────────────────

PhysicalSnapshot StandaloneSimulator::step() {
    ++time_step_;

    for (auto& vehicle : vehicles_) {
        move(vehicle, kStepSeconds);
        vehicle.connected_node = nearest_node(vehicle.x, vehicle.y);
        arena_.reassign_owner(vehicle.id, vehicle.connected_node);
    }

    if (sim_.churn_interval > 0 && time_step_ % sim_.churn_interval == 0) {
        refresh_tasks();
    }

    return state();
}

PhysicalSnapshot StandaloneSimulator::state() const {
    PhysicalSnapshot snap;
    snap.step = time_step_;
    snap.source = std::string{source()};

    std::unordered_map<NodeId, uint32_t> served;
    snap.vehicles.reserve(vehicles_.size());
    for (const auto& v : vehicles_) {
        snap.vehicles.push_back(VehicleRecord{
            .id = v.id,
            .x = std::round(v.x * 10.0) / 10.0,
            .y = std::round(v.y * 10.0) / 10.0,
            .speed_kmh = std::round(v.speed_kmh * 10.0) / 10.0,
            .connected_node = v.connected_node,
            .task_count = static_cast<uint32_t>(arena_.tasks_of(v.id).size())
        });
        if (!v.connected_node.empty()) ++served[v.connected_node];
    }

    snap.nodes.reserve(nodes_.size());
    for (const auto& node : nodes_) {
        NodeRecord record{.id = node.id};
        if (auto it = served.find(node.id); it != served.end()) {
            record.vehicles_served = it->second;
        }
        if (auto it = feedback_.find(node.id); it != feedback_.end()) {
            record.load = it->second.load;
            record.cached_tasks = it->second.cached_tasks;
        }
        double pct = static_cast<double>(record.load) / kUtilizationCapacity * 100.0;
        record.utilization_pct = std::round(std::min(pct, 100.0) * 10.0) / 10.0;
        snap.nodes.push_back(std::move(record));
    }

    return snap;
}

// ─────────────────────────────────────────────
// Mobility
// ─────────────────────────────────────────────

void StandaloneSimulator::move(Vehicle& vehicle, double dt) {
    std::uniform_real_distribution<double> jitter(-kHeadingJitter, kHeadingJitter);

    double speed_ms = vehicle.speed_kmh * 1000.0 / 3600.0;
    vehicle.heading += jitter(rng_);
    vehicle.x += speed_ms * std::cos(vehicle.heading) * dt;
    vehicle.y += speed_ms * std::sin(vehicle.heading) * dt;

    // Reflect off the bounds
    if (vehicle.x < sim_.x_min || vehicle.x > sim_.x_max) {
        vehicle.heading = std::numbers::pi - vehicle.heading;
        vehicle.x = std::clamp(vehicle.x, sim_.x_min, sim_.x_max);
    }
    if (vehicle.y < sim_.y_min || vehicle.y > sim_.y_max) {
        vehicle.heading = -vehicle.heading;
        vehicle.y = std::clamp(vehicle.y, sim_.y_min, sim_.y_max);
    }
}

NodeId StandaloneSimulator::nearest_node(double x, double y) const {
    NodeId best;
    double best_dist = std::numeric_limits<double>::max();
    for (const auto& node : nodes_) {
        double d = std::hypot(node.x - x, node.y - y);
        if (d < best_dist) {
            best_dist = d;
            best = node.id;
        }
    }
    return best;
}

// ─────────────────────────────────────────────
// Tasks
// ─────────────────────────────────────────────

Task StandaloneSimulator::sample_task(TaskId id, const VehicleId& owner, const NodeId& node) {
    std::uniform_real_distribution<double> data_dist(task_cfg_.data_size_min_kb,
                                                     task_cfg_.data_size_max_kb);
    std::uniform_real_distribution<double> out_dist(task_cfg_.output_size_min_kb,
                                                    task_cfg_.output_size_max_kb);
    std::uniform_real_distribution<double> comp_dist(task_cfg_.compute_min_cycles,
                                                     task_cfg_.compute_max_cycles);
    std::bernoulli_distribution bounded(std::clamp(task_cfg_.time_bounded_probability, 0.0, 1.0));

    Task task;
    task.id = std::move(id);
    task.owner = owner;
    task.nearest_node = node;
    task.input_size_kb = data_dist(rng_);
    task.output_size_kb = out_dist(rng_);
    task.compute_cycles = comp_dist(rng_);
    task.time_bounded = bounded(rng_);
    return task;
}

void StandaloneSimulator::spawn_tasks(const Vehicle& vehicle) {
    uint32_t lo = task_cfg_.per_vehicle_min;
    uint32_t hi = std::max(task_cfg_.per_vehicle_max, lo + 1);
    std::uniform_int_distribution<uint32_t> count_dist(lo, hi - 1);

    uint32_t count = count_dist(rng_);
    for (uint32_t k = 0; k < count; ++k) {
        ++task_counter_;
        arena_.add_task(sample_task(std::format("T_{:04d}", task_counter_),
                                    vehicle.id, vehicle.connected_node));
    }
}

void StandaloneSimulator::refresh_tasks() {
    auto ids = arena_.ordered_ids();
    if (ids.empty()) return;

    size_t n = std::max<size_t>(1, ids.size() / 5);
    std::vector<size_t> indices(ids.size());
    std::iota(indices.begin(), indices.end(), size_t{0});
    std::shuffle(indices.begin(), indices.end(), rng_);

    for (size_t i = 0; i < std::min(n, ids.size()); ++i) {
        const auto* old = arena_.find(ids[indices[i]]);
        if (!old) continue;
        auto fresh = sample_task(old->id, old->owner, old->nearest_node);
        arena_.resample(fresh.id, fresh);
    }
}

}  // namespace edge_twin
