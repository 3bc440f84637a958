/**
 * @file fitness.hpp
 * @brief Scoring of a candidate allocation vector.
 * @author Dimitris Kafetzis
 *
 * fitness = w1 * total_latency / (n * 100 + 1) + (1 - w1) * load_imbalance
 *
 * Served tasks (latency below the feasibility threshold) contribute their
 * latency and energy; every other task contributes a flat penalty instead.
 * Only served tasks load an edge node: +1 at the primary node, +2 when
 * relayed through the neighbour/aggregator tier. Unserved tasks add no load.
 */

#pragma once

#include "cost_model/cost_model.hpp"
#include "workload/task.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace edge_twin {

/// Latency charged for a task that cannot be served where it was placed.
inline constexpr double kPenaltyLatencyMs = 500.0;

/// Energy charged for a task that cannot be served where it was placed.
inline constexpr double kPenaltyEnergyMj = 100.0;

/// Node load added by a task served at its primary node.
inline constexpr uint32_t kPrimaryNodeLoad = 1;

/// Node load added by a task relayed through the neighbour/aggregator tier.
inline constexpr uint32_t kRelayNodeLoad = 2;

using Allocation = std::vector<Location>;

struct FitnessBreakdown {
    double fitness{0.0};
    double total_latency{0.0};
    double total_energy{0.0};
    double load_imbalance{0.0};
    std::vector<uint32_t> node_loads;   ///< Same order as the evaluator's node list
    uint32_t served{0};
};

/**
 * @brief Population standard deviation of per-node loads.
 *
 * Every node counts, including idle ones; 0 when no load is recorded.
 */
[[nodiscard]] double load_imbalance(std::span<const uint32_t> loads) noexcept;

/**
 * @brief Fitness function bound to one task list and node list.
 *
 * Per-task latency/energy for all four locations is computed once at
 * construction; evaluate() is then a table lookup per task and is safe to
 * call concurrently.
 */
class FitnessEvaluator {
public:
    FitnessEvaluator(const CostModel& cost,
                     std::span<const Task> tasks,
                     std::span<const NodeId> nodes,
                     double w1);

    [[nodiscard]] FitnessBreakdown evaluate(std::span<const Location> allocation) const;

    [[nodiscard]] double fitness(std::span<const Location> allocation) const {
        return evaluate(allocation).fitness;
    }

    [[nodiscard]] size_t task_count() const noexcept { return costs_.size(); }
    [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
    static constexpr int32_t kNoNode = -1;

    struct TaskCost {
        std::array<double, kLocationCount> latency{};
        std::array<double, kLocationCount> energy{};
        int32_t node{kNoNode};   ///< Index into the node list
    };

    std::vector<TaskCost> costs_;
    size_t node_count_;
    double w1_;
};

}  // namespace edge_twin
