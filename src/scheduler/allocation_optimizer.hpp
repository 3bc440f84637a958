/**
 * @file allocation_optimizer.hpp
 * @brief Grey-wolf metaheuristic over discrete task allocations.
 * @author Dimitris Kafetzis
 *
 * A population of allocation vectors is pulled toward the three best
 * candidates found so far (alpha, beta, delta) for a fixed number of
 * iterations. Positions are continuous during the pull and snapped back to
 * a permitted Location per task afterwards.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "cost_model/cost_model.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/fitness.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <random>
#include <span>
#include <vector>

namespace edge_twin {

/**
 * @brief Best-so-far state after one iteration.
 */
struct ConvergenceRecord {
    uint32_t iteration{0};       ///< 1-based
    double fitness{0.0};
    double latency{0.0};
    double energy{0.0};
    double load_imbalance{0.0};
    double a{0.0};               ///< Exploration coefficient used in this iteration
};

struct AllocationResult {
    Allocation best_allocation;
    double best_fitness{0.0};
    FitnessBreakdown final_metrics;
    std::vector<ConvergenceRecord> convergence;
    std::array<uint32_t, kLocationCount> allocation_summary{};   ///< Indexed by Location

    [[nodiscard]] uint32_t count(Location loc) const noexcept {
        return allocation_summary[index_of(loc)];
    }
};

/**
 * @brief Reject population/iteration counts below 1 and w1 outside [0, 1].
 */
Result<void> validate(const OptimizerConfig& config);

class AllocationOptimizer {
public:
    explicit AllocationOptimizer(CostModel cost = CostModel{});

    /**
     * @brief Search for the lowest-fitness allocation of `tasks`.
     *
     * `nodes` is the edge-node list used for load accounting. An empty task
     * list yields a zero result with an empty convergence trace. The only
     * error is an invalid `config`.
     */
    Result<AllocationResult> run(std::span<const Task> tasks,
                                 std::span<const NodeId> nodes,
                                 const OptimizerConfig& config);

    [[nodiscard]] const CostModel& cost_model() const noexcept { return cost_; }

private:
    ThreadPool* pool_for(uint32_t threads);

    CostModel cost_;
    std::unique_ptr<ThreadPool> pool_;
};

}  // namespace edge_twin
