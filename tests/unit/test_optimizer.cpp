/**
 * @file test_optimizer.cpp
 * @brief Unit tests for the fitness function and the allocation optimizer.
 * @author Dimitris Kafetzis
 */

#include "scheduler/allocation_optimizer.hpp"
#include "scheduler/fitness.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>
#include <vector>

using namespace edge_twin;

namespace {

const std::vector<NodeId> kNodes{"RSU_1", "RSU_2", "RSU_3"};

Task make_task(int i, bool bounded, const NodeId& node = "RSU_1") {
    Task task;
    task.id = std::format("T_{:04d}", i);
    task.owner = std::format("v_{}", i % 4);
    task.nearest_node = node;
    task.input_size_kb = 1000.0;
    task.output_size_kb = 500.0;
    task.compute_cycles = 3e9;
    task.time_bounded = bounded;
    return task;
}

std::vector<Task> mixed_tasks(int n) {
    std::vector<Task> tasks;
    for (int i = 0; i < n; ++i) {
        tasks.push_back(make_task(i, i % 3 != 0, kNodes[static_cast<size_t>(i) % kNodes.size()]));
    }
    return tasks;
}

OptimizerConfig seeded(int32_t pop, int32_t iter, double w1, uint64_t seed = 42) {
    OptimizerConfig cfg;
    cfg.population_size = pop;
    cfg.max_iterations = iter;
    cfg.w1 = w1;
    cfg.seed = seed;
    return cfg;
}

}  // namespace

// ═══════════════════════════════════════════════
// Fitness
// ═══════════════════════════════════════════════

TEST(LoadImbalanceTest, PopulationStddev) {
    std::vector<uint32_t> loads{3, 0, 0};
    EXPECT_DOUBLE_EQ(load_imbalance(loads), std::sqrt(2.0));

    std::vector<uint32_t> even{2, 2, 2};
    EXPECT_DOUBLE_EQ(load_imbalance(even), 0.0);

    std::vector<uint32_t> idle{0, 0, 0};
    EXPECT_DOUBLE_EQ(load_imbalance(idle), 0.0);
    EXPECT_DOUBLE_EQ(load_imbalance({}), 0.0);
}

TEST(FitnessEvaluatorTest, PrimaryAndRelayLoads) {
    std::vector<Task> tasks{make_task(0, true, "RSU_1"), make_task(1, true, "RSU_2")};
    FitnessEvaluator eval{CostModel{}, tasks, kNodes, 0.5};

    Allocation alloc{Location::PrimaryNode, Location::NeighborAggregator};
    auto b = eval.evaluate(alloc);

    ASSERT_EQ(b.node_loads.size(), 3u);
    EXPECT_EQ(b.node_loads[0], kPrimaryNodeLoad);
    EXPECT_EQ(b.node_loads[1], kRelayNodeLoad);
    EXPECT_EQ(b.node_loads[2], 0u);
    EXPECT_EQ(b.served, 2u);
    EXPECT_DOUBLE_EQ(b.total_latency, 80.0 + 100.0);
    EXPECT_DOUBLE_EQ(b.total_energy, 21.0 + 27.0);

    const double normalized = 180.0 / (2 * 100.0 + 1.0);
    EXPECT_DOUBLE_EQ(b.fitness, 0.5 * normalized + 0.5 * b.load_imbalance);
    EXPECT_DOUBLE_EQ(eval.fitness(alloc), b.fitness);
}

TEST(FitnessEvaluatorTest, CloudAddsNoNodeLoad) {
    std::vector<Task> tasks{make_task(0, false)};
    FitnessEvaluator eval{CostModel{}, tasks, kNodes, 1.0};

    auto b = eval.evaluate(Allocation{Location::Cloud});
    EXPECT_EQ(b.served, 1u);
    EXPECT_EQ(std::accumulate(b.node_loads.begin(), b.node_loads.end(), 0u), 0u);
    EXPECT_DOUBLE_EQ(b.load_imbalance, 0.0);
}

TEST(FitnessEvaluatorTest, UnknownNearestNodeServedWithoutLoad) {
    std::vector<Task> tasks{make_task(0, true, "RSU_404")};
    FitnessEvaluator eval{CostModel{}, tasks, kNodes, 0.5};

    auto b = eval.evaluate(Allocation{Location::PrimaryNode});
    EXPECT_EQ(b.served, 1u);
    EXPECT_DOUBLE_EQ(b.load_imbalance, 0.0);
}

TEST(FitnessEvaluatorTest, InfeasiblePlacementPenalized) {
    std::vector<Task> tasks{make_task(0, true), make_task(1, false)};
    FitnessEvaluator eval{CostModel{}, tasks, kNodes, 1.0};

    // Time-bounded task cached locally; deferrable task at an edge node
    auto b = eval.evaluate(Allocation{Location::LocalCache, Location::PrimaryNode});
    EXPECT_EQ(b.served, 0u);
    EXPECT_DOUBLE_EQ(b.total_latency, 2 * kPenaltyLatencyMs);
    EXPECT_DOUBLE_EQ(b.total_energy, 2 * kPenaltyEnergyMj);
}

// Infeasible placements are charged the flat penalty only: they never add node
// load, so piling them onto one node leaves the imbalance term untouched.
TEST(FitnessEvaluatorTest, InfeasibleLoadDoesNotAffectImbalance) {
    std::vector<Task> tasks;
    for (int i = 0; i < 6; ++i) tasks.push_back(make_task(i, false, "RSU_1"));
    FitnessEvaluator eval{CostModel{}, tasks, kNodes, 0.0};

    Allocation flooded(tasks.size(), Location::PrimaryNode);
    auto b = eval.evaluate(flooded);
    EXPECT_EQ(b.served, 0u);
    EXPECT_EQ(b.node_loads, (std::vector<uint32_t>{0, 0, 0}));
    EXPECT_DOUBLE_EQ(b.load_imbalance, 0.0);
    EXPECT_DOUBLE_EQ(b.fitness, 0.0);
}

// ═══════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════

TEST(OptimizerConfigTest, Validate) {
    EXPECT_TRUE(validate(seeded(1, 1, 0.0)));
    EXPECT_TRUE(validate(seeded(30, 100, 1.0)));

    for (auto bad : {seeded(0, 10, 0.5), seeded(10, 0, 0.5), seeded(10, 10, -0.1),
                     seeded(10, 10, 1.5), seeded(10, 10, std::nan(""))}) {
        auto r = validate(bad);
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(AllocationOptimizerTest, InvalidConfigRejected) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(4);
    auto r = optimizer.run(tasks, kNodes, seeded(0, 5, 0.5));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

// ═══════════════════════════════════════════════
// Search
// ═══════════════════════════════════════════════

TEST(AllocationOptimizerTest, EmptyTaskList) {
    AllocationOptimizer optimizer;
    auto r = optimizer.run({}, kNodes, seeded(10, 5, 0.5));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->best_allocation.empty());
    EXPECT_TRUE(r->convergence.empty());
    EXPECT_DOUBLE_EQ(r->best_fitness, 0.0);
    EXPECT_EQ(r->final_metrics.node_loads.size(), kNodes.size());
}

TEST(AllocationOptimizerTest, AllocationsStayPermitted) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(30);
    auto r = optimizer.run(tasks, kNodes, seeded(15, 20, 0.5));
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->best_allocation.size(), tasks.size());

    for (size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_TRUE(tasks[i].permits(r->best_allocation[i])) << tasks[i].id;
    }
    EXPECT_EQ(r->final_metrics.served, tasks.size());
}

TEST(AllocationOptimizerTest, AllocationsStayPermittedAtEveryDepth) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(18);

    for (double w1 : {0.0, 0.5, 1.0}) {
        for (int32_t iterations = 1; iterations <= 12; ++iterations) {
            auto r = optimizer.run(tasks, kNodes, seeded(8, iterations, w1, 7));
            ASSERT_TRUE(r.has_value());
            ASSERT_EQ(r->best_allocation.size(), tasks.size());
            ASSERT_EQ(r->convergence.size(), static_cast<size_t>(iterations));

            for (size_t i = 0; i < tasks.size(); ++i) {
                EXPECT_TRUE(tasks[i].permits(r->best_allocation[i]))
                    << tasks[i].id << " w1=" << w1 << " iterations=" << iterations;
            }
            // Permitted allocations are always feasible
            EXPECT_EQ(r->final_metrics.served, tasks.size());
            EXPECT_LT(r->final_metrics.total_latency, 9000.0 * static_cast<double>(tasks.size()));
        }
    }
}

TEST(AllocationOptimizerTest, ConvergenceIsMonotone) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(25);
    auto r = optimizer.run(tasks, kNodes, seeded(12, 30, 0.5));
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->convergence.size(), 30u);

    EXPECT_DOUBLE_EQ(r->convergence.front().a, 2.0);
    for (size_t i = 0; i < r->convergence.size(); ++i) {
        const auto& c = r->convergence[i];
        EXPECT_EQ(c.iteration, i + 1);
        EXPECT_GE(c.fitness, 0.0);
        if (i > 0) {
            EXPECT_LE(c.fitness, r->convergence[i - 1].fitness);
            EXPECT_LT(c.a, r->convergence[i - 1].a);
        }
    }
    EXPECT_DOUBLE_EQ(r->convergence.back().fitness, r->best_fitness);
    EXPECT_DOUBLE_EQ(r->final_metrics.fitness, r->best_fitness);
}

TEST(AllocationOptimizerTest, SummaryMatchesAllocation) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(17);
    auto r = optimizer.run(tasks, kNodes, seeded(8, 10, 0.7));
    ASSERT_TRUE(r.has_value());

    uint32_t total = 0;
    for (auto loc : kAllLocations) {
        auto expected = std::count(r->best_allocation.begin(), r->best_allocation.end(), loc);
        EXPECT_EQ(r->count(loc), static_cast<uint32_t>(expected));
        total += r->count(loc);
    }
    EXPECT_EQ(total, tasks.size());
}

TEST(AllocationOptimizerTest, SeededRunsAreReproducible) {
    AllocationOptimizer a;
    AllocationOptimizer b;
    auto tasks = mixed_tasks(20);

    auto ra = a.run(tasks, kNodes, seeded(10, 15, 0.5, 7));
    auto rb = b.run(tasks, kNodes, seeded(10, 15, 0.5, 7));
    ASSERT_TRUE(ra && rb);
    EXPECT_EQ(ra->best_allocation, rb->best_allocation);
    EXPECT_DOUBLE_EQ(ra->best_fitness, rb->best_fitness);
    ASSERT_EQ(ra->convergence.size(), rb->convergence.size());
    for (size_t i = 0; i < ra->convergence.size(); ++i) {
        EXPECT_DOUBLE_EQ(ra->convergence[i].fitness, rb->convergence[i].fitness);
    }
}

TEST(AllocationOptimizerTest, ParallelEvaluationMatchesSerial) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(40);

    auto serial_cfg = seeded(16, 20, 0.5, 11);
    auto parallel_cfg = serial_cfg;
    parallel_cfg.eval_threads = 4;

    auto serial = optimizer.run(tasks, kNodes, serial_cfg);
    auto parallel = optimizer.run(tasks, kNodes, parallel_cfg);
    ASSERT_TRUE(serial && parallel);
    EXPECT_EQ(serial->best_allocation, parallel->best_allocation);
    EXPECT_DOUBLE_EQ(serial->best_fitness, parallel->best_fitness);
}

TEST(AllocationOptimizerTest, TinyPopulations) {
    AllocationOptimizer optimizer;
    auto tasks = mixed_tasks(6);
    for (int32_t pop : {1, 2}) {
        auto r = optimizer.run(tasks, kNodes, seeded(pop, 5, 0.5));
        ASSERT_TRUE(r.has_value()) << pop;
        EXPECT_EQ(r->convergence.size(), 5u);
        EXPECT_EQ(r->best_allocation.size(), tasks.size());
    }
}

TEST(AllocationOptimizerTest, FiveIdenticalTimeBoundedTasks) {
    std::vector<Task> tasks;
    for (int i = 0; i < 5; ++i) tasks.push_back(make_task(i, true));

    AllocationOptimizer optimizer;
    auto r = optimizer.run(tasks, kNodes, seeded(10, 5, 1.0));
    ASSERT_TRUE(r.has_value());

    EXPECT_EQ(r->convergence.size(), 5u);

    uint32_t total = 0;
    for (auto c : r->allocation_summary) total += c;
    EXPECT_EQ(total, 5u);

    const auto not_cached = 5u - r->count(Location::LocalCache);
    EXPECT_EQ(r->final_metrics.served, not_cached);
}

TEST(AllocationOptimizerTest, LatencyOnlyPrefersPrimaryNode) {
    std::vector<Task> tasks;
    for (int i = 0; i < 3; ++i) tasks.push_back(make_task(i, true));

    AllocationOptimizer optimizer;
    auto r = optimizer.run(tasks, kNodes, seeded(30, 60, 1.0));
    ASSERT_TRUE(r.has_value());

    // Primary node (80 ms) dominates relay (100 ms) and cloud (800 ms)
    EXPECT_EQ(r->count(Location::PrimaryNode), 3u);
    EXPECT_DOUBLE_EQ(r->final_metrics.total_latency, 3 * 80.0);
}
