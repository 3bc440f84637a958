/**
 * @file test_cost_model.cpp
 * @brief Unit tests for the latency/energy cost model.
 * @author Dimitris Kafetzis
 */

#include "cost_model/cost_model.hpp"
#include "workload/task.hpp"

#include <gtest/gtest.h>

using namespace edge_twin;

namespace {

Task make_task(bool time_bounded) {
    Task task;
    task.id = "T_0001";
    task.owner = "v_0";
    task.nearest_node = "RSU_1";
    task.input_size_kb = 1000.0;
    task.output_size_kb = 500.0;
    task.compute_cycles = 3e9;
    task.time_bounded = time_bounded;
    return task;
}

}  // namespace

TEST(CostModelTest, TransferTime) {
    EXPECT_DOUBLE_EQ(transfer_time(500.0, 50.0), 80.0);
    EXPECT_DOUBLE_EQ(transfer_time(0.0, 50.0), 0.0);
}

TEST(CostModelTest, LocalCacheDeferrableIsFree) {
    CostModel model;
    auto task = make_task(false);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::LocalCache), 0.0);
    EXPECT_DOUBLE_EQ(model.energy(task, Location::LocalCache), 5.0);
}

TEST(CostModelTest, LocalCacheTimeBoundedInfeasible) {
    CostModel model;
    auto task = make_task(true);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::LocalCache), kInfeasibleLatencyMs);
    EXPECT_FALSE(is_served(model.latency(task, Location::LocalCache)));
}

TEST(CostModelTest, PrimaryNode) {
    CostModel model;
    auto task = make_task(true);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::PrimaryNode), 80.0);
    // 5 cache + 200 mW * 80 ms
    EXPECT_DOUBLE_EQ(model.energy(task, Location::PrimaryNode), 21.0);
}

TEST(CostModelTest, NeighborAggregator) {
    CostModel model;
    auto task = make_task(true);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::NeighborAggregator), 100.0);
    // 5 cache + 300 mW * 20 ms + 200 mW * 80 ms
    EXPECT_DOUBLE_EQ(model.energy(task, Location::NeighborAggregator), 27.0);
}

TEST(CostModelTest, EdgeTiersInfeasibleForDeferrable) {
    CostModel model;
    auto task = make_task(false);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::PrimaryNode), kInfeasibleLatencyMs);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::NeighborAggregator), kInfeasibleLatencyMs);
}

TEST(CostModelTest, CloudAlwaysFeasible) {
    CostModel model;
    for (bool bounded : {true, false}) {
        auto task = make_task(bounded);
        // 400 offload + 200 execution + 200 return
        EXPECT_NEAR(model.latency(task, Location::Cloud), 800.0, 1e-9);
        EXPECT_TRUE(is_served(model.latency(task, Location::Cloud)));
    }
}

TEST(CostModelTest, CloudEnergy) {
    CostModel model;
    auto task = make_task(true);
    // 400 mW * 400 ms + 1e-28 * 3e9 * (15e9)^2 J + 400 mW * 200 ms
    EXPECT_NEAR(model.energy(task, Location::Cloud), 160.0 + 67500.0 + 80.0, 1e-6);
}

TEST(CostModelTest, CloudExecutionTime) {
    CostModel model;
    EXPECT_DOUBLE_EQ(model.cloud_execution_time(15e9), 1000.0);
}

TEST(CostModelTest, CustomRates) {
    CostConfig cfg;
    cfg.rate_node_to_client = 100.0;
    CostModel model{cfg};
    auto task = make_task(true);
    EXPECT_DOUBLE_EQ(model.latency(task, Location::PrimaryNode), 40.0);
    EXPECT_DOUBLE_EQ(model.config().rate_node_to_client, 100.0);
}

TEST(CostModelTest, FeasibilityThreshold) {
    EXPECT_TRUE(is_served(8999.9));
    EXPECT_FALSE(is_served(9000.0));
}
