/**
 * @file test_cycle.cpp
 * @brief Integration tests exercising the full sync/optimise/apply cycle.
 * @author Dimitris Kafetzis
 */

#include "orchestrator/cycle_driver.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "scheduler/allocation_optimizer.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "twin/twin_store.hpp"
#include "workload/simulator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <format>
#include <map>
#include <string_view>

using namespace edge_twin;

namespace {

/// Fixed vehicles and tasks, no mobility; records load feedback.
class ScriptedSource {
public:
    explicit ScriptedSource(uint32_t vehicles) {
        for (uint32_t v = 0; v < vehicles; ++v) {
            VehicleId id = std::format("v_{}", v);
            for (int k = 0; k < 2; ++k) {
                Task task;
                task.id = std::format("T_{}_{}", v, k);
                task.owner = id;
                task.nearest_node = "RSU_1";
                task.input_size_kb = 800.0;
                task.output_size_kb = 400.0;
                task.compute_cycles = 2e9;
                task.time_bounded = (k == 0);
                arena_.add_task(std::move(task));
            }
            ids_.push_back(std::move(id));
        }
    }

    PhysicalSnapshot step() {
        PhysicalSnapshot snap;
        snap.step = ++step_;
        snap.source = std::string{source()};
        for (const auto& id : ids_) {
            snap.vehicles.push_back(VehicleRecord{
                .id = id, .x = 250.0, .y = 250.0, .speed_kmh = 30.0,
                .connected_node = "RSU_1",
                .task_count = static_cast<uint32_t>(arena_.tasks_of(id).size())});
        }
        for (const auto& [node, fb] : feedback_) {
            snap.nodes.push_back(NodeRecord{.id = node, .load = fb.first,
                                            .cached_tasks = fb.second});
        }
        return snap;
    }

    TaskArena& arena() { return arena_; }

    void set_node_load(const NodeId& node, uint32_t load, uint32_t cached) {
        feedback_[node] = {load, cached};
    }

    static constexpr std::string_view source() { return "Scripted"; }

    std::map<NodeId, std::pair<uint32_t, uint32_t>> feedback_;

private:
    uint64_t step_{0};
    std::vector<VehicleId> ids_;
    TaskArena arena_;
};

static_assert(PhysicalSourceLike<ScriptedSource>);

Config memory_config() {
    Config cfg;
    cfg.twin.backend = "memory";
    cfg.simulation.num_vehicles = 8;
    cfg.simulation.seed = 5;
    cfg.optimizer.population_size = 10;
    cfg.optimizer.max_iterations = 10;
    cfg.optimizer.seed = 17;
    return cfg;
}

}  // namespace

// ═══════════════════════════════════════════════
// Scripted Source
// ═══════════════════════════════════════════════

TEST(CycleIntegration, AllocationWrittenBackToArena) {
    auto cfg = memory_config();
    ScriptedSource source{3};
    TwinStore store{cfg, nullptr};
    AllocationOptimizer optimizer{CostModel{cfg.cost}};
    CycleDriver<ScriptedSource> driver{source, store, optimizer, {.optimizer = cfg.optimizer}};

    auto record = driver.run_cycle(0.0);
    ASSERT_TRUE(record.has_value()) << record.error().message;
    EXPECT_EQ(record->step, 1u);
    EXPECT_EQ(record->vehicle_count, 3u);
    EXPECT_EQ(record->task_count, 6u);
    EXPECT_EQ(record->served, 6u);

    ASSERT_TRUE(driver.last_result().has_value());
    const auto& alloc = driver.last_result()->best_allocation;
    auto ids = source.arena().ordered_ids();
    ASSERT_EQ(alloc.size(), ids.size());

    for (size_t i = 0; i < ids.size(); ++i) {
        const auto* task = source.arena().find(ids[i]);
        ASSERT_TRUE(task->allocation.has_value());
        EXPECT_EQ(*task->allocation, alloc[i]);
        EXPECT_TRUE(task->permits(*task->allocation));
        EXPECT_DOUBLE_EQ(task->latency_ms, optimizer.cost_model().latency(*task, alloc[i]));
    }
}

TEST(CycleIntegration, LoadFeedbackReachesTwinOnNextCycle) {
    auto cfg = memory_config();
    ScriptedSource source{4};
    TwinStore store{cfg, nullptr};
    AllocationOptimizer optimizer{CostModel{cfg.cost}};
    CycleDriver<ScriptedSource> driver{source, store, optimizer, {.optimizer = cfg.optimizer}};

    auto first = driver.run_cycle(0.0);
    ASSERT_TRUE(first.has_value());
    ASSERT_EQ(source.feedback_.size(), 3u);

    const auto expected_load = first->node_loads.at("RSU_1");
    EXPECT_EQ(source.feedback_.at("RSU_1").first, expected_load);
    EXPECT_EQ(source.feedback_.at("RSU_2").first, 0u);

    auto second = driver.run_cycle(1.0);
    ASSERT_TRUE(second.has_value());
    const auto* rsu = store.find("RSU_1")->as<EdgeNodeProperties>();
    EXPECT_EQ(rsu->load, expected_load);
    EXPECT_DOUBLE_EQ(second->max_aoi, 1.0);
}

TEST(CycleIntegration, InvalidOptimizerConfigStopsCycle) {
    auto cfg = memory_config();
    ScriptedSource source{2};
    TwinStore store{cfg, nullptr};
    AllocationOptimizer optimizer;

    auto sink = std::make_unique<MemorySink>();
    auto* lines = sink.get();
    Logger logger{std::move(sink), LogLevel::Info, "cycle"};

    auto bad = cfg.optimizer;
    bad.w1 = 2.0;
    CycleDriver<ScriptedSource> driver{source, store, optimizer,
                                       {.optimizer = bad, .logger = &logger}};

    auto record = driver.run_cycle(0.0);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code, ErrorCode::InvalidArgument);
    // Sync happened, allocation did not
    EXPECT_EQ(store.total_syncs(), 1u);
    EXPECT_FALSE(driver.last_result().has_value());
    EXPECT_FALSE(source.arena().find("T_0_0")->allocation.has_value());
    ASSERT_EQ(lines->lines().size(), 1u);
    EXPECT_NE(lines->lines()[0].find("\"error\""), std::string::npos);

    driver.set_optimizer_config(cfg.optimizer);
    EXPECT_TRUE(driver.run_cycle(1.0).has_value());
}

// ═══════════════════════════════════════════════
// Standalone Simulator
// ═══════════════════════════════════════════════

TEST(CycleIntegration, SimulatorRunWithMetrics) {
    auto cfg = memory_config();
    StandaloneSimulator sim{cfg};
    TwinStore store{cfg, nullptr};
    AllocationOptimizer optimizer{CostModel{cfg.cost}};

    auto sink = std::make_unique<MemorySink>();
    auto* events = sink.get();
    MetricsCollector metrics{std::move(sink)};

    CycleDriver<StandaloneSimulator> driver{sim, store, optimizer,
                                            {.optimizer = cfg.optimizer, .metrics = &metrics}};

    auto records = driver.run(4, 0.0, 0.5);
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records->size(), 4u);

    for (const auto& r : *records) {
        EXPECT_EQ(r.vehicle_count, 8u);
        EXPECT_EQ(r.served, r.task_count);
        EXPECT_EQ(r.node_loads.size(), cfg.infrastructure.edge_nodes.size());
    }
    EXPECT_DOUBLE_EQ(records->front().avg_aoi, 0.0);
    EXPECT_DOUBLE_EQ(records->back().max_aoi, 0.5);

    // twin_sync, allocation and cycle per step
    EXPECT_EQ(metrics.events_emitted(), 12u);
    auto first = nlohmann::json::parse(events->lines()[0]);
    EXPECT_EQ(first["event"], "twin_sync");
    EXPECT_EQ(first["source"], "Standalone");

    auto summary = CycleDriver<>::summarize(*records);
    EXPECT_EQ(summary.cycles, 4u);
    EXPECT_GT(summary.total_tasks, 0u);
    EXPECT_EQ(summary.total_served, summary.total_tasks);
    EXPECT_GT(summary.avg_latency, 0.0);
    EXPECT_EQ(store.total_syncs(), 4u);
}

TEST(CycleIntegration, SummarizeEmpty) {
    auto summary = CycleDriver<>::summarize({});
    EXPECT_EQ(summary.cycles, 0u);
    EXPECT_DOUBLE_EQ(summary.avg_fitness, 0.0);
}
