/**
 * @file cycle_driver.hpp
 * @brief Sequential snapshot -> twin sync -> optimise -> apply loop.
 * @author Dimitris Kafetzis
 *
 * Cycles never overlap. The driver is the only writer of task allocations
 * and node-load feedback; the twin store is written only through sync().
 *
 * Template-parameterized on SourceT for testability (StandaloneSimulator or
 * a scripted source).
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "orchestrator/cycle_record.hpp"
#include "scheduler/allocation_optimizer.hpp"
#include "telemetry/metrics_collector.hpp"
#include "twin/twin_store.hpp"
#include "workload/physical_state.hpp"
#include "workload/simulator.hpp"
#include "workload/task_arena.hpp"

#include <chrono>
#include <format>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace edge_twin {

template <PhysicalSourceLike SourceT = StandaloneSimulator>
class CycleDriver {
public:
    struct Options {
        OptimizerConfig optimizer;
        MetricsCollector* metrics = nullptr;
        Logger* logger = nullptr;
    };

    CycleDriver(SourceT& source, TwinStore& store, AllocationOptimizer& optimizer, Options opts);

    // Non-copyable
    CycleDriver(const CycleDriver&) = delete;
    CycleDriver& operator=(const CycleDriver&) = delete;

    /**
     * @brief Run one full cycle with the twin sync stamped at `now`.
     *
     * An invalid optimizer configuration is returned as an error after the
     * sync; no allocation is applied in that case.
     */
    Result<CycleRecord> run_cycle(Seconds now);

    /// Run `steps` cycles at `start`, `start + dt`, ...; stops at the first error.
    Result<std::vector<CycleRecord>> run(uint32_t steps, Seconds start = 0.0, Seconds dt = 1.0);

    /// Optimizer settings for subsequent cycles.
    void set_optimizer_config(OptimizerConfig config) { config_ = std::move(config); }
    [[nodiscard]] const OptimizerConfig& optimizer_config() const noexcept { return config_; }

    [[nodiscard]] const std::optional<AllocationResult>& last_result() const noexcept {
        return last_result_;
    }

    [[nodiscard]] static RunSummary summarize(std::span<const CycleRecord> records);

private:
    void feed_back_loads(std::span<const NodeId> nodes,
                         const std::vector<Task>& tasks,
                         const AllocationResult& result);

    SourceT& source_;
    TwinStore& store_;
    AllocationOptimizer& optimizer_;
    OptimizerConfig config_;
    MetricsCollector* metrics_;
    Logger* logger_;
    std::optional<AllocationResult> last_result_;
};

static_assert(PhysicalSourceLike<StandaloneSimulator>);

// ═══════════════════════════════════════════════
// Template Implementation
// ═══════════════════════════════════════════════

template <PhysicalSourceLike SourceT>
CycleDriver<SourceT>::CycleDriver(SourceT& source, TwinStore& store,
                                  AllocationOptimizer& optimizer, Options opts)
    : source_(source)
    , store_(store)
    , optimizer_(optimizer)
    , config_(std::move(opts.optimizer))
    , metrics_(opts.metrics)
    , logger_(opts.logger) {}

template <PhysicalSourceLike SourceT>
Result<CycleRecord> CycleDriver<SourceT>::run_cycle(Seconds now) {
    // 1. Physical step
    auto snapshot = source_.step();

    // 2. Twin sync
    auto sync = store_.sync(snapshot, now);
    if (metrics_) metrics_->record_sync(sync);

    // 3. Optimise over the arena's current task order
    auto& arena = source_.arena();
    const auto ids = arena.ordered_ids();
    const auto tasks = arena.materialize(ids);
    const auto nodes = store_.edge_node_ids();

    auto t0 = std::chrono::steady_clock::now();
    auto result = optimizer_.run(tasks, nodes, config_);
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    if (!result) {
        if (logger_) {
            logger_->error(std::format("Step {}: optimizer rejected configuration: {}",
                                       snapshot.step, result.error().what()));
        }
        return result.error();
    }
    if (metrics_) metrics_->record_allocation(snapshot.step, *result);

    // 4. Apply allocation with the latency/energy of the chosen location
    const auto& cost = optimizer_.cost_model();
    const auto& alloc = result->best_allocation;
    std::vector<double> latencies;
    std::vector<double> energies;
    latencies.reserve(alloc.size());
    energies.reserve(alloc.size());
    for (size_t i = 0; i < alloc.size(); ++i) {
        latencies.push_back(cost.latency(tasks[i], alloc[i]));
        energies.push_back(cost.energy(tasks[i], alloc[i]));
    }
    arena.apply(ids, alloc, latencies, energies);

    feed_back_loads(nodes, tasks, *result);

    // 5. Record
    const auto& m = result->final_metrics;
    CycleRecord record{
        .step = snapshot.step,
        .time = sync.time,
        .vehicle_count = static_cast<uint32_t>(snapshot.vehicles.size()),
        .task_count = static_cast<uint32_t>(tasks.size()),
        .fitness = result->best_fitness,
        .total_latency = m.total_latency,
        .total_energy = m.total_energy,
        .load_imbalance = m.load_imbalance,
        .served = m.served,
        .allocation_summary = result->allocation_summary,
        .optimize_ms = elapsed,
        .avg_aoi = sync.avg_aoi,
        .max_aoi = sync.max_aoi,
        .backend_synced = sync.backend_synced
    };
    for (size_t i = 0; i < nodes.size() && i < m.node_loads.size(); ++i) {
        record.node_loads[nodes[i]] = m.node_loads[i];
    }

    if (metrics_) metrics_->record_cycle(record);
    if (logger_) {
        logger_->info(std::format(
            "Step {:3d} | vehicles {:3d} | tasks {:3d} | fitness {:.4f} | latency {:.0f} ms"
            " | load imb {:.4f} | aoi {:.3f} s",
            record.step, record.vehicle_count, record.task_count, record.fitness,
            record.total_latency, record.load_imbalance, record.avg_aoi));
    }

    last_result_ = std::move(*result);
    return record;
}

template <PhysicalSourceLike SourceT>
Result<std::vector<CycleRecord>> CycleDriver<SourceT>::run(uint32_t steps, Seconds start,
                                                           Seconds dt) {
    std::vector<CycleRecord> records;
    records.reserve(steps);
    for (uint32_t i = 0; i < steps; ++i) {
        auto record = run_cycle(start + dt * static_cast<double>(i));
        if (!record) return record.error();
        records.push_back(std::move(*record));
    }
    return records;
}

template <PhysicalSourceLike SourceT>
RunSummary CycleDriver<SourceT>::summarize(std::span<const CycleRecord> records) {
    RunSummary summary;
    if (records.empty()) return summary;

    for (const auto& r : records) {
        summary.avg_fitness += r.fitness;
        summary.avg_latency += r.total_latency;
        summary.avg_energy += r.total_energy;
        summary.avg_load_imbalance += r.load_imbalance;
        summary.avg_aoi += r.avg_aoi;
        summary.total_tasks += r.task_count;
        summary.total_served += r.served;
    }

    const auto n = static_cast<double>(records.size());
    summary.cycles = static_cast<uint32_t>(records.size());
    summary.avg_fitness /= n;
    summary.avg_latency /= n;
    summary.avg_energy /= n;
    summary.avg_load_imbalance /= n;
    summary.avg_aoi /= n;
    return summary;
}

template <PhysicalSourceLike SourceT>
void CycleDriver<SourceT>::feed_back_loads(std::span<const NodeId> nodes,
                                           const std::vector<Task>& tasks,
                                           const AllocationResult& result) {
    // Tasks whose output is held at an edge node (served there or relayed)
    std::unordered_map<NodeId, uint32_t> cached;
    for (size_t i = 0; i < tasks.size() && i < result.best_allocation.size(); ++i) {
        auto loc = result.best_allocation[i];
        if (loc == Location::PrimaryNode || loc == Location::NeighborAggregator) {
            ++cached[tasks[i].nearest_node];
        }
    }

    const auto& loads = result.final_metrics.node_loads;
    for (size_t i = 0; i < nodes.size(); ++i) {
        uint32_t load = i < loads.size() ? loads[i] : 0;
        auto it = cached.find(nodes[i]);
        source_.set_node_load(nodes[i], load, it != cached.end() ? it->second : 0);
    }
}

}  // namespace edge_twin
