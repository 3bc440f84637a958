/**
 * @file cycle_record.hpp
 * @brief Per-step outcome of the sync/optimise/apply cycle.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <map>

namespace edge_twin {

struct CycleRecord {
    uint64_t step{0};
    Seconds time{0.0};
    uint32_t vehicle_count{0};
    uint32_t task_count{0};

    // Optimizer outcome
    double fitness{0.0};
    double total_latency{0.0};
    double total_energy{0.0};
    double load_imbalance{0.0};
    uint32_t served{0};
    std::array<uint32_t, kLocationCount> allocation_summary{};
    std::map<NodeId, uint32_t> node_loads;
    double optimize_ms{0.0};     ///< Wall-clock time of the optimizer run

    // Twin sync outcome
    double avg_aoi{0.0};
    double max_aoi{0.0};
    uint32_t backend_synced{0};
};

/**
 * @brief Averages over a run of cycles.
 */
struct RunSummary {
    uint32_t cycles{0};
    double avg_fitness{0.0};
    double avg_latency{0.0};
    double avg_energy{0.0};
    double avg_load_imbalance{0.0};
    double avg_aoi{0.0};
    uint64_t total_tasks{0};
    uint64_t total_served{0};
};

}  // namespace edge_twin
