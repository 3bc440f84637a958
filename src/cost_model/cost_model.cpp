/**
 * @file cost_model.cpp
 * @brief CostModel implementation.
 * @author Dimitris Kafetzis
 *
 *   LocalCache          : free if deferrable, infeasible if time-bounded
 *   PrimaryNode         : node → client return of the output
 *   NeighborAggregator  : node → aggregator relay, then node → client return
 *   Cloud               : offload input, execute, return output (always valid)
 */

#include "cost_model/cost_model.hpp"

#include "workload/task.hpp"

namespace edge_twin {

namespace {

constexpr double kHz = 1e9;

}  // anonymous namespace

double CostModel::cloud_execution_time(double cycles) const noexcept {
    return cycles / (config_.cloud_capacity_ghz * kHz) * 1000.0;
}

double CostModel::latency(const Task& task, Location location) const noexcept {
    switch (location) {
        case Location::LocalCache:
            return task.time_bounded ? kInfeasibleLatencyMs : 0.0;

        case Location::PrimaryNode:
            if (!task.time_bounded) return kInfeasibleLatencyMs;
            return transfer_time(task.output_size_kb, config_.rate_node_to_client);

        case Location::NeighborAggregator:
            if (!task.time_bounded) return kInfeasibleLatencyMs;
            return transfer_time(task.output_size_kb, config_.rate_node_to_aggregator)
                 + transfer_time(task.output_size_kb, config_.rate_node_to_client);

        case Location::Cloud:
            return transfer_time(task.input_size_kb, config_.rate_client_to_cloud)
                 + cloud_execution_time(task.compute_cycles)
                 + transfer_time(task.output_size_kb, config_.rate_client_to_cloud);
    }
    return kInfeasibleLatencyMs;
}

double CostModel::energy(const Task& task, Location location) const noexcept {
    const double cache_energy = config_.cache_power_per_kb * task.output_size_kb;

    switch (location) {
        case Location::LocalCache:
            return cache_energy;

        case Location::PrimaryNode: {
            double ret = transfer_time(task.output_size_kb, config_.rate_node_to_client);
            return cache_energy + config_.node_power_mw * ret / 1000.0;
        }

        case Location::NeighborAggregator: {
            double relay = transfer_time(task.output_size_kb, config_.rate_node_to_aggregator);
            double ret = transfer_time(task.output_size_kb, config_.rate_node_to_client);
            return cache_energy
                 + config_.aggregator_power_mw * relay / 1000.0
                 + config_.node_power_mw * ret / 1000.0;
        }

        case Location::Cloud: {
            double offload = transfer_time(task.input_size_kb, config_.rate_client_to_cloud);
            double ret = transfer_time(task.output_size_kb, config_.rate_client_to_cloud);
            double clock_hz = config_.cloud_capacity_ghz * kHz;
            double execution = config_.cloud_capacitance * task.compute_cycles * clock_hz * clock_hz;
            return config_.cloud_power_mw * offload / 1000.0
                 + execution * 1000.0
                 + config_.cloud_power_mw * ret / 1000.0;
        }
    }
    return 0.0;
}

}  // namespace edge_twin
