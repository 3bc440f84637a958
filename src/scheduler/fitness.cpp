/**
 * @file fitness.cpp
 * @brief FitnessEvaluator implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/fitness.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace edge_twin {

double load_imbalance(std::span<const uint32_t> loads) noexcept {
    if (loads.empty()) return 0.0;

    const double total = std::accumulate(loads.begin(), loads.end(), 0.0);
    if (total <= 0.0) return 0.0;

    const double n = static_cast<double>(loads.size());
    const double mean = total / n;
    double sq = 0.0;
    for (auto l : loads) {
        const double d = static_cast<double>(l) - mean;
        sq += d * d;
    }
    return std::sqrt(sq / n);
}

FitnessEvaluator::FitnessEvaluator(const CostModel& cost,
                                   std::span<const Task> tasks,
                                   std::span<const NodeId> nodes,
                                   double w1)
    : node_count_(nodes.size()), w1_(w1) {
    std::unordered_map<NodeId, int32_t> index;
    index.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        index.try_emplace(nodes[i], static_cast<int32_t>(i));
    }

    costs_.reserve(tasks.size());
    for (const auto& task : tasks) {
        TaskCost c;
        for (auto loc : kAllLocations) {
            c.latency[index_of(loc)] = cost.latency(task, loc);
            c.energy[index_of(loc)] = cost.energy(task, loc);
        }
        if (auto it = index.find(task.nearest_node); it != index.end()) {
            c.node = it->second;
        }
        costs_.push_back(c);
    }
}

FitnessBreakdown FitnessEvaluator::evaluate(std::span<const Location> allocation) const {
    FitnessBreakdown out;
    out.node_loads.assign(node_count_, 0);

    const size_t n = std::min(allocation.size(), costs_.size());
    for (size_t i = 0; i < n; ++i) {
        const auto& c = costs_[i];
        const auto loc = allocation[i];
        const double lat = c.latency[index_of(loc)];

        if (!is_served(lat)) {
            out.total_latency += kPenaltyLatencyMs;
            out.total_energy += kPenaltyEnergyMj;
            continue;
        }

        out.total_latency += lat;
        out.total_energy += c.energy[index_of(loc)];
        ++out.served;

        if (c.node == kNoNode) continue;
        if (loc == Location::PrimaryNode) {
            out.node_loads[static_cast<size_t>(c.node)] += kPrimaryNodeLoad;
        } else if (loc == Location::NeighborAggregator) {
            out.node_loads[static_cast<size_t>(c.node)] += kRelayNodeLoad;
        }
    }

    out.load_imbalance = load_imbalance(out.node_loads);

    const double normalized = out.total_latency / (static_cast<double>(costs_.size()) * 100.0 + 1.0);
    out.fitness = w1_ * normalized + (1.0 - w1_) * out.load_imbalance;
    return out;
}

}  // namespace edge_twin
