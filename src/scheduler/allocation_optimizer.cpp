/**
 * @file allocation_optimizer.cpp
 * @brief AllocationOptimizer: grey-wolf search with leader tracking.
 * @author Dimitris Kafetzis
 *
 * Per iteration t (0-based) of T:
 *   a = 2 - 2t/T
 *   for each member i, task j, leader L in {alpha, beta, delta}:
 *     A = 2a*r1 - a,  C = 2*r2,  X_L = L[j] - A * |C*L[j] - X_i[j]|
 *   X_i[j] = round((X_alpha + X_beta + X_delta) / 3) mod 4,
 *            resampled from the permitted set if not permitted.
 *
 * Alpha only ever improves; beta and delta are always the current
 * population's second and third best.
 */

#include "scheduler/allocation_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <numeric>

namespace edge_twin {

namespace {

using Rng = std::mt19937;

Location random_permitted(const Task& task, Rng& rng) {
    auto choices = permitted_locations(task.time_bounded);
    std::uniform_int_distribution<size_t> pick(0, choices.size() - 1);
    return choices[pick(rng)];
}

Allocation random_allocation(std::span<const Task> tasks, Rng& rng) {
    Allocation alloc;
    alloc.reserve(tasks.size());
    for (const auto& task : tasks) alloc.push_back(random_permitted(task, rng));
    return alloc;
}

/// Indices of `fitness` in ascending order; ties keep population order.
std::vector<size_t> rank(const std::vector<double>& fitness) {
    std::vector<size_t> order(fitness.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return fitness[a] < fitness[b]; });
    return order;
}

/// Round half to even, then reduce into [0, kLocationCount).
int64_t snap(double position) noexcept {
    const auto n = static_cast<int64_t>(kLocationCount);
    const auto r = static_cast<int64_t>(std::nearbyint(position));
    return ((r % n) + n) % n;
}

}  // anonymous namespace

Result<void> validate(const OptimizerConfig& config) {
    if (config.population_size < 1) {
        return Error{std::format("population_size must be >= 1 (got {})", config.population_size),
                     ErrorCode::InvalidArgument};
    }
    if (config.max_iterations < 1) {
        return Error{std::format("max_iterations must be >= 1 (got {})", config.max_iterations),
                     ErrorCode::InvalidArgument};
    }
    if (!std::isfinite(config.w1) || config.w1 < 0.0 || config.w1 > 1.0) {
        return Error{std::format("w1 must be within [0, 1] (got {})", config.w1),
                     ErrorCode::InvalidArgument};
    }
    return Result<void>{};
}

AllocationOptimizer::AllocationOptimizer(CostModel cost)
    : cost_(std::move(cost)) {}

ThreadPool* AllocationOptimizer::pool_for(uint32_t threads) {
    if (threads == 0) return nullptr;
    if (!pool_ || pool_->thread_count() != threads) {
        pool_ = std::make_unique<ThreadPool>(threads);
    }
    return pool_.get();
}

Result<AllocationResult> AllocationOptimizer::run(std::span<const Task> tasks,
                                                  std::span<const NodeId> nodes,
                                                  const OptimizerConfig& config) {
    if (auto ok = validate(config); !ok) return ok.error();

    AllocationResult result;
    if (tasks.empty()) {
        result.final_metrics.node_loads.assign(nodes.size(), 0);
        return result;
    }

    const FitnessEvaluator evaluator{cost_, tasks, nodes, config.w1};
    auto* pool = pool_for(config.eval_threads);

    Rng rng(config.seed ? static_cast<Rng::result_type>(*config.seed)
                        : std::random_device{}());
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    const auto pop = static_cast<size_t>(config.population_size);
    const auto n = tasks.size();

    std::vector<Allocation> wolves;
    wolves.reserve(pop);
    for (size_t i = 0; i < pop; ++i) wolves.push_back(random_allocation(tasks, rng));

    std::vector<double> fitness(pop, 0.0);
    auto evaluate_all = [&] {
        auto score = [&](size_t i) { fitness[i] = evaluator.fitness(wolves[i]); };
        if (pool) {
            pool->parallel_for(pop, score);
        } else {
            for (size_t i = 0; i < pop; ++i) score(i);
        }
    };

    // Missing leader slots in populations below 3 reuse the worst member.
    auto leader = [&](const std::vector<size_t>& order, size_t rank_idx) -> const Allocation& {
        return wolves[order[std::min(rank_idx, order.size() - 1)]];
    };

    evaluate_all();
    auto order = rank(fitness);
    Allocation alpha = leader(order, 0);
    Allocation beta = leader(order, 1);
    Allocation delta = leader(order, 2);
    double alpha_fitness = fitness[order.front()];

    const auto max_iter = static_cast<uint32_t>(config.max_iterations);
    result.convergence.reserve(max_iter);

    for (uint32_t t = 0; t < max_iter; ++t) {
        const double a = 2.0 - 2.0 * static_cast<double>(t) / static_cast<double>(max_iter);

        auto pull = [&](Location lead, Location current) {
            const double r1 = unit(rng);
            const double r2 = unit(rng);
            const double A = 2.0 * a * r1 - a;
            const double C = 2.0 * r2;
            const auto l = static_cast<double>(index_of(lead));
            const auto x = static_cast<double>(index_of(current));
            return l - A * std::abs(C * l - x);
        };

        for (auto& wolf : wolves) {
            for (size_t j = 0; j < n; ++j) {
                const double x1 = pull(alpha[j], wolf[j]);
                const double x2 = pull(beta[j], wolf[j]);
                const double x3 = pull(delta[j], wolf[j]);

                auto loc = *location_from_index(snap((x1 + x2 + x3) / 3.0));
                wolf[j] = tasks[j].permits(loc) ? loc : random_permitted(tasks[j], rng);
            }
        }

        evaluate_all();
        order = rank(fitness);

        if (fitness[order.front()] < alpha_fitness) {
            alpha = wolves[order.front()];
            alpha_fitness = fitness[order.front()];
        }
        beta = leader(order, 1);
        delta = leader(order, 2);

        const auto detail = evaluator.evaluate(alpha);
        result.convergence.push_back(ConvergenceRecord{
            .iteration = t + 1,
            .fitness = alpha_fitness,
            .latency = detail.total_latency,
            .energy = detail.total_energy,
            .load_imbalance = detail.load_imbalance,
            .a = a
        });
    }

    result.final_metrics = evaluator.evaluate(alpha);
    result.best_fitness = alpha_fitness;
    for (auto loc : alpha) ++result.allocation_summary[index_of(loc)];
    result.best_allocation = std::move(alpha);

    return result;
}

}  // namespace edge_twin
