/**
 * @file task_arena.cpp
 * @brief TaskArena implementation.
 * @author Dimitris Kafetzis
 */

#include "workload/task_arena.hpp"

#include <algorithm>

namespace edge_twin {

TaskId TaskArena::add_task(Task task) {
    TaskId id = task.id;
    if (!by_owner_.contains(task.owner)) {
        owner_order_.push_back(task.owner);
    }
    auto& owned = by_owner_[task.owner];

    if (auto it = tasks_.find(id); it != tasks_.end()) {
        // Same id: overwrite in place, keeping its slot in the owner list.
        if (it->second.owner != task.owner) {
            const VehicleId old_owner = it->second.owner;
            auto& old_list = by_owner_[old_owner];
            std::erase(old_list, id);
            if (old_list.empty()) {
                by_owner_.erase(old_owner);
                std::erase(owner_order_, old_owner);
            }
            owned.push_back(id);
        }
        it->second = std::move(task);
        return id;
    }

    owned.push_back(id);
    tasks_.emplace(id, std::move(task));
    return id;
}

size_t TaskArena::remove_owner(const VehicleId& owner) {
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) return 0;

    size_t removed = 0;
    for (const auto& id : it->second) {
        removed += tasks_.erase(id);
    }
    by_owner_.erase(it);
    std::erase(owner_order_, owner);
    return removed;
}

bool TaskArena::resample(const TaskId& id, const Task& fresh) {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;

    auto& task = it->second;
    task.input_size_kb = fresh.input_size_kb;
    task.output_size_kb = fresh.output_size_kb;
    task.compute_cycles = fresh.compute_cycles;
    task.time_bounded = fresh.time_bounded;
    task.allocation.reset();
    task.latency_ms = 0.0;
    task.energy_mj = 0.0;
    return true;
}

void TaskArena::reassign_owner(const VehicleId& owner, const NodeId& node) {
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) return;

    for (const auto& id : it->second) {
        if (auto task = tasks_.find(id); task != tasks_.end()) {
            task->second.nearest_node = node;
            task->second.allocation.reset();
        }
    }
}

size_t TaskArena::apply(std::span<const TaskId> ids,
                        std::span<const Location> allocation,
                        std::span<const double> latencies,
                        std::span<const double> energies) {
    const size_t n = std::min({ids.size(), allocation.size(), latencies.size(), energies.size()});
    size_t updated = 0;
    for (size_t i = 0; i < n; ++i) {
        auto* task = find(ids[i]);
        if (!task) continue;
        task->allocation = allocation[i];
        task->latency_ms = latencies[i];
        task->energy_mj = energies[i];
        ++updated;
    }
    return updated;
}

Task* TaskArena::find(const TaskId& id) noexcept {
    auto it = tasks_.find(id);
    return it != tasks_.end() ? &it->second : nullptr;
}

const Task* TaskArena::find(const TaskId& id) const noexcept {
    auto it = tasks_.find(id);
    return it != tasks_.end() ? &it->second : nullptr;
}

bool TaskArena::has_owner(const VehicleId& owner) const {
    return by_owner_.contains(owner);
}

std::vector<TaskId> TaskArena::tasks_of(const VehicleId& owner) const {
    auto it = by_owner_.find(owner);
    if (it == by_owner_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskArena::ordered_ids() const {
    std::vector<TaskId> order;
    order.reserve(tasks_.size());
    for (const auto& owner : owner_order_) {
        auto it = by_owner_.find(owner);
        if (it == by_owner_.end()) continue;
        order.insert(order.end(), it->second.begin(), it->second.end());
    }
    return order;
}

std::vector<Task> TaskArena::materialize(std::span<const TaskId> ids) const {
    std::vector<Task> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (const auto* task = find(id)) {
            out.push_back(*task);
        }
    }
    return out;
}

}  // namespace edge_twin
