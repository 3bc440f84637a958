/**
 * @file task_arena.hpp
 * @brief Id-keyed storage of all live tasks.
 * @author Dimitris Kafetzis
 *
 * Each task is stored exactly once. Per-vehicle task lists and the global
 * per-cycle task order hold task ids, never copies, so a cycle's updates
 * (nearest node, allocation) have a single place to land.
 */

#pragma once

#include "workload/task.hpp"

#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace edge_twin {

class TaskArena {
public:
    TaskArena() = default;

    // ── Construction ──────────────────────────

    /// Insert a task and append it to its owner's list. Replaces an existing
    /// task with the same id in place.
    TaskId add_task(Task task);

    /// Remove an owner and every task it holds. Returns the number of tasks removed.
    size_t remove_owner(const VehicleId& owner);

    /**
     * @brief Replace a task's size/compute attributes with those of `fresh`.
     *
     * Identity, owner and nearest node are kept; allocation and the last
     * computed latency/energy are cleared.
     */
    bool resample(const TaskId& id, const Task& fresh);

    // ── Per-cycle Updates ─────────────────────

    /// Point all of an owner's tasks at `node` and clear their allocation.
    void reassign_owner(const VehicleId& owner, const NodeId& node);

    /**
     * @brief Write an optimizer result back to the tasks it was computed for.
     *
     * The spans run parallel to `ids`; entries past the shortest span and
     * unknown ids are skipped. Returns the number of tasks updated.
     */
    size_t apply(std::span<const TaskId> ids,
                 std::span<const Location> allocation,
                 std::span<const double> latencies,
                 std::span<const double> energies);

    // ── Queries ───────────────────────────────
    [[nodiscard]] Task* find(const TaskId& id) noexcept;
    [[nodiscard]] const Task* find(const TaskId& id) const noexcept;
    [[nodiscard]] bool has_owner(const VehicleId& owner) const;
    [[nodiscard]] std::vector<TaskId> tasks_of(const VehicleId& owner) const;

    /// All task ids, grouped by owner in owner insertion order.
    [[nodiscard]] std::vector<TaskId> ordered_ids() const;

    /// Copies of the given tasks, in order. Unknown ids are skipped.
    [[nodiscard]] std::vector<Task> materialize(std::span<const TaskId> ids) const;

    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] size_t owner_count() const noexcept { return owner_order_.size(); }

private:
    std::unordered_map<TaskId, Task> tasks_;
    std::unordered_map<VehicleId, std::vector<TaskId>> by_owner_;
    std::vector<VehicleId> owner_order_;
};

}  // namespace edge_twin
