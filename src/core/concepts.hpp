/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for EdgeTwin interfaces.
 * @author Dimitris Kafetzis
 *
 * Compile-time constraints for components that sit on the per-cycle path.
 * The twin backend is chosen at runtime and stays a virtual interface.
 */

#pragma once

#include "core/types.hpp"

#include <concepts>
#include <cstdint>
#include <string_view>

namespace edge_twin {

// Forward declarations
struct PhysicalSnapshot;
class TaskArena;

// ─────────────────────────────────────────────
// PhysicalSourceLike
// ─────────────────────────────────────────────

/**
 * @concept PhysicalSourceLike
 * @brief Constrains types that produce the physical state of each cycle.
 *
 * A source advances one step per call, owns the live tasks and accepts
 * per-node load feedback that shows up in its next snapshot.
 */
template <typename T>
concept PhysicalSourceLike = requires(T source, const NodeId& node, uint32_t count) {
    { source.step() } -> std::same_as<PhysicalSnapshot>;
    { source.arena() } -> std::same_as<TaskArena&>;
    { source.set_node_load(node, count, count) } -> std::same_as<void>;
    { T::source() } -> std::convertible_to<std::string_view>;
};

}  // namespace edge_twin
