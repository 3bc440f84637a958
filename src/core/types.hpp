/**
 * @file types.hpp
 * @brief Fundamental types used throughout EdgeTwin.
 * @author Dimitris Kafetzis
 *
 * Defines entity identifiers, the execution-location vocabulary and the
 * per-location validity rules shared by the cost model, the optimizer and
 * the simulator. All types are designed for value semantics.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace edge_twin {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using NodeId = std::string;
using VehicleId = std::string;
using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;

/// Seconds relative to some origin (twin store creation, simulation start).
using Seconds = double;

// ─────────────────────────────────────────────
// Execution Location
// ─────────────────────────────────────────────

/**
 * @brief Execution tier a task can be allocated to.
 *
 * The numeric values are part of the optimizer contract: candidate positions
 * are rounded and reduced modulo kLocationCount into this range.
 */
enum class Location : uint8_t {
    LocalCache = 0,           ///< Result served from the vehicle's own cache
    PrimaryNode = 1,          ///< Nearest edge node
    NeighborAggregator = 2,   ///< Neighbouring edge node or regional aggregator
    Cloud = 3                 ///< Remote cloud
};

inline constexpr size_t kLocationCount = 4;

inline constexpr std::array<Location, kLocationCount> kAllLocations{
    Location::LocalCache, Location::PrimaryNode,
    Location::NeighborAggregator, Location::Cloud};

[[nodiscard]] constexpr std::string_view to_string(Location loc) noexcept {
    switch (loc) {
        case Location::LocalCache:          return "local_cache";
        case Location::PrimaryNode:         return "primary_node";
        case Location::NeighborAggregator:  return "neighbor_aggregator";
        case Location::Cloud:               return "cloud";
    }
    return "unknown";
}

/// Human-readable label used in reports and summaries.
[[nodiscard]] constexpr std::string_view label(Location loc) noexcept {
    switch (loc) {
        case Location::LocalCache:          return "Vehicle Cache";
        case Location::PrimaryNode:         return "Primary Node";
        case Location::NeighborAggregator:  return "Neighbor Node/Aggregator";
        case Location::Cloud:               return "Cloud";
    }
    return "Unassigned";
}

[[nodiscard]] constexpr size_t index_of(Location loc) noexcept {
    return static_cast<size_t>(loc);
}

[[nodiscard]] constexpr std::optional<Location> location_from_index(int64_t value) noexcept {
    if (value < 0 || value >= static_cast<int64_t>(kLocationCount)) return std::nullopt;
    return static_cast<Location>(value);
}

// ─────────────────────────────────────────────
// Permitted Location Subsets
// ─────────────────────────────────────────────

inline constexpr std::array<Location, 3> kTimeBoundedLocations{
    Location::PrimaryNode, Location::NeighborAggregator, Location::Cloud};

inline constexpr std::array<Location, 2> kDeferrableLocations{
    Location::LocalCache, Location::Cloud};

/**
 * @brief Locations a task may be assigned to.
 *
 * Time-bounded tasks must be delivered by infrastructure (edge node,
 * aggregator or cloud); all other tasks are either cached locally or sent
 * to the cloud.
 */
[[nodiscard]] constexpr std::span<const Location> permitted_locations(bool time_bounded) noexcept {
    if (time_bounded) return kTimeBoundedLocations;
    return kDeferrableLocations;
}

[[nodiscard]] constexpr bool is_permitted(Location loc, bool time_bounded) noexcept {
    for (auto candidate : permitted_locations(time_bounded)) {
        if (candidate == loc) return true;
    }
    return false;
}

}  // namespace edge_twin
