/**
 * @file twin_document.hpp
 * @brief Mapping between twins and backend thing documents.
 * @author Dimitris Kafetzis
 *
 * Thing layout:
 *   attributes: static identity ({"type": "vehicle" | "rsu" | "mbs" | "cloud", ...})
 *   features:   dynamic state, one feature per concern, each {"properties": {...}}
 */

#pragma once

#include "twin/twin_backend.hpp"
#include "twin/twin_node.hpp"

#include <string_view>

namespace edge_twin {

/// Value of `attributes/type` for a twin kind.
[[nodiscard]] constexpr std::string_view thing_type(TwinKind kind) noexcept {
    switch (kind) {
        case TwinKind::Vehicle:     return "vehicle";
        case TwinKind::EdgeNode:    return "rsu";
        case TwinKind::Aggregator:  return "mbs";
        case TwinKind::Cloud:       return "cloud";
    }
    return "unknown";
}

/// Round half away from zero to `digits` decimals.
[[nodiscard]] double round_to(double value, int digits) noexcept;

/// Static attributes written when a thing is created.
[[nodiscard]] TwinDocument attributes_of(const TwinNode& twin);

/**
 * @brief Full feature set reflecting the twin's current state.
 *
 * Every feature set carries a `sync` feature with the twin's last sync time
 * (relative seconds) and the wall-clock time the document was built.
 */
[[nodiscard]] TwinDocument features_of(const TwinNode& twin);

/// Property record as a flat JSON object.
[[nodiscard]] TwinDocument properties_to_json(const TwinProperties& properties);

/// Read-only view of one twin: kind, id, properties and freshness counters.
[[nodiscard]] TwinDocument to_json(const TwinNode& twin);

/**
 * @brief Rebuild vehicle properties from a thing's features.
 *
 * Missing features fall back to zero values; used to check what a backend
 * actually holds.
 */
[[nodiscard]] VehicleProperties vehicle_from_thing(const TwinDocument& thing);

}  // namespace edge_twin
