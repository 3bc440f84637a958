/**
 * @file twin_node.hpp
 * @brief Mirror of one physical entity with freshness accounting.
 * @author Dimitris Kafetzis
 *
 * Properties are a kind-discriminated variant with a fixed schema per
 * entity kind. The variant index *is* the kind, so a twin can never hold
 * another kind's property record.
 */

#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string_view>
#include <variant>

namespace edge_twin {

// ─────────────────────────────────────────────
// Property Schemas
// ─────────────────────────────────────────────

struct VehicleProperties {
    double x{0.0};
    double y{0.0};
    double speed_kmh{0.0};
    NodeId connected_node;
    uint32_t task_count{0};

    bool operator==(const VehicleProperties&) const = default;
};

struct EdgeNodeProperties {
    // Static, from configuration
    double x{0.0};
    double y{0.0};
    double coverage{0.0};
    double capacity_mhz{0.0};
    double cache_mb{0.0};

    // Dynamic, refreshed every sync
    uint32_t load{0};
    uint32_t vehicles_served{0};
    double utilization_pct{0.0};
    uint32_t cached_tasks{0};

    bool operator==(const EdgeNodeProperties&) const = default;
};

struct AggregatorProperties {
    double x{0.0};
    double y{0.0};
    double coverage{0.0};
    double capacity_mhz{0.0};
    double cache_mb{0.0};

    bool operator==(const AggregatorProperties&) const = default;
};

struct CloudProperties {
    double capacity_ghz{0.0};
    double power_mw{0.0};

    bool operator==(const CloudProperties&) const = default;
};

/// Order must match TwinKind.
using TwinProperties = std::variant<VehicleProperties,
                                    EdgeNodeProperties,
                                    AggregatorProperties,
                                    CloudProperties>;

enum class TwinKind : uint8_t {
    Vehicle = 0,
    EdgeNode = 1,
    Aggregator = 2,
    Cloud = 3
};

[[nodiscard]] constexpr std::string_view to_string(TwinKind kind) noexcept {
    switch (kind) {
        case TwinKind::Vehicle:     return "vehicle";
        case TwinKind::EdgeNode:    return "edge_node";
        case TwinKind::Aggregator:  return "aggregator";
        case TwinKind::Cloud:       return "cloud";
    }
    return "unknown";
}

[[nodiscard]] constexpr TwinKind kind_of(const TwinProperties& props) noexcept {
    return static_cast<TwinKind>(props.index());
}

// ─────────────────────────────────────────────
// TwinNode
// ─────────────────────────────────────────────

class TwinNode {
public:
    TwinNode(NodeId id, TwinProperties properties);

    /**
     * @brief Replace the property record and refresh freshness counters.
     *
     * AoI becomes `now - last_sync()` (0 on the first sync). Returns false,
     * leaving the twin untouched, if `properties` is of a different kind.
     */
    bool update(TwinProperties properties, Seconds now);

    [[nodiscard]] TwinKind kind() const noexcept { return kind_of(properties_); }
    [[nodiscard]] const NodeId& id() const noexcept { return id_; }
    [[nodiscard]] const TwinProperties& properties() const noexcept { return properties_; }

    /// Typed access; nullptr if the twin is of another kind.
    template <typename P>
    [[nodiscard]] const P* as() const noexcept { return std::get_if<P>(&properties_); }

    [[nodiscard]] Seconds last_sync() const noexcept { return last_sync_; }
    [[nodiscard]] uint64_t sync_count() const noexcept { return sync_count_; }
    [[nodiscard]] Seconds aoi() const noexcept { return aoi_; }

private:
    NodeId id_;
    TwinProperties properties_;
    Seconds last_sync_{0.0};
    uint64_t sync_count_{0};
    Seconds aoi_{0.0};
};

}  // namespace edge_twin
