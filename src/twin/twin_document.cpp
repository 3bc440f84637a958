/**
 * @file twin_document.cpp
 * @brief Twin <-> thing document conversion.
 * @author Dimitris Kafetzis
 */

#include "twin/twin_document.hpp"

#include <chrono>
#include <cmath>
#include <type_traits>

namespace edge_twin {

namespace {

TwinDocument feature(TwinDocument properties) {
    return TwinDocument{{"properties", std::move(properties)}};
}

TwinDocument sync_feature(const TwinNode& twin) {
    auto wall = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return feature({
        {"last_sync", round_to(twin.last_sync(), 3)},
        {"timestamp", wall}
    });
}

/// properties[<name>][<key>] or the fallback if any level is missing.
template <typename T>
T feature_value(const TwinDocument& features, const char* name, const char* key, T fallback) {
    auto f = features.find(name);
    if (f == features.end() || !f->is_object()) return fallback;
    auto props = f->find("properties");
    if (props == f->end() || !props->is_object()) return fallback;
    auto v = props->find(key);
    if (v == props->end() || v->is_null()) return fallback;
    try {
        return v->get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

}  // anonymous namespace

double round_to(double value, int digits) noexcept {
    const double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

TwinDocument attributes_of(const TwinNode& twin) {
    TwinDocument attrs{{"type", std::string{thing_type(twin.kind())}}, {"id", twin.id()}};

    std::visit([&attrs](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, EdgeNodeProperties> ||
                      std::is_same_v<P, AggregatorProperties>) {
            attrs["x"] = p.x;
            attrs["y"] = p.y;
            attrs["coverage"] = p.coverage;
            attrs["capacity_mhz"] = p.capacity_mhz;
            attrs["cache_mb"] = p.cache_mb;
        } else if constexpr (std::is_same_v<P, CloudProperties>) {
            attrs["capacity_ghz"] = p.capacity_ghz;
            attrs["power_mw"] = p.power_mw;
        }
    }, twin.properties());

    return attrs;
}

TwinDocument features_of(const TwinNode& twin) {
    TwinDocument features = TwinDocument::object();

    std::visit([&features](const auto& p) {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, VehicleProperties>) {
            features["position"] = feature({{"x", round_to(p.x, 1)}, {"y", round_to(p.y, 1)}});
            features["mobility"] = feature({{"speed_kmh", round_to(p.speed_kmh, 1)}});
            features["connectivity"] = feature({{"connected_rsu", p.connected_node}});
            features["tasks"] = feature({{"count", p.task_count}});
        } else if constexpr (std::is_same_v<P, EdgeNodeProperties>) {
            features["load"] = feature({
                {"current_load", p.load},
                {"utilization_pct", round_to(p.utilization_pct, 1)}
            });
            features["serving"] = feature({{"vehicles_served", p.vehicles_served}});
            features["cache"] = feature({{"cached_tasks", p.cached_tasks}});
        } else if constexpr (std::is_same_v<P, AggregatorProperties>) {
            features["load"] = feature({{"current_load", 0}});
        } else {
            features["utilization"] = feature({{"current_pct", 0}});
        }
    }, twin.properties());

    features["sync"] = sync_feature(twin);
    return features;
}

TwinDocument properties_to_json(const TwinProperties& properties) {
    return std::visit([](const auto& p) -> TwinDocument {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, VehicleProperties>) {
            return {{"x", p.x}, {"y", p.y}, {"speed_kmh", p.speed_kmh},
                    {"connected_node", p.connected_node}, {"task_count", p.task_count}};
        } else if constexpr (std::is_same_v<P, EdgeNodeProperties>) {
            return {{"x", p.x}, {"y", p.y}, {"coverage", p.coverage},
                    {"capacity_mhz", p.capacity_mhz}, {"cache_mb", p.cache_mb},
                    {"load", p.load}, {"vehicles_served", p.vehicles_served},
                    {"utilization_pct", p.utilization_pct}, {"cached_tasks", p.cached_tasks}};
        } else if constexpr (std::is_same_v<P, AggregatorProperties>) {
            return {{"x", p.x}, {"y", p.y}, {"coverage", p.coverage},
                    {"capacity_mhz", p.capacity_mhz}, {"cache_mb", p.cache_mb}};
        } else {
            return {{"capacity_ghz", p.capacity_ghz}, {"power_mw", p.power_mw}};
        }
    }, properties);
}

TwinDocument to_json(const TwinNode& twin) {
    return TwinDocument{
        {"kind", std::string{to_string(twin.kind())}},
        {"id", twin.id()},
        {"properties", properties_to_json(twin.properties())},
        {"last_sync", round_to(twin.last_sync(), 3)},
        {"aoi", round_to(twin.aoi(), 3)},
        {"sync_count", twin.sync_count()}
    };
}

VehicleProperties vehicle_from_thing(const TwinDocument& thing) {
    VehicleProperties props;
    auto f = thing.find("features");
    if (f == thing.end() || !f->is_object()) return props;

    props.x = feature_value(*f, "position", "x", 0.0);
    props.y = feature_value(*f, "position", "y", 0.0);
    props.speed_kmh = feature_value(*f, "mobility", "speed_kmh", 0.0);
    props.connected_node = feature_value(*f, "connectivity", "connected_rsu", std::string{});
    props.task_count = feature_value(*f, "tasks", "count", uint32_t{0});
    return props;
}

}  // namespace edge_twin
