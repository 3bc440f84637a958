/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace edge_twin {

namespace {

/// Read a number that may be written either as a TOML integer or float.
double number_or(toml::node_view<toml::node> node, double fallback) {
    if (auto f = node.value<double>()) return *f;
    if (auto i = node.value<int64_t>()) return static_cast<double>(*i);
    return fallback;
}

template <typename T>
T unsigned_or(toml::node_view<toml::node> node, T fallback) {
    auto v = node.value<int64_t>();
    if (!v || *v < 0) return fallback;
    return static_cast<T>(*v);
}

EdgeNodeSpec parse_node(toml::node_view<toml::node> node, EdgeNodeSpec base) {
    base.id = node["id"].value_or(base.id);
    base.x = number_or(node["x"], base.x);
    base.y = number_or(node["y"], base.y);
    base.coverage = number_or(node["coverage"], base.coverage);
    base.capacity_mhz = number_or(node["capacity_mhz"], base.capacity_mhz);
    base.cache_mb = number_or(node["cache_mb"], base.cache_mb);
    return base;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::NotFound};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [simulation]
        if (auto sim = tbl["simulation"]; sim.is_table()) {
            auto& s = config.simulation;
            s.steps = unsigned_or(sim["steps"], s.steps);
            s.num_vehicles = unsigned_or(sim["num_vehicles"], s.num_vehicles);
            s.seed = unsigned_or(sim["seed"], s.seed);
            s.x_min = number_or(sim["x_min"], s.x_min);
            s.x_max = number_or(sim["x_max"], s.x_max);
            s.y_min = number_or(sim["y_min"], s.y_min);
            s.y_max = number_or(sim["y_max"], s.y_max);
            s.speed_min_kmh = number_or(sim["speed_min_kmh"], s.speed_min_kmh);
            s.speed_max_kmh = number_or(sim["speed_max_kmh"], s.speed_max_kmh);
            s.churn_interval = unsigned_or(sim["churn_interval"], s.churn_interval);
        }

        // [tasks]
        if (auto tasks = tbl["tasks"]; tasks.is_table()) {
            auto& t = config.tasks;
            t.per_vehicle_min = unsigned_or(tasks["per_vehicle_min"], t.per_vehicle_min);
            t.per_vehicle_max = unsigned_or(tasks["per_vehicle_max"], t.per_vehicle_max);
            t.data_size_min_kb = number_or(tasks["data_size_min_kb"], t.data_size_min_kb);
            t.data_size_max_kb = number_or(tasks["data_size_max_kb"], t.data_size_max_kb);
            t.output_size_min_kb = number_or(tasks["output_size_min_kb"], t.output_size_min_kb);
            t.output_size_max_kb = number_or(tasks["output_size_max_kb"], t.output_size_max_kb);
            t.compute_min_cycles = number_or(tasks["compute_min_cycles"], t.compute_min_cycles);
            t.compute_max_cycles = number_or(tasks["compute_max_cycles"], t.compute_max_cycles);
            t.time_bounded_probability =
                number_or(tasks["time_bounded_probability"], t.time_bounded_probability);
        }

        // [infrastructure]
        if (auto infra = tbl["infrastructure"]; infra.is_table()) {
            // [[infrastructure.edge_nodes]]
            if (auto* nodes = infra["edge_nodes"].as_array()) {
                config.infrastructure.edge_nodes.clear();
                for (auto& elem : *nodes) {
                    if (!elem.is_table()) continue;
                    auto node = parse_node(toml::node_view<toml::node>{&elem}, EdgeNodeSpec{});
                    if (node.id.empty()) {
                        return Error{"infrastructure.edge_nodes entry without an id",
                                     ErrorCode::InvalidArgument};
                    }
                    config.infrastructure.edge_nodes.push_back(std::move(node));
                }
            }

            // [infrastructure.aggregator]
            if (auto agg = infra["aggregator"]; agg.is_table()) {
                config.infrastructure.aggregator =
                    parse_node(agg, config.infrastructure.aggregator);
            }
        }

        // [cost]
        if (auto cost = tbl["cost"]; cost.is_table()) {
            auto& c = config.cost;
            c.rate_node_to_client = number_or(cost["rate_node_to_client"], c.rate_node_to_client);
            c.rate_node_to_node = number_or(cost["rate_node_to_node"], c.rate_node_to_node);
            c.rate_node_to_aggregator =
                number_or(cost["rate_node_to_aggregator"], c.rate_node_to_aggregator);
            c.rate_aggregator_to_cloud =
                number_or(cost["rate_aggregator_to_cloud"], c.rate_aggregator_to_cloud);
            c.rate_client_to_cloud = number_or(cost["rate_client_to_cloud"], c.rate_client_to_cloud);
            c.cache_power_per_kb = number_or(cost["cache_power_per_kb"], c.cache_power_per_kb);
            c.node_power_mw = number_or(cost["node_power_mw"], c.node_power_mw);
            c.aggregator_power_mw = number_or(cost["aggregator_power_mw"], c.aggregator_power_mw);
            c.cloud_capacity_ghz = number_or(cost["cloud_capacity_ghz"], c.cloud_capacity_ghz);
            c.cloud_power_mw = number_or(cost["cloud_power_mw"], c.cloud_power_mw);
            c.cloud_capacitance = number_or(cost["cloud_capacitance"], c.cloud_capacitance);
        }

        // [optimizer]
        if (auto opt = tbl["optimizer"]; opt.is_table()) {
            auto& o = config.optimizer;
            o.population_size = static_cast<int32_t>(
                opt["population_size"].value_or(int64_t{o.population_size}));
            o.max_iterations = static_cast<int32_t>(
                opt["max_iterations"].value_or(int64_t{o.max_iterations}));
            o.w1 = number_or(opt["w1"], o.w1);
            if (auto seed = opt["seed"].value<int64_t>(); seed && *seed > 0) {
                o.seed = static_cast<uint64_t>(*seed);
            }
            o.eval_threads = unsigned_or(opt["eval_threads"], o.eval_threads);
        }

        // [twin]
        if (auto twin = tbl["twin"]; twin.is_table()) {
            auto& t = config.twin;
            t.backend = twin["backend"].value_or(t.backend);
            t.base_url = twin["base_url"].value_or(t.base_url);
            t.ns = twin["namespace"].value_or(t.ns);
            t.username = twin["username"].value_or(t.username);
            t.password = twin["password"].value_or(t.password);
            t.connect_timeout_ms = unsigned_or(twin["connect_timeout_ms"], t.connect_timeout_ms);
            t.request_timeout_ms = unsigned_or(twin["request_timeout_ms"], t.request_timeout_ms);
            t.history_limit = unsigned_or(twin["history_limit"], t.history_limit);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir =
                telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.log_level =
                telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics = telemetry["metrics"].value_or(true);
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::Parse};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace edge_twin
