/**
 * @file config.hpp
 * @brief EdgeTwin configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace edge_twin {

struct SimulationConfig {
    uint32_t steps = 10;
    uint32_t num_vehicles = 50;
    uint64_t seed = 0;                  ///< 0 = seed from std::random_device
    double x_min = 0.0;
    double x_max = 1500.0;
    double y_min = 0.0;
    double y_max = 1500.0;
    double speed_min_kmh = 30.0;
    double speed_max_kmh = 80.0;
    uint32_t churn_interval = 5;        ///< Resample tasks every N steps (0 = never)
};

struct TaskConfig {
    uint32_t per_vehicle_min = 1;       ///< Inclusive
    uint32_t per_vehicle_max = 4;       ///< Exclusive
    double data_size_min_kb = 200.0;
    double data_size_max_kb = 3000.0;
    double output_size_min_kb = 20.0;
    double output_size_max_kb = 1000.0;
    double compute_min_cycles = 1e9;
    double compute_max_cycles = 5e9;
    double time_bounded_probability = 0.6;
};

struct EdgeNodeSpec {
    NodeId id;
    double x = 0.0;
    double y = 0.0;
    double coverage = 450.0;
    double capacity_mhz = 3000.0;
    double cache_mb = 512.0;
};

struct InfrastructureConfig {
    std::vector<EdgeNodeSpec> edge_nodes{
        {"RSU_1", 250.0, 250.0, 450.0, 3000.0, 512.0},
        {"RSU_2", 1250.0, 250.0, 450.0, 3000.0, 512.0},
        {"RSU_3", 750.0, 1250.0, 450.0, 3000.0, 512.0},
    };
    EdgeNodeSpec aggregator{"MBS_1", 750.0, 750.0, 1200.0, 10000.0, 2048.0};
};

/**
 * @brief Network rates (Mbps), power figures and cloud capacity used by the
 *        cost model. Fixed for the lifetime of a run.
 */
struct CostConfig {
    double rate_node_to_client = 50.0;
    double rate_node_to_node = 100.0;
    double rate_node_to_aggregator = 200.0;
    double rate_aggregator_to_cloud = 500.0;
    double rate_client_to_cloud = 20.0;

    double cache_power_per_kb = 0.01;
    double node_power_mw = 200.0;
    double aggregator_power_mw = 300.0;

    double cloud_capacity_ghz = 15.0;
    double cloud_power_mw = 400.0;
    double cloud_capacitance = 1e-28;
};

/**
 * @brief Per-invocation optimizer settings.
 *
 * Signed counts so that a non-positive value from a config file survives
 * until validation at the optimizer entry point.
 */
struct OptimizerConfig {
    int32_t population_size = 30;
    int32_t max_iterations = 100;
    double w1 = 0.5;                    ///< Latency weight; (1 - w1) weighs load imbalance
    std::optional<uint64_t> seed;       ///< Unset = non-deterministic
    uint32_t eval_threads = 0;          ///< 0 = evaluate fitness on the calling thread
};

struct TwinConfig {
    std::string backend = "auto";       ///< "auto", "ditto", "memory"
    std::string base_url = "http://localhost:8080";
    std::string ns = "org.eclipse.ditto";
    std::string username = "ditto";
    std::string password = "ditto";
    uint32_t connect_timeout_ms = 2000;
    uint32_t request_timeout_ms = 5000;
    uint32_t history_limit = 1000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    std::string log_level = "info";
    bool metrics = true;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SimulationConfig simulation;
    TaskConfig tasks;
    InfrastructureConfig infrastructure;
    CostConfig cost;
    OptimizerConfig optimizer;
    TwinConfig twin;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. A missing file or a TOML
 * syntax error yields an Error.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace edge_twin
