/**
 * @file main.cpp
 * @brief EdgeTwin console runner.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the allocation loop:
 *   Config → Logger → Telemetry → Simulator → TwinStore → Optimizer → CycleDriver
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "cost_model/cost_model.hpp"
#include "orchestrator/cycle_driver.hpp"
#include "scheduler/allocation_optimizer.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "twin/twin_store.hpp"
#include "workload/simulator.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace edge_twin;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║              EdgeTwin v1.0.0              ║
  ║   Twin-Synchronised Task Allocation for   ║
  ║   Vehicular Edge Networks                 ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::optional<uint32_t> steps;
    std::optional<uint64_t> seed;
    std::string log_dir;
    bool force_memory = false;
    bool log_to_stdout = false;
};

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

void print_usage() {
    std::cout << "Usage: edge_twin [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --steps <n>        Number of simulation steps\n"
              << "  --seed <n>         Seed for simulator and optimizer\n"
              << "  --memory           Keep twins in memory, skip the Ditto probe\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --stdout           Log to stdout instead of a file\n"
              << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--steps" && i + 1 < argc) {
            args.steps = parse_number<uint32_t>(argv[++i]);
            if (!args.steps) std::cerr << "Ignoring invalid --steps value\n";
        } else if (arg == "--seed" && i + 1 < argc) {
            args.seed = parse_number<uint64_t>(argv[++i]);
            if (!args.seed) std::cerr << "Ignoring invalid --seed value\n";
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--memory") {
            args.force_memory = true;
        } else if (arg == "--stdout") {
            args.log_to_stdout = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
        }
    }
    return args;
}

std::string format_summary(const std::array<uint32_t, kLocationCount>& summary) {
    std::string out = "{";
    for (auto loc : kAllLocations) {
        if (out.size() > 1) out += ", ";
        out += std::format("{}: {}", label(loc), summary[index_of(loc)]);
    }
    return out + "}";
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.steps) config.simulation.steps = *args.steps;
    if (args.seed) {
        config.simulation.seed = *args.seed;
        config.optimizer.seed = *args.seed;
    }
    if (args.force_memory) config.twin.backend = "memory";
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (args.log_to_stdout || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "edge_twin");
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level '" << config.telemetry.log_level << "', using info\n";
    }
    Logger logger(std::move(log_sink), level.value_or(LogLevel::Info));
    logger.info("EdgeTwin starting...");
    logger.info(std::format("Vehicles: {}, steps: {}, edge nodes: {}",
                            config.simulation.num_vehicles, config.simulation.steps,
                            config.infrastructure.edge_nodes.size()));

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (config.telemetry.metrics && !config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics");
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(telemetry_sink));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Physical Layer + Digital Twin ────────
    StandaloneSimulator simulator(config);
    std::cout << "[MODE] Standalone simulation (" << simulator.vehicle_count() << " vehicles)\n";

    auto store = TwinStore::create(config, &logger);
    metrics.record_backend(store.backend_name(), store.is_remote());
    std::cout << "[DT] Backend: " << store.backend_name() << ", "
              << store.edge_node_ids().size() << " edge node twins\n";

    // ── Optimizer + Driver ───────────────────
    AllocationOptimizer optimizer{CostModel{config.cost}};
    CycleDriver<StandaloneSimulator> driver(simulator, store, optimizer, {
        .optimizer = config.optimizer,
        .metrics = &metrics,
        .logger = &logger
    });

    std::cout << "\n[SIM] Running " << config.simulation.steps << " time steps...\n\n";

    std::vector<CycleRecord> records;
    records.reserve(config.simulation.steps);
    const auto start = std::chrono::steady_clock::now();

    for (uint32_t step = 0; step < config.simulation.steps && !g_shutdown_requested; ++step) {
        const Seconds now = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();

        auto record = driver.run_cycle(now);
        if (!record) {
            std::cerr << "Cycle failed: " << record.error().what() << std::endl;
            logger.flush();
            return 1;
        }

        const auto& r = *record;
        std::cout << std::format(
            "  Step {:3d} | Vehicles: {:3d} | Tasks: {:3d} | Fitness: {:.4f} | "
            "Latency: {:.0f}ms | Load Imb: {:.4f} | AoI: {:.3f}s\n",
            r.step, r.vehicle_count, r.task_count, r.fitness,
            r.total_latency, r.load_imbalance, r.avg_aoi);
        records.push_back(r);
    }

    // ── Summary ──────────────────────────────
    auto summary = CycleDriver<StandaloneSimulator>::summarize(records);
    auto status = store.backend_status();

    std::cout << "\n" << std::string(60, '=') << "\n Summary\n" << std::string(60, '=') << "\n";
    std::cout << std::format("  Avg Fitness:     {:.4f}\n", summary.avg_fitness);
    std::cout << std::format("  Avg Latency:     {:.1f} ms\n", summary.avg_latency);
    std::cout << std::format("  Avg Energy:      {:.1f} mJ\n", summary.avg_energy);
    std::cout << std::format("  Avg AoI:         {:.3f} s\n", summary.avg_aoi);
    std::cout << std::format("  DT Total Syncs:  {}\n", store.total_syncs());
    std::cout << std::format("  DT Things:       {} ({})\n", status.thing_count, status.backend);
    if (!records.empty()) {
        std::cout << "  Last Allocation: " << format_summary(records.back().allocation_summary)
                  << "\n";
    }

    logger.info(std::format("EdgeTwin finished after {} cycles", summary.cycles));
    logger.flush();
    metrics.flush();
    return 0;
}
