/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <nlohmann/json.hpp>

namespace edge_twin {

namespace {

nlohmann::json summary_json(const std::array<uint32_t, kLocationCount>& summary) {
    nlohmann::json out = nlohmann::json::object();
    for (auto loc : kAllLocations) {
        out[std::string{to_string(loc)}] = summary[index_of(loc)];
    }
    return out;
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_sync(const SyncRecord& record) {
    nlohmann::json j{
        {"event", "twin_sync"},
        {"step", record.step},
        {"time", record.time},
        {"source", record.source},
        {"backend", record.backend},
        {"vehicles_synced", record.vehicles_synced},
        {"nodes_synced", record.nodes_synced},
        {"backend_synced", record.backend_synced},
        {"vehicles_removed", record.vehicles_removed},
        {"avg_aoi", record.avg_aoi},
        {"max_aoi", record.max_aoi}
    };
    emit(j.dump());
}

void MetricsCollector::record_allocation(uint64_t step, const AllocationResult& result) {
    const auto& m = result.final_metrics;
    nlohmann::json j{
        {"event", "allocation"},
        {"step", step},
        {"tasks", result.best_allocation.size()},
        {"fitness", result.best_fitness},
        {"latency", m.total_latency},
        {"energy", m.total_energy},
        {"load_imbalance", m.load_imbalance},
        {"served", m.served},
        {"node_loads", m.node_loads},
        {"iterations", result.convergence.size()},
        {"summary", summary_json(result.allocation_summary)}
    };
    emit(j.dump());
}

void MetricsCollector::record_cycle(const CycleRecord& record) {
    nlohmann::json j{
        {"event", "cycle"},
        {"step", record.step},
        {"time", record.time},
        {"vehicles", record.vehicle_count},
        {"tasks", record.task_count},
        {"fitness", record.fitness},
        {"latency", record.total_latency},
        {"energy", record.total_energy},
        {"load_imbalance", record.load_imbalance},
        {"served", record.served},
        {"avg_aoi", record.avg_aoi},
        {"max_aoi", record.max_aoi},
        {"backend_synced", record.backend_synced},
        {"optimize_ms", record.optimize_ms},
        {"node_loads", record.node_loads},
        {"summary", summary_json(record.allocation_summary)}
    };
    emit(j.dump());
}

void MetricsCollector::record_backend(std::string_view backend, bool remote,
                                      std::string_view detail) {
    nlohmann::json j{
        {"event", "backend"},
        {"backend", std::string{backend}},
        {"remote", remote}
    };
    if (!detail.empty()) j["detail"] = std::string{detail};
    emit(j.dump());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    nlohmann::json j{{"event", std::string{event}}};
    auto data = nlohmann::json::parse(json_payload, nullptr, false);
    if (data.is_discarded()) {
        // Not JSON: keep the text so the line stays valid NDJSON
        j["data"] = std::string{json_payload};
        j["malformed"] = true;
    } else {
        j["data"] = std::move(data);
    }
    emit(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    ++events_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

uint64_t MetricsCollector::events_emitted() const noexcept {
    std::lock_guard lock(write_mutex_);
    return events_;
}

}  // namespace edge_twin
