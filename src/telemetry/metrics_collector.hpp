/**
 * @file metrics_collector.hpp
 * @brief Structured per-cycle events for offline analysis.
 * @author Dimitris Kafetzis
 *
 * One NDJSON object per event, each tagged with `"event"`:
 *   twin_sync   one TwinStore::sync outcome
 *   allocation  one optimizer result
 *   cycle       one complete cycle record
 *   backend     twin backend selection outcome
 */

#pragma once

#include "core/logger.hpp"
#include "orchestrator/cycle_record.hpp"
#include "scheduler/allocation_optimizer.hpp"
#include "twin/twin_store.hpp"

#include <memory>
#include <mutex>
#include <string_view>

namespace edge_twin {

class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_sync(const SyncRecord& record);
    void record_allocation(uint64_t step, const AllocationResult& result);
    void record_cycle(const CycleRecord& record);
    void record_backend(std::string_view backend, bool remote, std::string_view detail = {});
    /// `json_payload` that does not parse is recorded as a string with `"malformed": true`.
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

    [[nodiscard]] uint64_t events_emitted() const noexcept;

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    uint64_t events_{0};

    void emit(std::string_view json_line);
};

}  // namespace edge_twin
