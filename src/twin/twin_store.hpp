/**
 * @file twin_store.hpp
 * @brief Freshness-tracked mirror of the physical environment.
 * @author Dimitris Kafetzis
 *
 * Holds one TwinNode per vehicle and per infrastructure entity, refreshes
 * them from physical snapshots and mirrors every refresh through a single
 * ITwinBackend chosen at construction. Backend failures are counted and
 * logged, never propagated: the in-memory twins are the source of truth.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "twin/twin_backend.hpp"
#include "twin/twin_node.hpp"
#include "workload/physical_state.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace edge_twin {

// ─────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────

/**
 * @brief Outcome of one TwinStore::sync call.
 */
struct SyncRecord {
    Seconds time{0.0};
    uint64_t step{0};
    std::string source = "unknown";
    std::string backend;
    uint32_t vehicles_synced{0};
    uint32_t nodes_synced{0};
    uint32_t backend_synced{0};    ///< Successful feature writes to a remote backend
    uint32_t vehicles_removed{0};
    double avg_aoi{0.0};
    double max_aoi{0.0};
};

struct NodeLoad {
    NodeId id;
    uint32_t load{0};
    uint32_t vehicles_served{0};
    double utilization_pct{0.0};
};

struct VehiclePosition {
    VehicleId id;
    double x{0.0};
    double y{0.0};
    double speed_kmh{0.0};
    NodeId connected_node;
};

struct AoiSample {
    uint64_t step{0};
    double avg_aoi{0.0};
};

struct BackendStatus {
    bool connected{false};         ///< True if documents go to a remote platform
    std::string backend;
    size_t thing_count{0};
    std::string url = "N/A";
    std::vector<std::string> things;
};

/**
 * @brief Consolidated read-only view of the store.
 */
struct TwinStoreSnapshot {
    std::map<VehicleId, TwinNode> vehicles;
    std::vector<TwinNode> edge_nodes;
    std::vector<TwinNode> infrastructure;   ///< Aggregator and cloud
    uint64_t total_syncs{0};
    Seconds uptime{0.0};
    std::string backend;
    bool remote{false};

    [[nodiscard]] size_t twin_count() const noexcept {
        return vehicles.size() + edge_nodes.size() + infrastructure.size();
    }

    [[nodiscard]] TwinDocument to_json() const;
};

// ─────────────────────────────────────────────
// TwinStore
// ─────────────────────────────────────────────

class TwinStore {
public:
    static constexpr std::string_view CLOUD_ID = "CLOUD";

    /**
     * @brief Create the store with an already selected backend.
     *
     * Infrastructure twins (edge nodes, aggregator, cloud) are created from
     * `config` and provisioned in the backend; provisioning failures are
     * logged and ignored.
     */
    TwinStore(const Config& config, std::unique_ptr<ITwinBackend> backend,
              Logger* logger = nullptr);

    /**
     * @brief Probe the configured backend once and fall back to memory.
     *
     * Never fails: an unreachable or misbehaving platform yields a store
     * backed by MemoryTwinBackend for its whole lifetime.
     */
    static TwinStore create(const Config& config, Logger* logger = nullptr);

    TwinStore(TwinStore&&) = default;
    TwinStore& operator=(TwinStore&&) = default;

    /**
     * @brief Refresh twins from a physical snapshot taken at `now`.
     *
     * `now` is in seconds on the caller's clock and must not decrease
     * between calls.
     */
    SyncRecord sync(const PhysicalSnapshot& snapshot, Seconds now);

    /// Sync stamped with the time elapsed since store creation.
    SyncRecord sync(const PhysicalSnapshot& snapshot);

    [[nodiscard]] TwinStoreSnapshot snapshot() const;

    /// Most recent sync record, or a zeroed record before the first sync.
    [[nodiscard]] SyncRecord stats() const;

    // ── Queries ───────────────────────────────
    [[nodiscard]] std::vector<NodeLoad> node_loads() const;
    [[nodiscard]] std::vector<NodeId> edge_node_ids() const;
    [[nodiscard]] std::vector<VehiclePosition> vehicle_positions() const;
    [[nodiscard]] std::vector<AoiSample> aoi_history() const;
    [[nodiscard]] BackendStatus backend_status() const;

    /// What the remote platform holds for `id`; nullopt in memory mode or on failure.
    [[nodiscard]] std::optional<TwinDocument> verify(const std::string& id) const;

    [[nodiscard]] const TwinNode* find(const std::string& id) const;
    [[nodiscard]] size_t vehicle_count() const noexcept { return vehicles_.size(); }
    [[nodiscard]] uint64_t total_syncs() const noexcept { return total_syncs_; }
    [[nodiscard]] bool is_remote() const noexcept { return backend_->is_remote(); }
    [[nodiscard]] std::string_view backend_name() const noexcept { return backend_->name(); }

private:
    void provision(const TwinNode& twin);
    /// Push features to the backend; true when a remote write succeeded.
    bool mirror(const TwinNode& twin);
    [[nodiscard]] Seconds elapsed() const;

    void log_debug(std::string_view msg) const { if (logger_) logger_->debug(msg); }
    void log_warn(std::string_view msg) const { if (logger_) logger_->warn(msg); }

    std::unique_ptr<ITwinBackend> backend_;
    Logger* logger_;
    std::string base_url_;
    size_t history_limit_;
    std::chrono::steady_clock::time_point created_;

    std::map<VehicleId, TwinNode> vehicles_;
    std::vector<TwinNode> edge_nodes_;
    std::unordered_map<NodeId, size_t> edge_index_;
    TwinNode aggregator_;
    TwinNode cloud_;

    uint64_t total_syncs_{0};
    std::optional<SyncRecord> latest_;
    std::deque<SyncRecord> history_;
};

}  // namespace edge_twin
