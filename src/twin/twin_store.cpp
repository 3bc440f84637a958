/**
 * @file twin_store.cpp
 * @brief TwinStore implementation: sync, removal, AoI statistics.
 * @author Dimitris Kafetzis
 */

#include "twin/twin_store.hpp"

#include "twin/ditto_backend.hpp"
#include "twin/twin_document.hpp"

#include <algorithm>
#include <format>

namespace edge_twin {

namespace {

TwinNode edge_node_twin(const EdgeNodeSpec& spec) {
    return TwinNode{spec.id, EdgeNodeProperties{
        .x = spec.x,
        .y = spec.y,
        .coverage = spec.coverage,
        .capacity_mhz = spec.capacity_mhz,
        .cache_mb = spec.cache_mb
    }};
}

TwinNode aggregator_twin(const EdgeNodeSpec& spec) {
    return TwinNode{spec.id, AggregatorProperties{
        .x = spec.x,
        .y = spec.y,
        .coverage = spec.coverage,
        .capacity_mhz = spec.capacity_mhz,
        .cache_mb = spec.cache_mb
    }};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TwinStore::TwinStore(const Config& config, std::unique_ptr<ITwinBackend> backend, Logger* logger)
    : backend_(std::move(backend))
    , logger_(logger)
    , base_url_(config.twin.base_url)
    , history_limit_(config.twin.history_limit)
    , created_(std::chrono::steady_clock::now())
    , aggregator_(aggregator_twin(config.infrastructure.aggregator))
    , cloud_(std::string{CLOUD_ID}, CloudProperties{
          .capacity_ghz = config.cost.cloud_capacity_ghz,
          .power_mw = config.cost.cloud_power_mw}) {
    if (!backend_) backend_ = std::make_unique<MemoryTwinBackend>();

    edge_nodes_.reserve(config.infrastructure.edge_nodes.size());
    for (const auto& spec : config.infrastructure.edge_nodes) {
        if (edge_index_.contains(spec.id)) {
            log_warn(std::format("Duplicate edge node id {} ignored", spec.id));
            continue;
        }
        edge_index_.emplace(spec.id, edge_nodes_.size());
        edge_nodes_.push_back(edge_node_twin(spec));
    }

    for (const auto& twin : edge_nodes_) provision(twin);
    provision(aggregator_);
    provision(cloud_);
}

TwinStore TwinStore::create(const Config& config, Logger* logger) {
    auto backend = probe_backend(config.twin);
    if (!backend) {
        if (logger) {
            logger->warn(std::format("Twin backend '{}' unavailable ({}), using in-memory",
                                     config.twin.backend, backend.error().what()));
        }
        return TwinStore{config, std::make_unique<MemoryTwinBackend>(), logger};
    }

    if (logger) logger->info(std::format("Twin backend: {}", (*backend)->name()));
    return TwinStore{config, std::move(*backend), logger};
}

Seconds TwinStore::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - created_).count();
}

// ─────────────────────────────────────────────
// Backend Mirroring
// ─────────────────────────────────────────────

void TwinStore::provision(const TwinNode& twin) {
    auto ok = backend_->create(twin.id(), attributes_of(twin), features_of(twin));
    if (!ok) {
        log_warn(std::format("Provisioning {} failed: {}", twin.id(), ok.error().what()));
    }
}

bool TwinStore::mirror(const TwinNode& twin) {
    auto ok = backend_->replace_features(twin.id(), features_of(twin));
    if (!ok) {
        log_debug(std::format("Backend update of {} failed: {}", twin.id(), ok.error().what()));
        return false;
    }
    // Only writes to an external platform count as backend syncs
    return backend_->is_remote();
}

// ─────────────────────────────────────────────
// Sync
// ─────────────────────────────────────────────

SyncRecord TwinStore::sync(const PhysicalSnapshot& snapshot) {
    return sync(snapshot, elapsed());
}

SyncRecord TwinStore::sync(const PhysicalSnapshot& snapshot, Seconds now) {
    SyncRecord record{
        .time = round_to(now, 3),
        .step = snapshot.step,
        .source = snapshot.source,
        .backend = std::string{backend_->name()}
    };

    // Vehicles: create-if-absent, then refresh
    for (const auto& v : snapshot.vehicles) {
        auto [it, inserted] = vehicles_.try_emplace(v.id, v.id, VehicleProperties{});
        auto& twin = it->second;

        twin.update(VehicleProperties{
            .x = v.x,
            .y = v.y,
            .speed_kmh = v.speed_kmh,
            .connected_node = v.connected_node,
            .task_count = v.task_count
        }, now);
        ++record.vehicles_synced;

        if (twin.sync_count() == 1) {
            auto created = backend_->create(
                v.id, TwinDocument{{"type", "vehicle"}, {"id", v.id}}, TwinDocument::object());
            if (!created) {
                log_debug(std::format("Backend create of {} failed: {}",
                                      v.id, created.error().what()));
            }
        }
        if (mirror(twin)) ++record.backend_synced;
    }

    // Edge nodes: only configured ids, dynamic fields only
    for (const auto& n : snapshot.nodes) {
        auto idx = edge_index_.find(n.id);
        if (idx == edge_index_.end()) {
            log_debug(std::format("Ignoring record for unknown node {}", n.id));
            continue;
        }

        auto& twin = edge_nodes_[idx->second];
        auto props = *twin.as<EdgeNodeProperties>();
        props.load = n.load;
        props.vehicles_served = n.vehicles_served;
        props.utilization_pct = n.utilization_pct;
        props.cached_tasks = n.cached_tasks;

        twin.update(props, now);
        ++record.nodes_synced;
        if (mirror(twin)) ++record.backend_synced;
    }

    // Stale vehicles
    const auto active = snapshot.active_vehicle_ids();
    for (auto it = vehicles_.begin(); it != vehicles_.end();) {
        if (active.contains(it->first)) {
            ++it;
            continue;
        }
        if (auto removed = backend_->remove(it->first); !removed) {
            log_debug(std::format("Backend delete of {} failed: {}",
                                  it->first, removed.error().what()));
        }
        it = vehicles_.erase(it);
        ++record.vehicles_removed;
    }

    // AoI over vehicles and edge nodes
    double sum = 0.0;
    double max = 0.0;
    size_t count = 0;
    auto accumulate = [&](const TwinNode& twin) {
        sum += twin.aoi();
        max = std::max(max, twin.aoi());
        ++count;
    };
    for (const auto& [id, twin] : vehicles_) accumulate(twin);
    for (const auto& twin : edge_nodes_) accumulate(twin);

    if (count > 0) {
        record.avg_aoi = round_to(sum / static_cast<double>(count), 4);
        record.max_aoi = round_to(max, 4);
    }

    ++total_syncs_;
    latest_ = record;
    if (history_limit_ > 0) {
        history_.push_back(record);
        while (history_.size() > history_limit_) history_.pop_front();
    }

    return record;
}

// ─────────────────────────────────────────────
// Views
// ─────────────────────────────────────────────

TwinStoreSnapshot TwinStore::snapshot() const {
    return TwinStoreSnapshot{
        .vehicles = vehicles_,
        .edge_nodes = edge_nodes_,
        .infrastructure = {aggregator_, cloud_},
        .total_syncs = total_syncs_,
        .uptime = round_to(elapsed(), 1),
        .backend = std::string{backend_->name()},
        .remote = backend_->is_remote()
    };
}

SyncRecord TwinStore::stats() const {
    if (latest_) return *latest_;
    return SyncRecord{.backend = std::string{backend_->name()}};
}

std::vector<NodeLoad> TwinStore::node_loads() const {
    std::vector<NodeLoad> loads;
    loads.reserve(edge_nodes_.size());
    for (const auto& twin : edge_nodes_) {
        const auto* p = twin.as<EdgeNodeProperties>();
        loads.push_back(NodeLoad{
            .id = twin.id(),
            .load = p->load,
            .vehicles_served = p->vehicles_served,
            .utilization_pct = p->utilization_pct
        });
    }
    return loads;
}

std::vector<NodeId> TwinStore::edge_node_ids() const {
    std::vector<NodeId> ids;
    ids.reserve(edge_nodes_.size());
    for (const auto& twin : edge_nodes_) ids.push_back(twin.id());
    return ids;
}

std::vector<VehiclePosition> TwinStore::vehicle_positions() const {
    std::vector<VehiclePosition> out;
    out.reserve(vehicles_.size());
    for (const auto& [id, twin] : vehicles_) {
        const auto* p = twin.as<VehicleProperties>();
        out.push_back(VehiclePosition{
            .id = id,
            .x = p->x,
            .y = p->y,
            .speed_kmh = p->speed_kmh,
            .connected_node = p->connected_node
        });
    }
    return out;
}

std::vector<AoiSample> TwinStore::aoi_history() const {
    std::vector<AoiSample> out;
    out.reserve(history_.size());
    for (const auto& r : history_) out.push_back(AoiSample{r.step, r.avg_aoi});
    return out;
}

BackendStatus TwinStore::backend_status() const {
    BackendStatus status{
        .connected = backend_->is_remote(),
        .backend = std::string{backend_->name()},
    };
    if (status.connected) status.url = base_url_ + "/api/2/things";

    auto things = backend_->list("");
    if (!things) {
        status.backend += " (error)";
        return status;
    }

    status.thing_count = things->size();
    for (const auto& thing : *things) {
        status.things.push_back(thing.value("thingId", std::string{}));
    }
    return status;
}

std::optional<TwinDocument> TwinStore::verify(const std::string& id) const {
    if (!backend_->is_remote()) return std::nullopt;

    auto thing = backend_->read(id);
    if (!thing) {
        log_debug(std::format("Verify {} failed: {}", id, thing.error().what()));
        return std::nullopt;
    }
    return *thing;
}

const TwinNode* TwinStore::find(const std::string& id) const {
    if (auto it = vehicles_.find(id); it != vehicles_.end()) return &it->second;
    if (auto it = edge_index_.find(id); it != edge_index_.end()) return &edge_nodes_[it->second];
    if (id == aggregator_.id()) return &aggregator_;
    if (id == cloud_.id()) return &cloud_;
    return nullptr;
}

// ─────────────────────────────────────────────
// Snapshot Serialization
// ─────────────────────────────────────────────

TwinDocument TwinStoreSnapshot::to_json() const {
    TwinDocument out{
        {"vehicles", TwinDocument::object()},
        {"edge_nodes", TwinDocument::object()},
        {"infrastructure", TwinDocument::object()},
        {"total_syncs", total_syncs},
        {"uptime", uptime},
        {"backend", backend},
        {"remote", remote}
    };
    for (const auto& [id, twin] : vehicles) out["vehicles"][id] = edge_twin::to_json(twin);
    for (const auto& twin : edge_nodes) out["edge_nodes"][twin.id()] = edge_twin::to_json(twin);
    for (const auto& twin : infrastructure) {
        out["infrastructure"][twin.id()] = edge_twin::to_json(twin);
    }
    return out;
}

}  // namespace edge_twin
