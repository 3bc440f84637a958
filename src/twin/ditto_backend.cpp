/**
 * @file ditto_backend.cpp
 * @brief DittoTwinBackend implementation and backend probing.
 * @author Dimitris Kafetzis
 */

#include "twin/ditto_backend.hpp"

#include <format>

namespace edge_twin {

namespace {

Error status_error(std::string_view what, const HttpResponse& response) {
    constexpr size_t kExcerpt = 200;
    return Error{std::format("{}: HTTP {} {}", what, response.status,
                             response.body.substr(0, kExcerpt)),
                 ErrorCode::Protocol};
}

Result<TwinDocument> parse_body(const HttpResponse& response) {
    auto doc = TwinDocument::parse(response.body, nullptr, false);
    if (doc.is_discarded()) {
        return Error{"Malformed JSON in response body", ErrorCode::Parse};
    }
    return doc;
}

}  // anonymous namespace

DittoTwinBackend::DittoTwinBackend(HttpClient client, std::string ns)
    : client_(std::move(client)), ns_(std::move(ns)) {}

Result<std::unique_ptr<DittoTwinBackend>> DittoTwinBackend::from_config(const TwinConfig& config) {
    if (config.ns.empty()) {
        return Error{"twin.namespace must not be empty", ErrorCode::InvalidArgument};
    }

    auto client = HttpClient::create(config.base_url, config.connect_timeout_ms,
                                     config.request_timeout_ms);
    if (!client) return client.error();
    client->set_basic_auth(config.username, config.password);
    return std::make_unique<DittoTwinBackend>(std::move(*client), config.ns);
}

// ─────────────────────────────────────────────
// Naming
// ─────────────────────────────────────────────

std::string DittoTwinBackend::thing_id(std::string_view id) const {
    return ns_ + ":" + std::string{id};
}

std::string DittoTwinBackend::policy_id() const {
    return ns_ + ":" + std::string{POLICY_NAME};
}

std::string DittoTwinBackend::thing_path(std::string_view id) const {
    return std::string{API_PREFIX} + "/things/" + thing_id(id);
}

TwinDocument DittoTwinBackend::thing_document(const std::string& id,
                                              const TwinDocument& attributes,
                                              const TwinDocument& features) const {
    return TwinDocument{
        {"thingId", thing_id(id)},
        {"policyId", policy_id()},
        {"attributes", attributes.is_null() ? TwinDocument::object() : attributes},
        {"features", features.is_null() ? TwinDocument::object() : features}
    };
}

TwinDocument DittoTwinBackend::policy_document() const {
    const TwinDocument grant_rw{{"grant", {"READ", "WRITE"}}, {"revoke", TwinDocument::array()}};
    return TwinDocument{
        {"policyId", policy_id()},
        {"entries", {
            {"owner", {
                {"subjects", {{"nginx:ditto", {{"type", "nginx basic auth user"}}}}},
                {"resources", {
                    {"thing:/", grant_rw},
                    {"policy:/", grant_rw},
                    {"message:/", grant_rw}
                }}
            }}
        }}
    };
}

// ─────────────────────────────────────────────
// Health / Policy
// ─────────────────────────────────────────────

Result<void> DittoTwinBackend::health() {
    auto response = client_.get("/health");
    if (!response) return response.error();
    if (response->status != 200) {
        return Error{std::format("Health check returned {}", response->status),
                     ErrorCode::Unavailable};
    }
    return Result<void>{};
}

Result<void> DittoTwinBackend::ensure_policy() {
    auto path = std::string{API_PREFIX} + "/policies/" + policy_id();
    auto response = client_.put(path, policy_document().dump());
    if (!response) return response.error();
    if (response->ok() || response->status == 409) return Result<void>{};
    return status_error("Create policy " + policy_id(), *response);
}

// ─────────────────────────────────────────────
// Thing CRUD
// ─────────────────────────────────────────────

Result<void> DittoTwinBackend::create(const std::string& id,
                                      const TwinDocument& attributes,
                                      const TwinDocument& features) {
    auto response = client_.put(thing_path(id), thing_document(id, attributes, features).dump());
    if (!response) return response.error();
    // 409: already exists
    if (response->ok() || response->status == 409) return Result<void>{};
    return status_error("Create thing " + id, *response);
}

Result<void> DittoTwinBackend::replace_features(const std::string& id,
                                                const TwinDocument& features) {
    auto response = client_.put(thing_path(id) + "/features", features.dump());
    if (!response) return response.error();
    if (response->ok()) return Result<void>{};
    if (response->status == 404) {
        return Error{"Thing not found: " + thing_id(id), ErrorCode::NotFound};
    }
    return status_error("Update features of " + id, *response);
}

Result<std::optional<TwinDocument>> DittoTwinBackend::read(const std::string& id) {
    auto response = client_.get(thing_path(id));
    if (!response) return response.error();
    if (response->status == 404) return std::optional<TwinDocument>{};
    if (response->status != 200) return status_error("Read thing " + id, *response);

    auto doc = parse_body(*response);
    if (!doc) return doc.error();
    return std::optional<TwinDocument>{std::move(*doc)};
}

Result<void> DittoTwinBackend::remove(const std::string& id) {
    auto response = client_.del(thing_path(id));
    if (!response) return response.error();
    if (response->status == 200 || response->status == 204) return Result<void>{};
    if (response->status == 404) {
        return Error{"Thing not found: " + thing_id(id), ErrorCode::NotFound};
    }
    return status_error("Delete thing " + id, *response);
}

Result<std::vector<TwinDocument>> DittoTwinBackend::list(std::string_view filter) {
    auto path = std::string{API_PREFIX} + "/search/things";
    if (!filter.empty()) path += "?filter=" + HttpClient::escape(filter);

    auto response = client_.get(path);
    if (!response) return response.error();
    if (response->status != 200) return status_error("Search things", *response);

    auto doc = parse_body(*response);
    if (!doc) return doc.error();

    std::vector<TwinDocument> items;
    if (auto it = doc->find("items"); it != doc->end() && it->is_array()) {
        items.assign(it->begin(), it->end());
    }
    return items;
}

// ─────────────────────────────────────────────
// Probe
// ─────────────────────────────────────────────

Result<std::unique_ptr<ITwinBackend>> probe_backend(const TwinConfig& config) {
    if (config.backend == "memory") {
        return std::unique_ptr<ITwinBackend>{std::make_unique<MemoryTwinBackend>()};
    }
    if (config.backend != "ditto" && config.backend != "auto") {
        return Error{"Unknown twin backend: " + config.backend, ErrorCode::InvalidArgument};
    }

    auto ditto = DittoTwinBackend::from_config(config);
    if (!ditto) return ditto.error();

    if (auto ok = (*ditto)->health(); !ok) return ok.error();
    if (auto ok = (*ditto)->ensure_policy(); !ok) return ok.error();

    return std::unique_ptr<ITwinBackend>{std::move(*ditto)};
}

}  // namespace edge_twin
