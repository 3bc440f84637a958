/**
 * @file ditto_backend.hpp
 * @brief Eclipse Ditto (HTTP API v2) implementation of ITwinBackend.
 * @author Dimitris Kafetzis
 *
 * Things are addressed as `<namespace>:<id>` and governed by a single
 * policy `<namespace>:iov-policy` granting READ/WRITE on things, policies
 * and messages to the basic-auth user.
 */

#pragma once

#include "core/config.hpp"
#include "network/http_client.hpp"
#include "twin/twin_backend.hpp"

#include <memory>
#include <string>

namespace edge_twin {

class DittoTwinBackend : public ITwinBackend {
public:
    static constexpr std::string_view API_PREFIX = "/api/2";
    static constexpr std::string_view POLICY_NAME = "iov-policy";

    DittoTwinBackend(HttpClient client, std::string ns);

    /// Build a client from configuration; does not touch the network.
    static Result<std::unique_ptr<DittoTwinBackend>> from_config(const TwinConfig& config);

    [[nodiscard]] std::string_view name() const noexcept override { return "Eclipse Ditto"; }
    [[nodiscard]] bool is_remote() const noexcept override { return true; }

    Result<void> create(const std::string& id,
                        const TwinDocument& attributes,
                        const TwinDocument& features) override;
    Result<void> replace_features(const std::string& id, const TwinDocument& features) override;
    Result<std::optional<TwinDocument>> read(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<TwinDocument>> list(std::string_view filter) override;

    /// `GET /health`; success only on HTTP 200.
    Result<void> health();

    /// Create the access policy; an existing policy counts as success.
    Result<void> ensure_policy();

    [[nodiscard]] std::string thing_id(std::string_view id) const;
    [[nodiscard]] std::string policy_id() const;

    /// Request body for `PUT /things/{thingId}`.
    [[nodiscard]] TwinDocument thing_document(const std::string& id,
                                              const TwinDocument& attributes,
                                              const TwinDocument& features) const;
    [[nodiscard]] TwinDocument policy_document() const;

private:
    [[nodiscard]] std::string thing_path(std::string_view id) const;

    HttpClient client_;
    std::string ns_;
};

/**
 * @brief Select and check the backend named by `config.backend`.
 *
 * "memory" always succeeds. "ditto" and "auto" build a Ditto backend,
 * require a healthy `/health` and make sure the policy exists; any failure
 * is returned as an error for the caller to fall back on.
 */
Result<std::unique_ptr<ITwinBackend>> probe_backend(const TwinConfig& config);

}  // namespace edge_twin
