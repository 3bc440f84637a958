/**
 * @file twin_backend.hpp
 * @brief Persistence strategy for twin documents (CRUD over named things).
 * @author Dimitris Kafetzis
 *
 * The twin store mirrors every update through exactly one ITwinBackend,
 * chosen once at construction. All calls are best-effort: failures come
 * back as Error values and never as exceptions.
 */

#pragma once

#include "core/result.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edge_twin {

/// A thing as exchanged with a backend: {"thingId", "attributes", "features", ...}.
using TwinDocument = nlohmann::json;

/**
 * @brief Abstract interface for twin persistence (runtime strategy).
 */
class ITwinBackend {
public:
    virtual ~ITwinBackend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// True if documents leave the process (networked platform).
    [[nodiscard]] virtual bool is_remote() const noexcept = 0;

    /// Create a thing; an already existing thing counts as success.
    virtual Result<void> create(const std::string& id,
                                const TwinDocument& attributes,
                                const TwinDocument& features) = 0;

    /// Replace all features of an existing thing.
    virtual Result<void> replace_features(const std::string& id,
                                          const TwinDocument& features) = 0;

    /// Read a thing; nullopt if it does not exist.
    virtual Result<std::optional<TwinDocument>> read(const std::string& id) = 0;

    virtual Result<void> remove(const std::string& id) = 0;

    /**
     * @brief List things matching an RQL-style filter.
     *
     * An empty filter lists everything. Backends must at least understand
     * `eq(attributes/<key>,"<value>")`.
     */
    virtual Result<std::vector<TwinDocument>> list(std::string_view filter) = 0;
};

// ─────────────────────────────────────────────
// MemoryTwinBackend
// ─────────────────────────────────────────────

/**
 * @brief In-process document store; the fallback when no platform is reachable.
 */
class MemoryTwinBackend : public ITwinBackend {
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }
    [[nodiscard]] bool is_remote() const noexcept override { return false; }

    Result<void> create(const std::string& id,
                        const TwinDocument& attributes,
                        const TwinDocument& features) override;
    Result<void> replace_features(const std::string& id, const TwinDocument& features) override;
    Result<std::optional<TwinDocument>> read(const std::string& id) override;
    Result<void> remove(const std::string& id) override;
    Result<std::vector<TwinDocument>> list(std::string_view filter) override;

    [[nodiscard]] size_t size() const noexcept { return things_.size(); }

private:
    std::map<std::string, TwinDocument> things_;
};

/**
 * @brief A parsed `eq(attributes/<key>,"<value>")` filter.
 */
struct AttributeFilter {
    std::string key;
    std::string value;

    [[nodiscard]] bool matches(const TwinDocument& thing) const;
};

/// Parse a filter expression; empty input yields nullopt with success.
Result<std::optional<AttributeFilter>> parse_attribute_filter(std::string_view filter);

}  // namespace edge_twin
