/**
 * @file memory_backend.cpp
 * @brief MemoryTwinBackend and the shared attribute-filter parser.
 * @author Dimitris Kafetzis
 */

#include "twin/twin_backend.hpp"

namespace edge_twin {

// ─────────────────────────────────────────────
// Attribute Filter
// ─────────────────────────────────────────────

Result<std::optional<AttributeFilter>> parse_attribute_filter(std::string_view filter) {
    if (filter.empty()) return std::optional<AttributeFilter>{};

    constexpr std::string_view prefix = "eq(attributes/";
    if (!filter.starts_with(prefix) || !filter.ends_with(")")) {
        return Error{"Unsupported filter: " + std::string{filter}, ErrorCode::InvalidArgument};
    }

    auto body = filter.substr(prefix.size(), filter.size() - prefix.size() - 1);
    auto comma = body.find(',');
    if (comma == std::string_view::npos || comma == 0) {
        return Error{"Malformed filter: " + std::string{filter}, ErrorCode::InvalidArgument};
    }

    auto value = body.substr(comma + 1);
    if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
        return Error{"Filter value must be quoted: " + std::string{filter},
                     ErrorCode::InvalidArgument};
    }

    return std::optional<AttributeFilter>{AttributeFilter{
        .key = std::string{body.substr(0, comma)},
        .value = std::string{value.substr(1, value.size() - 2)}
    }};
}

bool AttributeFilter::matches(const TwinDocument& thing) const {
    auto attrs = thing.find("attributes");
    if (attrs == thing.end() || !attrs->is_object()) return false;
    auto field = attrs->find(key);
    if (field == attrs->end()) return false;
    if (field->is_string()) return field->get<std::string>() == value;
    return field->dump() == value;
}

// ─────────────────────────────────────────────
// MemoryTwinBackend
// ─────────────────────────────────────────────

Result<void> MemoryTwinBackend::create(const std::string& id,
                                       const TwinDocument& attributes,
                                       const TwinDocument& features) {
    if (things_.contains(id)) return Result<void>{};

    things_.emplace(id, TwinDocument{
        {"thingId", id},
        {"attributes", attributes.is_null() ? TwinDocument::object() : attributes},
        {"features", features.is_null() ? TwinDocument::object() : features}
    });
    return Result<void>{};
}

Result<void> MemoryTwinBackend::replace_features(const std::string& id,
                                                 const TwinDocument& features) {
    auto it = things_.find(id);
    if (it == things_.end()) {
        return Error{"Thing not found: " + id, ErrorCode::NotFound};
    }
    it->second["features"] = features;
    return Result<void>{};
}

Result<std::optional<TwinDocument>> MemoryTwinBackend::read(const std::string& id) {
    auto it = things_.find(id);
    if (it == things_.end()) return std::optional<TwinDocument>{};
    return std::optional<TwinDocument>{it->second};
}

Result<void> MemoryTwinBackend::remove(const std::string& id) {
    if (things_.erase(id) == 0) {
        return Error{"Thing not found: " + id, ErrorCode::NotFound};
    }
    return Result<void>{};
}

Result<std::vector<TwinDocument>> MemoryTwinBackend::list(std::string_view filter) {
    auto parsed = parse_attribute_filter(filter);
    if (!parsed) return parsed.error();

    std::vector<TwinDocument> out;
    for (const auto& [id, thing] : things_) {
        if (!parsed->has_value() || (*parsed)->matches(thing)) {
            out.push_back(thing);
        }
    }
    return out;
}

}  // namespace edge_twin
