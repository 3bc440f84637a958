/**
 * @file twin_node.cpp
 * @brief TwinNode implementation.
 * @author Dimitris Kafetzis
 */

#include "twin/twin_node.hpp"

#include <utility>

namespace edge_twin {

TwinNode::TwinNode(NodeId id, TwinProperties properties)
    : id_(std::move(id)), properties_(std::move(properties)) {}

bool TwinNode::update(TwinProperties properties, Seconds now) {
    if (kind_of(properties) != kind()) return false;

    // AoI is measured against the previous refresh, before it is overwritten.
    aoi_ = sync_count_ > 0 ? now - last_sync_ : 0.0;
    properties_ = std::move(properties);
    last_sync_ = now;
    ++sync_count_;
    return true;
}

}  // namespace edge_twin
