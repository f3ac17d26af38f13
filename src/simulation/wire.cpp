/// @file wire.cpp
/// @brief Wire class implementation

#include "simulation/wire.hpp"

#include <algorithm>

namespace trilogic {

Wire::Wire(WireId id) : id_(id) {}

bool Wire::contains(PointId point) const {
    return std::find(connections_.begin(), connections_.end(), point) != connections_.end();
}

void Wire::add_connection(PointId point) {
    connections_.push_back(point);
}

bool Wire::remove_connection(PointId point) {
    auto it = std::find(connections_.begin(), connections_.end(), point);
    if (it == connections_.end()) {
        return false;
    }
    connections_.erase(it);
    return true;
}

std::string Wire::to_string() const {
    return "Wire<" + std::to_string(connections_.size()) + " conns>";
}

} // namespace trilogic
