/// @file connection_point.cpp
/// @brief ConnectionPoint link bookkeeping

#include "simulation/connection_point.hpp"

#include "simulation/errors.hpp"

namespace trilogic {

ConnectionPoint::ConnectionPoint(PointId id, PointRole role, TernaryValue value, std::optional<GateId> owner)
    : id_(id), role_(role), value_(value), owner_(owner) {}

void ConnectionPoint::attach(WireId wire) {
    if (wire_.has_value()) {
        throw ConnectionError(to_string() + " already connected to wire " + std::to_string(*wire_));
    }
    wire_ = wire;
}

std::optional<WireId> ConnectionPoint::detach() {
    std::optional<WireId> previous = wire_;
    wire_.reset();
    return previous;
}

std::string ConnectionPoint::to_string() const {
    return "ConnectionPoint<" + std::string(point_role_name(role_)) + "," + std::string(ternary_name(value_)) + ">";
}

} // namespace trilogic
