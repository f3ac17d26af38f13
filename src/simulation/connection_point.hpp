#pragma once

/// @file connection_point.hpp
/// @brief A typed terminal of a gate or of an external driver/observer

#include "simulation/ternary.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace trilogic {

using PointId = uint32_t;
using WireId = uint32_t;
using GateId = uint32_t;

/// What a connection point does on a wire. The role never changes.
enum class PointRole { WRITER, READER, HIGH_IMPEDANCE };

[[nodiscard]] constexpr std::string_view point_role_name(PointRole role) {
    switch (role) {
    case PointRole::WRITER:
        return "Writer";
    case PointRole::READER:
        return "Reader";
    case PointRole::HIGH_IMPEDANCE:
        return "High impedance";
    }
    return "Unknown";
}

/// A terminal holding a current value and at most one wire link.
///
/// Links are arena ids, not pointers: owner() names the gate to recompute
/// when a reader changes, wire() names the bus this point sits on. Both are
/// maintained by Circuit; this class only stores them.
class ConnectionPoint {
  public:
    ConnectionPoint(PointId id, PointRole role, TernaryValue value = TernaryValue::NEUTRAL,
                    std::optional<GateId> owner = std::nullopt);

    [[nodiscard]] PointId get_id() const { return id_; }
    [[nodiscard]] PointRole get_role() const { return role_; }
    [[nodiscard]] TernaryValue get_value() const { return value_; }
    [[nodiscard]] std::optional<GateId> get_owner() const { return owner_; }
    [[nodiscard]] std::optional<WireId> get_wire() const { return wire_; }

    [[nodiscard]] bool is_reader() const { return role_ == PointRole::READER; }
    [[nodiscard]] bool is_writer() const { return role_ == PointRole::WRITER; }
    [[nodiscard]] bool has_wire() const { return wire_.has_value(); }

    void set_value(TernaryValue value) { value_ = value; }

    /// Records the wire link.
    /// @throws ConnectionError if the point already has a wire
    void attach(WireId wire);

    /// Clears the wire link and returns the previous one (nullopt if none)
    std::optional<WireId> detach();

    /// e.g. "ConnectionPoint<Writer,(+)>"
    [[nodiscard]] std::string to_string() const;

  private:
    PointId id_;
    PointRole role_;
    TernaryValue value_;
    std::optional<GateId> owner_;
    std::optional<WireId> wire_;
};

} // namespace trilogic
