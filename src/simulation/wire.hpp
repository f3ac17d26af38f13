#pragma once

/// @file wire.hpp
/// @brief Wire model: a bus joining writer points to reader points

#include "simulation/connection_point.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace trilogic {

/// A bus holding the points attached to it, in attachment order.
///
/// Attachment order is the tie-break when several writers drive the wire:
/// the first-attached writer wins. Resolution itself lives in
/// Circuit::update(), which can reach the points' values and owners.
class Wire {
  public:
    /// Construct a wire with a unique ID
    explicit Wire(WireId id);

    [[nodiscard]] WireId get_id() const { return id_; }
    [[nodiscard]] const std::vector<PointId>& get_connections() const { return connections_; }
    [[nodiscard]] bool contains(PointId point) const;

    /// Appends a point to the connection list
    void add_connection(PointId point);

    /// Removes a point from the connection list; returns false if absent
    bool remove_connection(PointId point);

    void clear_connections() { connections_.clear(); }

    /// Bumped each time Circuit::update() starts resolving this wire. A
    /// change while readers are being fed means a nested update has already
    /// delivered a newer value to every reader.
    [[nodiscard]] uint64_t get_generation() const { return generation_; }
    uint64_t begin_update() { return ++generation_; }

    /// e.g. "Wire<3 conns>"
    [[nodiscard]] std::string to_string() const;

  private:
    WireId id_;
    std::vector<PointId> connections_;
    uint64_t generation_ = 0;
};

} // namespace trilogic
