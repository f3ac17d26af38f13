#pragma once

/// @file circuit.hpp
/// @brief Circuit model: owns points, wires and gates, drives propagation

#include "simulation/connection_point.hpp"
#include "simulation/diagnostics.hpp"
#include "simulation/gate.hpp"
#include "simulation/propagation_config.hpp"
#include "simulation/wire.hpp"
#include "timing/event_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trilogic {

/// A circuit is an arena of connection points, wires and gates plus the
/// propagation protocol that runs over them.
///
/// Construction:
///   1. Create gates with add_gate(); each gets its own terminals
///   2. Create wires with add_wire() and driver/observer points with add_point()
///   3. Attach terminals with connect() or the set_*_wire() helpers
///   4. Optionally settle() so a fresh graph is consistent
///
/// Driving: set_from_write() on a writer point cascades synchronously
/// through every wire and gate downstream before it returns. With delays
/// enabled, gate outputs are instead queued and applied by advance().
///
/// All returned pointers are non-owning and stay valid for the circuit's
/// lifetime. A Circuit is neither copyable nor movable because queued
/// events refer back to it.
class Circuit {
  public:
    explicit Circuit(PropagationConfig config = {});

    Circuit(const Circuit&) = delete;
    Circuit& operator=(const Circuit&) = delete;
    Circuit(Circuit&&) = delete;
    Circuit& operator=(Circuit&&) = delete;

    /// Creates a free-standing point, e.g. an external driver or probe
    ConnectionPoint* add_point(PointRole role, TernaryValue initial = TernaryValue::NEUTRAL);

    /// Creates a new wire in this circuit and returns a non-owning pointer
    Wire* add_wire();

    /// Creates a gate and its reader inputs / writer outputs
    Gate* add_gate(GateKind kind);

    // --- Wiring ---

    /// Attaches a point to a wire, both directions.
    /// @throws ConnectionError if the point is already on this or any wire
    void connect(Wire* wire, ConnectionPoint* point);

    /// Detaches a point from a wire.
    /// @throws ConnectionError if the point is not on this wire
    void disconnect(Wire* wire, ConnectionPoint* point);

    /// Detaches every point from the wire
    void disconnect_all(Wire* wire);

    /// Detaches a point from whatever wire it is on and returns that wire.
    /// An unattached point is only a warning and yields nullptr.
    Wire* detach(ConnectionPoint* point);

    /// Attaches a monadic gate's input
    /// @throws ConnectionError for a diadic gate
    void set_input_wire(Gate* gate, Wire* wire);

    /// Attach a diadic gate's first / second input
    /// @throws ConnectionError for a monadic gate
    void set_input_wire1(Gate* gate, Wire* wire);
    void set_input_wire2(Gate* gate, Wire* wire);
    void set_output_wire(Gate* gate, Wire* wire);

    /// Attaches a SUM gate's overflow output.
    /// @throws ConnectionError for any other kind
    void set_overflow_wire(Gate* gate, Wire* wire);

    // --- Propagation ---

    /// Resolves the wire from its writers and pushes the value to its readers
    /// @throws CascadeDepthError if the cascade nests too deep
    void update(Wire* wire);

    /// Number of writer points currently attached to the wire
    [[nodiscard]] std::size_t writer_count(const Wire* wire) const;

    /// Reader-side setter used by wires; recomputes the owning gate
    void set_from_wire(ConnectionPoint* point, TernaryValue value);

    /// Writer-side setter used by drivers and gates; updates the attached wire
    void set_from_write(ConnectionPoint* point, TernaryValue value);

    /// Re-evaluates a gate from its current input values
    void recompute(Gate* gate);

    /// Recomputes every gate once, in creation order
    void settle();

    // --- Simulated time ---

    [[nodiscard]] SimTime now() const { return events_.now(); }

    /// Applies queued gate outputs due within the span
    std::size_t advance(Duration span);

    /// Applies every queued gate output
    std::size_t run_pending();

    [[nodiscard]] EventQueue& events() { return events_; }
    [[nodiscard]] const EventQueue& events() const { return events_; }

    // --- Accessors ---

    /// @throws std::out_of_range for an unknown id
    [[nodiscard]] ConnectionPoint* point(PointId id) const;
    [[nodiscard]] Wire* wire(WireId id) const;
    [[nodiscard]] Gate* gate(GateId id) const;

    [[nodiscard]] TernaryValue input_value(const Gate* gate, std::size_t index) const;
    [[nodiscard]] TernaryValue output_value(const Gate* gate, std::size_t index = 0) const;

    /// e.g. "AND<I1: (+), I2: (0), O: (0)>"
    [[nodiscard]] std::string describe(const Gate* gate) const;

    [[nodiscard]] const std::vector<std::unique_ptr<ConnectionPoint>>& points() const { return points_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Wire>>& wires() const { return wires_; }
    [[nodiscard]] const std::vector<std::unique_ptr<Gate>>& gates() const { return gates_; }
    [[nodiscard]] const PropagationConfig& config() const { return config_; }
    [[nodiscard]] Diagnostics& diagnostics() { return diagnostics_; }
    [[nodiscard]] const Diagnostics& diagnostics() const { return diagnostics_; }

  private:
    void require_diadic(const Gate& gate) const;

    /// Writes one gate output if it changed, now or after the gate delay
    void set_output_state(const Gate& gate, std::size_t index, TernaryValue value);

    /// Rejects null pointers and elements of another circuit
    ConnectionPoint* owned(ConnectionPoint* point) const;
    Wire* owned(Wire* wire) const;
    Gate* owned(Gate* gate) const;

    PropagationConfig config_;
    Diagnostics diagnostics_;
    EventQueue events_;

    std::vector<std::unique_ptr<ConnectionPoint>> points_;
    std::vector<std::unique_ptr<Wire>> wires_;
    std::vector<std::unique_ptr<Gate>> gates_;

    std::size_t cascade_depth_ = 0;
};

} // namespace trilogic
