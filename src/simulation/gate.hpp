#pragma once

/// @file gate.hpp
/// @brief Ternary logic gate model: kinds, evaluation, and the Gate class

#include "simulation/connection_point.hpp"
#include "simulation/ternary.hpp"
#include "timing/event_queue.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace trilogic {

/// Types of ternary gates supported by the simulator.
/// The first seven are monadic, the rest diadic.
enum class GateKind {
    IDENTITY,
    INCREMENT,
    DECREMENT,
    NEGATE,
    IS_HIGH,
    IS_NEUTRAL,
    IS_LOW,
    AND,
    OR,
    NAND,
    NOR,
    XOR,
    XNOR,
    CONSENSUS,
    SUM,
    MEMORY
};

/// Returns the human-readable name of a gate kind
[[nodiscard]] constexpr std::string_view gate_kind_name(GateKind kind) {
    switch (kind) {
    case GateKind::IDENTITY:
        return "IDENTITY";
    case GateKind::INCREMENT:
        return "INCREMENT";
    case GateKind::DECREMENT:
        return "DECREMENT";
    case GateKind::NEGATE:
        return "NEGATE";
    case GateKind::IS_HIGH:
        return "IS_HIGH";
    case GateKind::IS_NEUTRAL:
        return "IS_NEUTRAL";
    case GateKind::IS_LOW:
        return "IS_LOW";
    case GateKind::AND:
        return "AND";
    case GateKind::OR:
        return "OR";
    case GateKind::NAND:
        return "NAND";
    case GateKind::NOR:
        return "NOR";
    case GateKind::XOR:
        return "XOR";
    case GateKind::XNOR:
        return "XNOR";
    case GateKind::CONSENSUS:
        return "CONSENSUS";
    case GateKind::SUM:
        return "SUM";
    case GateKind::MEMORY:
        return "MEMORY";
    }
    return "UNKNOWN";
}

/// Number of input terminals: 1 for monadic kinds, 2 for diadic
[[nodiscard]] std::size_t gate_input_count(GateKind kind);

/// Number of output terminals: 2 for SUM (sum, overflow), 1 otherwise
[[nodiscard]] std::size_t gate_output_count(GateKind kind);

/// Evaluates a gate's primary output from its input values.
/// This is a pure function with no side effects.
/// @return nullopt when the gate holds its previous output (MEMORY with a
///         NEUTRAL control input)
/// @throws std::invalid_argument if the input count is wrong for the kind
[[nodiscard]] std::optional<TernaryValue> evaluate(GateKind kind, const std::vector<TernaryValue>& inputs);

/// The SUM gate's second output: the consensus of the two addends
[[nodiscard]] TernaryValue evaluate_overflow(TernaryValue a, TernaryValue b);

/// Sign flip, the table behind NEGATE and the NAND/NOR/XNOR adapters
[[nodiscard]] TernaryValue negate(TernaryValue value);

/// A gate in a circuit. It owns its terminals, which live in the circuit's
/// point arena and are referenced here by id.
class Gate {
  public:
    Gate(GateId id, GateKind kind, std::vector<PointId> inputs, std::vector<PointId> outputs, Duration delay);

    [[nodiscard]] GateId get_id() const { return id_; }
    [[nodiscard]] GateKind get_kind() const { return kind_; }
    [[nodiscard]] Duration get_delay() const { return delay_; }
    [[nodiscard]] const std::vector<PointId>& get_inputs() const { return inputs_; }
    [[nodiscard]] const std::vector<PointId>& get_outputs() const { return outputs_; }

    /// Input terminal by position.
    /// @throws ConnectionError if this kind has no such input
    [[nodiscard]] PointId input_at(std::size_t index) const;

    /// Output terminal by position (0 = output, 1 = overflow).
    /// @throws ConnectionError if this kind has no such output
    [[nodiscard]] PointId output_at(std::size_t index) const;

  private:
    GateId id_;
    GateKind kind_;
    std::vector<PointId> inputs_;
    std::vector<PointId> outputs_;
    Duration delay_;
};

} // namespace trilogic
