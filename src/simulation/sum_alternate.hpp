#pragma once

/// @file sum_alternate.hpp
/// @brief A ternary adder assembled only from primitive gates

#include "simulation/circuit.hpp"

#include <vector>

namespace trilogic {

/// Behaves exactly like a SUM gate, but is built from primitives:
///
///   sum      = ((a = -1) ^ (b - 1)) v ((a = 0) ^ b) v ((a = 1) ^ (b + 1))
///   overflow = consensus(a, b)
///
/// where ^ is AND, v is OR, "= k" is IS_LOW / IS_NEUTRAL / IS_HIGH and
/// "+ 1" / "- 1" are INCREMENT / DECREMENT. The two addends enter through
/// IDENTITY gates so a single external wire fans out to every consumer.
///
/// Gates and internal wires are allocated in the given circuit and settled
/// on construction.
class SumAlternate {
  public:
    /// @param circuit Non-owning pointer to the circuit that holds the gates
    explicit SumAlternate(Circuit* circuit);

    void set_input_wire1(Wire* wire);
    void set_input_wire2(Wire* wire);
    void set_output_wire(Wire* wire);
    void set_overflow_wire(Wire* wire);

    [[nodiscard]] TernaryValue output() const;
    [[nodiscard]] TernaryValue overflow() const;

    /// Every gate in the assembly, in creation order
    [[nodiscard]] const std::vector<Gate*>& gates() const { return gates_; }

  private:
    Gate* make_gate(GateKind kind);

    Circuit* circuit_;
    std::vector<Gate*> gates_;
    Gate* identity_a_ = nullptr;
    Gate* identity_b_ = nullptr;
    Gate* output_gate_ = nullptr;
    Gate* overflow_gate_ = nullptr;
};

} // namespace trilogic
