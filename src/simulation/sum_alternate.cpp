/// @file sum_alternate.cpp
/// @brief Wiring of the primitive-gate ternary adder

#include "simulation/sum_alternate.hpp"

#include <array>
#include <stdexcept>

namespace trilogic {

SumAlternate::SumAlternate(Circuit* circuit) : circuit_(circuit) {
    if (circuit_ == nullptr) {
        throw std::invalid_argument("SumAlternate requires a circuit");
    }

    std::array<Wire*, 11> wires{};
    for (Wire*& wire : wires) {
        wire = circuit_->add_wire();
    }

    // a and b
    identity_a_ = make_gate(GateKind::IDENTITY);
    circuit_->set_output_wire(identity_a_, wires[0]);
    identity_b_ = make_gate(GateKind::IDENTITY);
    circuit_->set_output_wire(identity_b_, wires[1]);

    // A = (a = -1) ^ (b - 1)
    Gate* low_a = make_gate(GateKind::IS_LOW);
    circuit_->set_input_wire(low_a, wires[0]);
    circuit_->set_output_wire(low_a, wires[2]);
    Gate* low_dec = make_gate(GateKind::DECREMENT);
    circuit_->set_input_wire(low_dec, wires[1]);
    circuit_->set_output_wire(low_dec, wires[3]);
    Gate* low_and = make_gate(GateKind::AND);
    circuit_->set_input_wire1(low_and, wires[2]);
    circuit_->set_input_wire2(low_and, wires[3]);
    circuit_->set_output_wire(low_and, wires[4]);

    // B = (a = 0) ^ b
    Gate* mid_a = make_gate(GateKind::IS_NEUTRAL);
    circuit_->set_input_wire(mid_a, wires[0]);
    circuit_->set_output_wire(mid_a, wires[5]);
    Gate* mid_and = make_gate(GateKind::AND);
    circuit_->set_input_wire1(mid_and, wires[5]);
    circuit_->set_input_wire2(mid_and, wires[1]);
    circuit_->set_output_wire(mid_and, wires[6]);

    // C = (a = 1) ^ (b + 1)
    Gate* high_a = make_gate(GateKind::IS_HIGH);
    circuit_->set_input_wire(high_a, wires[0]);
    circuit_->set_output_wire(high_a, wires[7]);
    Gate* high_inc = make_gate(GateKind::INCREMENT);
    circuit_->set_input_wire(high_inc, wires[1]);
    circuit_->set_output_wire(high_inc, wires[8]);
    Gate* high_and = make_gate(GateKind::AND);
    circuit_->set_input_wire1(high_and, wires[7]);
    circuit_->set_input_wire2(high_and, wires[8]);
    circuit_->set_output_wire(high_and, wires[9]);

    // A v B
    Gate* or_ab = make_gate(GateKind::OR);
    circuit_->set_input_wire1(or_ab, wires[4]);
    circuit_->set_input_wire2(or_ab, wires[6]);
    circuit_->set_output_wire(or_ab, wires[10]);

    // (A v B) v C
    output_gate_ = make_gate(GateKind::OR);
    circuit_->set_input_wire1(output_gate_, wires[9]);
    circuit_->set_input_wire2(output_gate_, wires[10]);

    // Consensus is the carry into the next trit
    overflow_gate_ = make_gate(GateKind::CONSENSUS);
    circuit_->set_input_wire1(overflow_gate_, wires[0]);
    circuit_->set_input_wire2(overflow_gate_, wires[1]);

    // Gates start at (0) regardless of their inputs; bring them in line
    for (Gate* gate : gates_) {
        circuit_->recompute(gate);
    }
}

Gate* SumAlternate::make_gate(GateKind kind) {
    Gate* gate = circuit_->add_gate(kind);
    gates_.push_back(gate);
    return gate;
}

void SumAlternate::set_input_wire1(Wire* wire) {
    circuit_->set_input_wire(identity_a_, wire);
}

void SumAlternate::set_input_wire2(Wire* wire) {
    circuit_->set_input_wire(identity_b_, wire);
}

void SumAlternate::set_output_wire(Wire* wire) {
    circuit_->set_output_wire(output_gate_, wire);
}

void SumAlternate::set_overflow_wire(Wire* wire) {
    circuit_->set_output_wire(overflow_gate_, wire);
}

TernaryValue SumAlternate::output() const {
    return circuit_->output_value(output_gate_);
}

TernaryValue SumAlternate::overflow() const {
    return circuit_->output_value(overflow_gate_);
}

} // namespace trilogic
