/// @file tryte.cpp
/// @brief Tryte register wiring

#include "simulation/tryte.hpp"

#include "simulation/errors.hpp"

#include <stdexcept>
#include <string>

namespace trilogic {

Tryte::Tryte(Circuit* circuit) : circuit_(circuit) {
    if (circuit_ == nullptr) {
        throw std::invalid_argument("Tryte requires a circuit");
    }

    read_ = circuit_->add_gate(GateKind::IDENTITY);
    Wire* control = circuit_->add_wire();
    circuit_->set_output_wire(read_, control);

    for (Gate*& cell : cells_) {
        cell = circuit_->add_gate(GateKind::MEMORY);
        circuit_->set_input_wire2(cell, control);
    }

    circuit_->recompute(read_);
}

Gate* Tryte::cell(std::size_t index) const {
    if (index >= SIZE) {
        throw ConnectionError("Index not in range [0,8]: " + std::to_string(index));
    }
    return cells_[index];
}

void Tryte::check_count(const std::vector<Wire*>& wires, const char* side) const {
    if (wires.size() != SIZE) {
        throw ConnectionError("Cannot attach " + std::to_string(wires.size()) + " wires to " + std::to_string(SIZE) +
                              " memory " + side);
    }
}

void Tryte::set_input_wire_at(std::size_t index, Wire* wire) {
    circuit_->set_input_wire1(cell(index), wire);
}

void Tryte::set_input_wires(const std::vector<Wire*>& wires) {
    check_count(wires, "inputs");
    for (std::size_t i = 0; i < SIZE; i++) {
        circuit_->set_input_wire1(cells_[i], wires[i]);
    }
}

void Tryte::set_output_wire_at(std::size_t index, Wire* wire) {
    circuit_->set_output_wire(cell(index), wire);
}

void Tryte::set_output_wires(const std::vector<Wire*>& wires) {
    check_count(wires, "outputs");
    for (std::size_t i = 0; i < SIZE; i++) {
        circuit_->set_output_wire(cells_[i], wires[i]);
    }
}

void Tryte::set_read_wire(Wire* wire) {
    circuit_->set_input_wire(read_, wire);
}

TernaryValue Tryte::value_at(std::size_t index) const {
    return circuit_->output_value(cell(index));
}

} // namespace trilogic
