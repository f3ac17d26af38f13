#pragma once

/// @file tryte.hpp
/// @brief A 9-trit memory register built from MEMORY gates

#include "simulation/circuit.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace trilogic {

/// Nine MEMORY cells sharing one read (control) signal.
///
/// The read wire feeds an internal IDENTITY gate whose output wire is the
/// control input of every cell, so all nine see the same value at once:
///   (+) latches the inputs, (-) latches the negated inputs,
///   (0) holds the outputs whatever the inputs do.
class Tryte {
  public:
    static constexpr std::size_t SIZE = 9;

    /// @param circuit Non-owning pointer to the circuit that holds the gates
    explicit Tryte(Circuit* circuit);

    /// @throws ConnectionError if index is outside [0, 8]
    void set_input_wire_at(std::size_t index, Wire* wire);

    /// @throws ConnectionError unless exactly 9 wires are given
    void set_input_wires(const std::vector<Wire*>& wires);

    /// @throws ConnectionError if index is outside [0, 8]
    void set_output_wire_at(std::size_t index, Wire* wire);

    /// @throws ConnectionError unless exactly 9 wires are given
    void set_output_wires(const std::vector<Wire*>& wires);

    /// Attaches the shared read signal
    void set_read_wire(Wire* wire);

    [[nodiscard]] std::size_t size() const { return SIZE; }

    /// Stored trit of one cell.
    /// @throws ConnectionError if index is outside [0, 8]
    [[nodiscard]] TernaryValue value_at(std::size_t index) const;

    /// @throws ConnectionError if index is outside [0, 8]
    [[nodiscard]] Gate* cell(std::size_t index) const;

  private:
    void check_count(const std::vector<Wire*>& wires, const char* side) const;

    Circuit* circuit_;
    std::array<Gate*, SIZE> cells_{};
    Gate* read_ = nullptr;
};

} // namespace trilogic
