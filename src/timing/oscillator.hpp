#pragma once

/// @file oscillator.hpp
/// @brief A periodic ternary signal source driven by an injected timer

#include "simulation/circuit.hpp"
#include "timing/timer.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace trilogic {

/// Steps through (0), (+), (0), (-) and repeats, one step per quarter
/// period. The value sits on a writer point, so attaching a wire makes the
/// oscillator drive a circuit like any other external writer.
///
/// A one-shot timer of period / 4 is armed on construction and re-armed
/// each time it fires. Destroying the oscillator destroys that timer, so a
/// tick still queued afterwards does nothing.
class Oscillator {
  public:
    static constexpr std::array<TernaryValue, 4> SEQUENCE = {TernaryValue::NEUTRAL, TernaryValue::PLUS,
                                                             TernaryValue::NEUTRAL, TernaryValue::MINUS};

    /// @param circuit Non-owning pointer to the circuit holding the output point
    /// @param period Time for one full (0) (+) (0) (-) cycle
    /// @param timer_factory Source of the quarter-period timers
    /// @throws std::invalid_argument for a null circuit, empty factory, or a
    ///         period shorter than four ticks
    Oscillator(Circuit* circuit, Duration period, TimerFactory timer_factory);

    Oscillator(const Oscillator&) = delete;
    Oscillator& operator=(const Oscillator&) = delete;

    [[nodiscard]] TernaryValue read_output() const { return output_->get_value(); }

    /// Drives a wire with the oscillator's output
    void set_output_wire(Wire* wire);

    [[nodiscard]] Duration period() const { return period_; }
    [[nodiscard]] Duration tick_interval() const { return period_ / static_cast<Duration::rep>(SEQUENCE.size()); }

    /// Index into SEQUENCE of the current output
    [[nodiscard]] std::size_t phase() const { return phase_; }

    [[nodiscard]] ConnectionPoint* output() const { return output_; }

    /// e.g. "Oscillator<(+), phase 1>"
    [[nodiscard]] std::string to_string() const;

  private:
    void arm();
    void tick();

    Circuit* circuit_;
    Duration period_;
    TimerFactory timer_factory_;
    ConnectionPoint* output_ = nullptr;
    std::size_t phase_ = 0;
    std::unique_ptr<Timer> timer_;
};

} // namespace trilogic
