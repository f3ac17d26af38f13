/// @file oscillator.cpp
/// @brief Implements the quarter-period stepping oscillator

#include "timing/oscillator.hpp"

#include <stdexcept>
#include <utility>

namespace trilogic {

Oscillator::Oscillator(Circuit* circuit, Duration period, TimerFactory timer_factory)
    : circuit_(circuit), period_(period), timer_factory_(std::move(timer_factory)) {
    if (circuit_ == nullptr) {
        throw std::invalid_argument("Oscillator requires a circuit");
    }
    if (!timer_factory_) {
        throw std::invalid_argument("Oscillator requires a timer factory");
    }
    if (tick_interval() <= Duration::zero()) {
        throw std::invalid_argument("Oscillator period is too short to divide into four steps");
    }

    output_ = circuit_->add_point(PointRole::WRITER, SEQUENCE[0]);
    arm();
}

void Oscillator::set_output_wire(Wire* wire) {
    circuit_->connect(wire, output_);
    circuit_->update(wire);
}

void Oscillator::arm() {
    timer_ = timer_factory_(tick_interval(), [this]() { tick(); });
    timer_->start();
}

void Oscillator::tick() {
    phase_ = (phase_ + 1) % SEQUENCE.size();
    circuit_->set_from_write(output_, SEQUENCE[phase_]);
    arm();
}

std::string Oscillator::to_string() const {
    return "Oscillator<" + std::string(ternary_name(read_output())) + ", phase " + std::to_string(phase_) + ">";
}

} // namespace trilogic
