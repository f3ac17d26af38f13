/// @file circuit.cpp
/// @brief Circuit construction, wiring, and synchronous cascade propagation

#include "simulation/circuit.hpp"

#include "simulation/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace trilogic {

namespace {

/// Counts nested wire updates for the lifetime of one update() call
class CascadeGuard {
  public:
    CascadeGuard(std::size_t& depth, std::size_t limit) : depth_(depth) {
        if (depth_ >= limit) {
            throw CascadeDepthError(limit);
        }
        ++depth_;
    }
    ~CascadeGuard() { --depth_; }

    CascadeGuard(const CascadeGuard&) = delete;
    CascadeGuard& operator=(const CascadeGuard&) = delete;

  private:
    std::size_t& depth_;
};

} // namespace

Circuit::Circuit(PropagationConfig config) : config_(config), diagnostics_(config.log_to_stderr, config.warning_history) {}

ConnectionPoint* Circuit::add_point(PointRole role, TernaryValue initial) {
    auto id = static_cast<PointId>(points_.size());
    points_.push_back(std::make_unique<ConnectionPoint>(id, role, initial));
    return points_.back().get();
}

Wire* Circuit::add_wire() {
    auto id = static_cast<WireId>(wires_.size());
    wires_.push_back(std::make_unique<Wire>(id));
    return wires_.back().get();
}

Gate* Circuit::add_gate(GateKind kind) {
    auto id = static_cast<GateId>(gates_.size());

    std::vector<PointId> inputs;
    for (std::size_t i = 0; i < gate_input_count(kind); i++) {
        auto point_id = static_cast<PointId>(points_.size());
        points_.push_back(std::make_unique<ConnectionPoint>(point_id, PointRole::READER, TernaryValue::NEUTRAL, id));
        inputs.push_back(point_id);
    }

    std::vector<PointId> outputs;
    for (std::size_t i = 0; i < gate_output_count(kind); i++) {
        auto point_id = static_cast<PointId>(points_.size());
        points_.push_back(std::make_unique<ConnectionPoint>(point_id, PointRole::WRITER, TernaryValue::NEUTRAL, id));
        outputs.push_back(point_id);
    }

    gates_.push_back(std::make_unique<Gate>(id, kind, std::move(inputs), std::move(outputs), config_.gate_delay));
    return gates_.back().get();
}

// --- Wiring ---

void Circuit::require_diadic(const Gate& gate) const {
    if (gate_input_count(gate.get_kind()) != 2) {
        throw ConnectionError(std::string(gate_kind_name(gate.get_kind())) + " gate is monadic; use set_input_wire");
    }
}

void Circuit::connect(Wire* wire, ConnectionPoint* point) {
    owned(wire);
    owned(point);

    if (wire->contains(point->get_id())) {
        throw ConnectionError(point->to_string() + " is already connected to " + wire->to_string());
    }
    // Throws before the wire is touched if the point sits on another wire
    point->attach(wire->get_id());
    wire->add_connection(point->get_id());
}

void Circuit::disconnect(Wire* wire, ConnectionPoint* point) {
    owned(wire);
    owned(point);

    if (!wire->remove_connection(point->get_id())) {
        throw ConnectionError(point->to_string() + " is not connected to " + wire->to_string());
    }
    (void)point->detach();
}

void Circuit::disconnect_all(Wire* wire) {
    owned(wire);
    for (PointId id : wire->get_connections()) {
        (void)points_[id]->detach();
    }
    wire->clear_connections();
}

Wire* Circuit::detach(ConnectionPoint* point) {
    owned(point);

    std::optional<WireId> previous = point->detach();
    if (!previous.has_value()) {
        diagnostics_.warn(WarningKind::DISCONNECT_UNCONNECTED, "No wire to disconnect from " + point->to_string());
        return nullptr;
    }
    Wire* wire = wires_[*previous].get();
    wire->remove_connection(point->get_id());
    return wire;
}

void Circuit::set_input_wire(Gate* gate, Wire* wire) {
    owned(gate);
    if (gate_input_count(gate->get_kind()) != 1) {
        throw ConnectionError(std::string(gate_kind_name(gate->get_kind())) +
                              " gate is diadic; use set_input_wire1/set_input_wire2");
    }
    connect(wire, points_[gate->input_at(0)].get());
}

void Circuit::set_input_wire1(Gate* gate, Wire* wire) {
    owned(gate);
    require_diadic(*gate);
    connect(wire, points_[gate->input_at(0)].get());
}

void Circuit::set_input_wire2(Gate* gate, Wire* wire) {
    owned(gate);
    require_diadic(*gate);
    connect(wire, points_[gate->input_at(1)].get());
}

void Circuit::set_output_wire(Gate* gate, Wire* wire) {
    owned(gate);
    connect(wire, points_[gate->output_at(0)].get());
}

void Circuit::set_overflow_wire(Gate* gate, Wire* wire) {
    owned(gate);
    if (gate->get_kind() != GateKind::SUM) {
        throw ConnectionError(std::string(gate_kind_name(gate->get_kind())) + " gate has no overflow output");
    }
    connect(wire, points_[gate->output_at(1)].get());
}

// --- Propagation ---

void Circuit::update(Wire* wire) {
    owned(wire);
    CascadeGuard guard(cascade_depth_, config_.max_cascade_depth);
    const uint64_t generation = wire->begin_update();

    // Copy: a cascade below may detach points from this wire
    const std::vector<PointId> connections = wire->get_connections();

    std::vector<TernaryValue> writes;
    for (PointId id : connections) {
        if (points_[id]->is_writer()) {
            writes.push_back(points_[id]->get_value());
        }
    }

    // No writers: readers keep their values
    if (writes.empty()) {
        return;
    }

    const TernaryValue resolved = writes.front();
    if (writes.size() > config_.contention_threshold) {
        diagnostics_.warn(WarningKind::MULTIPLE_WRITERS,
                          wire->to_string() + " has " + std::to_string(writes.size()) +
                              " writers, defaulting to first-connected value " + std::string(ternary_name(resolved)));
    }

    for (PointId id : connections) {
        if (!points_[id]->is_reader()) {
            continue;
        }
        set_from_wire(points_[id].get(), resolved);

        // A feedback path rewrote this wire; the nested update fed every
        // reader the newer value, so the rest of this pass is stale
        if (wire->get_generation() != generation) {
            return;
        }
    }
}

std::size_t Circuit::writer_count(const Wire* wire) const {
    std::size_t count = 0;
    for (PointId id : wire->get_connections()) {
        if (points_[id]->is_writer()) {
            ++count;
        }
    }
    return count;
}

void Circuit::set_from_wire(ConnectionPoint* point, TernaryValue value) {
    owned(point);
    if (!point->is_reader()) {
        diagnostics_.warn(WarningKind::WRONG_ROLE, "Attempting to set the wire state of " + point->to_string());
        return;
    }

    point->set_value(value);
    if (std::optional<GateId> owner = point->get_owner(); owner.has_value()) {
        recompute(gates_[*owner].get());
    }
}

void Circuit::set_from_write(ConnectionPoint* point, TernaryValue value) {
    owned(point);
    if (point->is_reader()) {
        diagnostics_.warn(WarningKind::WRONG_ROLE, "Attempting to write to reading " + point->to_string());
        return;
    }

    point->set_value(value);
    if (std::optional<WireId> wire = point->get_wire(); wire.has_value()) {
        update(wires_[*wire].get());
    }
}

void Circuit::recompute(Gate* gate) {
    owned(gate);

    std::vector<TernaryValue> inputs;
    inputs.reserve(gate->get_inputs().size());
    for (PointId id : gate->get_inputs()) {
        inputs.push_back(points_[id]->get_value());
    }

    if (std::optional<TernaryValue> result = evaluate(gate->get_kind(), inputs); result.has_value()) {
        set_output_state(*gate, 0, *result);
    }
    if (gate->get_kind() == GateKind::SUM) {
        set_output_state(*gate, 1, evaluate_overflow(inputs[0], inputs[1]));
    }
}

void Circuit::settle() {
    // Index loop: gates are not added during a cascade, but stay safe if they are
    for (std::size_t i = 0; i < gates_.size(); i++) {
        recompute(gates_[i].get());
    }
}

void Circuit::set_output_state(const Gate& gate, std::size_t index, TernaryValue value) {
    ConnectionPoint* output = points_[gate.output_at(index)].get();

    // Output is already at this value; stops an idle graph re-triggering itself
    if (output->get_value() == value) {
        return;
    }

    if (config_.delay_enabled) {
        const PointId id = output->get_id();
        events_.schedule_after(gate.get_delay(), [this, id, value]() { set_from_write(points_[id].get(), value); });
    } else {
        set_from_write(output, value);
    }
}

// --- Simulated time ---

std::size_t Circuit::advance(Duration span) {
    return events_.advance(span);
}

std::size_t Circuit::run_pending() {
    return events_.run();
}

// --- Accessors ---

ConnectionPoint* Circuit::point(PointId id) const {
    if (id >= points_.size()) {
        throw std::out_of_range("Point id out of range");
    }
    return points_[id].get();
}

Wire* Circuit::wire(WireId id) const {
    if (id >= wires_.size()) {
        throw std::out_of_range("Wire id out of range");
    }
    return wires_[id].get();
}

Gate* Circuit::gate(GateId id) const {
    if (id >= gates_.size()) {
        throw std::out_of_range("Gate id out of range");
    }
    return gates_[id].get();
}

TernaryValue Circuit::input_value(const Gate* gate, std::size_t index) const {
    return point(gate->input_at(index))->get_value();
}

TernaryValue Circuit::output_value(const Gate* gate, std::size_t index) const {
    return point(gate->output_at(index))->get_value();
}

std::string Circuit::describe(const Gate* gate) const {
    std::string text(gate_kind_name(gate->get_kind()));
    text += "<";

    const auto& inputs = gate->get_inputs();
    for (std::size_t i = 0; i < inputs.size(); i++) {
        text += inputs.size() == 1 ? "I: " : "I" + std::to_string(i + 1) + ": ";
        text += ternary_name(points_[inputs[i]]->get_value());
        text += ", ";
    }

    text += "O: ";
    text += ternary_name(output_value(gate, 0));
    if (gate->get_kind() == GateKind::SUM) {
        text += ", OV: ";
        text += ternary_name(output_value(gate, 1));
    }
    text += ">";
    return text;
}

ConnectionPoint* Circuit::owned(ConnectionPoint* point) const {
    if (point == nullptr) {
        throw std::invalid_argument("Connection point must not be null");
    }
    if (point->get_id() >= points_.size() || points_[point->get_id()].get() != point) {
        throw std::invalid_argument(point->to_string() + " belongs to another circuit");
    }
    return point;
}

Wire* Circuit::owned(Wire* wire) const {
    if (wire == nullptr) {
        throw std::invalid_argument("Wire must not be null");
    }
    if (wire->get_id() >= wires_.size() || wires_[wire->get_id()].get() != wire) {
        throw std::invalid_argument(wire->to_string() + " belongs to another circuit");
    }
    return wire;
}

Gate* Circuit::owned(Gate* gate) const {
    if (gate == nullptr) {
        throw std::invalid_argument("Gate must not be null");
    }
    if (gate->get_id() >= gates_.size() || gates_[gate->get_id()].get() != gate) {
        throw std::invalid_argument(std::string(gate_kind_name(gate->get_kind())) + " gate belongs to another circuit");
    }
    return gate;
}

} // namespace trilogic
