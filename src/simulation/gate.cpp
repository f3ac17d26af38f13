/// @file gate.cpp
/// @brief Gate transfer tables, evaluation, and Gate class implementation

#include "simulation/gate.hpp"

#include "simulation/errors.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace trilogic {

namespace {

constexpr TernaryValue M = TernaryValue::MINUS;
constexpr TernaryValue N = TernaryValue::NEUTRAL;
constexpr TernaryValue P = TernaryValue::PLUS;

// Tables are indexed MINUS, NEUTRAL, PLUS; diadic tables by [input1][input2].
using MonadicTable = std::array<TernaryValue, 3>;
using DiadicTable = std::array<std::array<TernaryValue, 3>, 3>;

constexpr MonadicTable IDENTITY_TABLE = {M, N, P};
constexpr MonadicTable INCREMENT_TABLE = {N, P, M};
constexpr MonadicTable DECREMENT_TABLE = {P, M, N};
constexpr MonadicTable NEGATE_TABLE = {P, N, M};
constexpr MonadicTable IS_HIGH_TABLE = {M, M, P};
constexpr MonadicTable IS_NEUTRAL_TABLE = {M, P, M};
constexpr MonadicTable IS_LOW_TABLE = {P, M, M};

// Minimum
constexpr DiadicTable AND_TABLE = {{
    {M, M, M},
    {M, N, N},
    {M, N, P},
}};

// Maximum
constexpr DiadicTable OR_TABLE = {{
    {M, N, P},
    {N, N, P},
    {P, P, P},
}};

// (0) if either is (0), (+) if different, (-) if same
constexpr DiadicTable XOR_TABLE = {{
    {M, N, P},
    {N, N, N},
    {P, N, M},
}};

constexpr DiadicTable CONSENSUS_TABLE = {{
    {M, N, N},
    {N, N, N},
    {N, N, P},
}};

// Balanced-ternary addition, low trit only
constexpr DiadicTable SUM_TABLE = {{
    {P, M, N},
    {M, N, P},
    {N, P, M},
}};

constexpr std::size_t index_of(TernaryValue value) {
    return static_cast<std::size_t>(to_int(value) + 1);
}

TernaryValue lookup(const MonadicTable& table, TernaryValue a) {
    return table[index_of(a)];
}

TernaryValue lookup(const DiadicTable& table, TernaryValue a, TernaryValue b) {
    return table[index_of(a)][index_of(b)];
}

} // namespace

std::size_t gate_input_count(GateKind kind) {
    switch (kind) {
    case GateKind::IDENTITY:
    case GateKind::INCREMENT:
    case GateKind::DECREMENT:
    case GateKind::NEGATE:
    case GateKind::IS_HIGH:
    case GateKind::IS_NEUTRAL:
    case GateKind::IS_LOW:
        return 1;
    case GateKind::AND:
    case GateKind::OR:
    case GateKind::NAND:
    case GateKind::NOR:
    case GateKind::XOR:
    case GateKind::XNOR:
    case GateKind::CONSENSUS:
    case GateKind::SUM:
    case GateKind::MEMORY:
        return 2;
    }
    throw std::invalid_argument("Unknown gate kind");
}

std::size_t gate_output_count(GateKind kind) {
    return kind == GateKind::SUM ? 2 : 1;
}

TernaryValue negate(TernaryValue value) {
    return lookup(NEGATE_TABLE, value);
}

TernaryValue evaluate_overflow(TernaryValue a, TernaryValue b) {
    return lookup(CONSENSUS_TABLE, a, b);
}

std::optional<TernaryValue> evaluate(GateKind kind, const std::vector<TernaryValue>& inputs) {
    if (inputs.size() != gate_input_count(kind)) {
        throw std::invalid_argument(std::string(gate_kind_name(kind)) + " gate requires exactly " +
                                    std::to_string(gate_input_count(kind)) + " input(s)");
    }

    switch (kind) {
    case GateKind::IDENTITY:
        return lookup(IDENTITY_TABLE, inputs[0]);
    case GateKind::INCREMENT:
        return lookup(INCREMENT_TABLE, inputs[0]);
    case GateKind::DECREMENT:
        return lookup(DECREMENT_TABLE, inputs[0]);
    case GateKind::NEGATE:
        return lookup(NEGATE_TABLE, inputs[0]);
    case GateKind::IS_HIGH:
        return lookup(IS_HIGH_TABLE, inputs[0]);
    case GateKind::IS_NEUTRAL:
        return lookup(IS_NEUTRAL_TABLE, inputs[0]);
    case GateKind::IS_LOW:
        return lookup(IS_LOW_TABLE, inputs[0]);

    case GateKind::AND:
        return lookup(AND_TABLE, inputs[0], inputs[1]);
    case GateKind::OR:
        return lookup(OR_TABLE, inputs[0], inputs[1]);
    case GateKind::XOR:
        return lookup(XOR_TABLE, inputs[0], inputs[1]);
    case GateKind::CONSENSUS:
        return lookup(CONSENSUS_TABLE, inputs[0], inputs[1]);
    case GateKind::SUM:
        return lookup(SUM_TABLE, inputs[0], inputs[1]);

    // Negated kinds wrap the base table's output
    case GateKind::NAND:
        return negate(lookup(AND_TABLE, inputs[0], inputs[1]));
    case GateKind::NOR:
        return negate(lookup(OR_TABLE, inputs[0], inputs[1]));
    case GateKind::XNOR:
        return negate(lookup(XOR_TABLE, inputs[0], inputs[1]));

    // input1 = data, input2 = control
    case GateKind::MEMORY:
        switch (inputs[1]) {
        case TernaryValue::NEUTRAL:
            return std::nullopt;
        case TernaryValue::PLUS:
            return inputs[0];
        case TernaryValue::MINUS:
            return negate(inputs[0]);
        }
        break;
    }
    throw std::invalid_argument("Unknown gate kind");
}

Gate::Gate(GateId id, GateKind kind, std::vector<PointId> inputs, std::vector<PointId> outputs, Duration delay)
    : id_(id), kind_(kind), inputs_(std::move(inputs)), outputs_(std::move(outputs)), delay_(delay) {}

PointId Gate::input_at(std::size_t index) const {
    if (index >= inputs_.size()) {
        throw ConnectionError(std::string(gate_kind_name(kind_)) + " gate has no input " + std::to_string(index + 1));
    }
    return inputs_[index];
}

PointId Gate::output_at(std::size_t index) const {
    if (index >= outputs_.size()) {
        throw ConnectionError(std::string(gate_kind_name(kind_)) + " gate has no output " +
                              std::to_string(index + 1));
    }
    return outputs_[index];
}

} // namespace trilogic
