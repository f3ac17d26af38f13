/// @file test_sum_alternate.cpp
/// @brief The primitive-gate adder must be indistinguishable from the SUM gate

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"
#include "simulation/sum_alternate.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>

using namespace trilogic;
using namespace trilogic::test;

namespace {

/// A SUM gate and a SumAlternate reading the same two driven wires, each
/// with output and overflow wires observed by reader points.
struct AdderPair {
    ConnectionPoint* a = nullptr;
    ConnectionPoint* b = nullptr;
    Gate* sum = nullptr;
    ConnectionPoint* sum_out = nullptr;
    ConnectionPoint* sum_overflow = nullptr;
    ConnectionPoint* alt_out = nullptr;
    ConnectionPoint* alt_overflow = nullptr;
};

ConnectionPoint* observe(Circuit& circuit, Wire* wire) {
    ConnectionPoint* reader = circuit.add_point(PointRole::READER);
    circuit.connect(wire, reader);
    return reader;
}

AdderPair build_pair(Circuit& circuit, SumAlternate& alternate) {
    AdderPair pair;
    pair.a = circuit.add_point(PointRole::WRITER);
    pair.b = circuit.add_point(PointRole::WRITER);
    Wire* wire_a = circuit.add_wire();
    Wire* wire_b = circuit.add_wire();
    circuit.connect(wire_a, pair.a);
    circuit.connect(wire_b, pair.b);

    pair.sum = circuit.add_gate(GateKind::SUM);
    circuit.set_input_wire1(pair.sum, wire_a);
    circuit.set_input_wire2(pair.sum, wire_b);
    Wire* sum_wire = circuit.add_wire();
    Wire* sum_overflow_wire = circuit.add_wire();
    circuit.set_output_wire(pair.sum, sum_wire);
    circuit.set_overflow_wire(pair.sum, sum_overflow_wire);
    pair.sum_out = observe(circuit, sum_wire);
    pair.sum_overflow = observe(circuit, sum_overflow_wire);

    alternate.set_input_wire1(wire_a);
    alternate.set_input_wire2(wire_b);
    Wire* alt_wire = circuit.add_wire();
    Wire* alt_overflow_wire = circuit.add_wire();
    alternate.set_output_wire(alt_wire);
    alternate.set_overflow_wire(alt_overflow_wire);
    pair.alt_out = observe(circuit, alt_wire);
    pair.alt_overflow = observe(circuit, alt_overflow_wire);

    return pair;
}

std::vector<std::pair<TernaryValue, TernaryValue>> all_pairs() {
    std::vector<std::pair<TernaryValue, TernaryValue>> pairs;
    for (TernaryValue a : ALL_TERNARY_VALUES) {
        for (TernaryValue b : ALL_TERNARY_VALUES) {
            pairs.emplace_back(a, b);
        }
    }
    return pairs;
}

} // namespace

TEST_CASE("SumAlternate settles to (0) + (0)", "[sum_alternate]") {
    Circuit circuit(quiet_config());
    SumAlternate alternate(&circuit);

    CHECK(alternate.output() == N);
    CHECK(alternate.overflow() == N);
    CHECK(alternate.gates().size() == 13);
}

TEST_CASE("SumAlternate matches the SUM gate for all input pairs", "[sum_alternate]") {
    Circuit circuit(quiet_config());
    SumAlternate alternate(&circuit);
    AdderPair pair = build_pair(circuit, alternate);

    auto pairs = all_pairs();

    SECTION("in ascending order") {}
    SECTION("in descending order") { std::reverse(pairs.begin(), pairs.end()); }
    SECTION("with operands swapped") {
        for (auto& p : pairs) {
            std::swap(p.first, p.second);
        }
    }

    for (const auto& [a, b] : pairs) {
        circuit.set_from_write(pair.a, a);
        circuit.set_from_write(pair.b, b);

        INFO(ternary_name(a) << " + " << ternary_name(b) << ": " << circuit.describe(pair.sum));
        CHECK(pair.alt_out->get_value() == pair.sum_out->get_value());
        CHECK(pair.alt_overflow->get_value() == pair.sum_overflow->get_value());
        CHECK(alternate.output() == *evaluate(GateKind::SUM, {a, b}));
        CHECK(alternate.overflow() == evaluate_overflow(a, b));
    }
}

TEST_CASE("SumAlternate reproduces the adder table", "[sum_alternate]") {
    Circuit circuit(quiet_config());
    SumAlternate alternate(&circuit);
    AdderPair pair = build_pair(circuit, alternate);

    // a, b, sum, overflow
    const std::vector<std::tuple<TernaryValue, TernaryValue, TernaryValue, TernaryValue>> expectations = {
        {P, P, M, P}, {P, N, P, N}, {P, M, N, N}, {N, N, N, N}, {N, M, M, N}, {M, M, P, M},
    };

    for (const auto& [a, b, sum, overflow] : expectations) {
        circuit.set_from_write(pair.a, a);
        circuit.set_from_write(pair.b, b);
        CHECK(pair.alt_out->get_value() == sum);
        CHECK(pair.alt_overflow->get_value() == overflow);
    }
}
