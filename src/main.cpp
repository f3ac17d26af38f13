/// @file main.cpp
/// @brief trilogic entry point: loads the gate library and prints the
/// balanced-ternary sum table from both the SUM gate and its primitive-gate
/// rebuild.

#include "simulation/circuit.hpp"
#include "simulation/sum_alternate.hpp"

#include <cstdio>
#include <exception>

namespace {

/// Both adders share the same two driven input wires
struct AdderBench {
    trilogic::Circuit circuit;
    trilogic::ConnectionPoint* a = nullptr;
    trilogic::ConnectionPoint* b = nullptr;
    trilogic::Gate* sum = nullptr;
    trilogic::SumAlternate* alternate = nullptr;
};

void print_sum_table(AdderBench& bench) {
    using trilogic::ternary_name;

    std::printf(" a   b  | sum ovf | alt alt-ovf\n");
    std::printf("--------+---------+------------\n");
    for (trilogic::TernaryValue a : trilogic::ALL_TERNARY_VALUES) {
        for (trilogic::TernaryValue b : trilogic::ALL_TERNARY_VALUES) {
            bench.circuit.set_from_write(bench.a, a);
            bench.circuit.set_from_write(bench.b, b);
            std::printf("%s %s | %s %s | %s %s\n", ternary_name(a).data(), ternary_name(b).data(),
                        ternary_name(bench.circuit.output_value(bench.sum, 0)).data(),
                        ternary_name(bench.circuit.output_value(bench.sum, 1)).data(),
                        ternary_name(bench.alternate->output()).data(),
                        ternary_name(bench.alternate->overflow()).data());
        }
    }
}

} // namespace

int main() {
    try {
        AdderBench bench;
        trilogic::Circuit& circuit = bench.circuit;

        bench.a = circuit.add_point(trilogic::PointRole::WRITER);
        bench.b = circuit.add_point(trilogic::PointRole::WRITER);
        trilogic::Wire* wire_a = circuit.add_wire();
        trilogic::Wire* wire_b = circuit.add_wire();
        circuit.connect(wire_a, bench.a);
        circuit.connect(wire_b, bench.b);

        bench.sum = circuit.add_gate(trilogic::GateKind::SUM);
        circuit.set_input_wire1(bench.sum, wire_a);
        circuit.set_input_wire2(bench.sum, wire_b);

        trilogic::SumAlternate alternate(&circuit);
        alternate.set_input_wire1(wire_a);
        alternate.set_input_wire2(wire_b);
        bench.alternate = &alternate;

        std::printf("Done loading gates!\n\n");
        print_sum_table(bench);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[trilogic] error: %s\n", e.what());
        return 1;
    }
    return 0;
}
