/// @file test_tryte.cpp
/// @brief Tests for the 9-trit memory register

#include <catch2/catch.hpp>

#include "simulation/circuit.hpp"
#include "simulation/errors.hpp"
#include "simulation/tryte.hpp"
#include "test_support.hpp"

#include <array>
#include <vector>

using namespace trilogic;
using namespace trilogic::test;

namespace {

struct TryteBench {
    std::vector<ConnectionPoint*> writers;
    std::vector<ConnectionPoint*> readers;
    ConnectionPoint* read_flag = nullptr;
};

TryteBench build_bench(Circuit& circuit, Tryte& tryte) {
    TryteBench bench;
    std::vector<Wire*> in_wires;
    std::vector<Wire*> out_wires;

    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        bench.writers.push_back(circuit.add_point(PointRole::WRITER));
        in_wires.push_back(circuit.add_wire());
        circuit.connect(in_wires.back(), bench.writers.back());

        bench.readers.push_back(circuit.add_point(PointRole::READER));
        out_wires.push_back(circuit.add_wire());
        circuit.connect(out_wires.back(), bench.readers.back());
    }

    Wire* read_wire = circuit.add_wire();
    bench.read_flag = circuit.add_point(PointRole::WRITER);
    circuit.connect(read_wire, bench.read_flag);

    tryte.set_input_wires(in_wires);
    tryte.set_output_wires(out_wires);
    tryte.set_read_wire(read_wire);
    return bench;
}

void check_all(const TryteBench& bench, TernaryValue expected) {
    for (std::size_t i = 0; i < bench.readers.size(); i++) {
        INFO("cell " << i);
        CHECK(bench.readers[i]->get_value() == expected);
    }
}

} // namespace

TEST_CASE("Tryte reads, holds, and negates", "[tryte]") {
    Circuit circuit(quiet_config());
    Tryte tryte(&circuit);
    TryteBench bench = build_bench(circuit, tryte);

    // Clear: all inputs (0), read (+)
    for (ConnectionPoint* writer : bench.writers) {
        circuit.set_from_write(writer, N);
    }
    circuit.set_from_write(bench.read_flag, P);
    check_all(bench, N);

    // Read off: input changes do not reach the outputs
    circuit.set_from_write(bench.read_flag, N);
    for (ConnectionPoint* writer : bench.writers) {
        circuit.set_from_write(writer, P);
    }
    check_all(bench, N);

    // Read on: everything latches at once
    circuit.set_from_write(bench.read_flag, P);
    check_all(bench, P);

    // Inverse read: everything latches negated
    circuit.set_from_write(bench.read_flag, M);
    check_all(bench, M);

    // Hold again through another input change
    circuit.set_from_write(bench.read_flag, N);
    for (ConnectionPoint* writer : bench.writers) {
        circuit.set_from_write(writer, N);
    }
    check_all(bench, M);
}

TEST_CASE("Tryte stores a distinct value per cell", "[tryte]") {
    Circuit circuit(quiet_config());
    Tryte tryte(&circuit);
    TryteBench bench = build_bench(circuit, tryte);

    const std::array<TernaryValue, Tryte::SIZE> word = {P, N, M, M, P, N, N, M, P};

    circuit.set_from_write(bench.read_flag, P);
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        circuit.set_from_write(bench.writers[i], word[i]);
    }
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        CHECK(bench.readers[i]->get_value() == word[i]);
        CHECK(tryte.value_at(i) == word[i]);
    }

    // Freeze, then scramble the inputs
    circuit.set_from_write(bench.read_flag, N);
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        circuit.set_from_write(bench.writers[i], negate(word[i]));
    }
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        CHECK(bench.readers[i]->get_value() == word[i]);
    }

    // (+) now reapplies the latest inputs, (-) their negation
    circuit.set_from_write(bench.read_flag, P);
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        CHECK(bench.readers[i]->get_value() == negate(word[i]));
    }
    circuit.set_from_write(bench.read_flag, M);
    for (std::size_t i = 0; i < Tryte::SIZE; i++) {
        CHECK(bench.readers[i]->get_value() == word[i]);
    }
}

TEST_CASE("Tryte cells can be wired one at a time", "[tryte]") {
    Circuit circuit(quiet_config());
    Tryte tryte(&circuit);
    CHECK(tryte.size() == 9);

    ConnectionPoint* writer = circuit.add_point(PointRole::WRITER);
    ConnectionPoint* reader = circuit.add_point(PointRole::READER);
    ConnectionPoint* read_flag = circuit.add_point(PointRole::WRITER);
    Wire* in = circuit.add_wire();
    Wire* out = circuit.add_wire();
    Wire* read = circuit.add_wire();
    circuit.connect(in, writer);
    circuit.connect(out, reader);
    circuit.connect(read, read_flag);

    tryte.set_input_wire_at(8, in);
    tryte.set_output_wire_at(8, out);
    tryte.set_read_wire(read);

    circuit.set_from_write(writer, M);
    circuit.set_from_write(read_flag, P);
    CHECK(reader->get_value() == M);
    CHECK(tryte.value_at(8) == M);
    CHECK(tryte.value_at(0) == N); // unwired cell reads (0) data
}

TEST_CASE("Tryte rejects wrong indices and wire counts", "[tryte][connection]") {
    Circuit circuit(quiet_config());
    Tryte tryte(&circuit);
    Wire* wire = circuit.add_wire();

    CHECK_THROWS_AS(tryte.set_input_wire_at(9, wire), ConnectionError);
    CHECK_THROWS_AS(tryte.set_output_wire_at(42, wire), ConnectionError);
    CHECK_THROWS_AS(tryte.value_at(9), ConnectionError);
    CHECK_THROWS_AS(tryte.cell(9), ConnectionError);

    std::vector<Wire*> eight;
    for (int i = 0; i < 8; i++) {
        eight.push_back(circuit.add_wire());
    }
    CHECK_THROWS_AS(tryte.set_input_wires(eight), ConnectionError);
    CHECK_THROWS_AS(tryte.set_output_wires(eight), ConnectionError);

    std::vector<Wire*> ten = eight;
    ten.push_back(circuit.add_wire());
    ten.push_back(circuit.add_wire());
    CHECK_THROWS_AS(tryte.set_input_wires(ten), ConnectionError);

    // Nothing was attached by the failed calls
    for (Wire* w : ten) {
        CHECK(w->get_connections().empty());
    }
}
