/// @file main.cpp
/// @brief wirelogic demo: prints the truth tables of the built-in circuits and
/// walks a Switch-driven multiplexer through a few flips.

#include "simulation/adder.hpp"
#include "simulation/errors.hpp"
#include "simulation/gate.hpp"
#include "simulation/multiplexer.hpp"
#include "simulation/nand.hpp"
#include "simulation/sources.hpp"
#include "simulation/switch.hpp"
#include "simulation/truth_table.hpp"
#include "simulation/wire.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int ADDER_BITS = 4;
constexpr int ADDER_A = 11;
constexpr int ADDER_B = 6;

void print_table(const char* title, std::size_t inputs, const wirelogic::CircuitFactory& build,
                 const std::vector<std::string>& input_names, const std::vector<std::string>& output_names) {
    std::printf("%s\n%s\n", title,
                wirelogic::format_truth_table(wirelogic::tabulate(inputs, build), input_names, output_names).c_str());
}

/// Drives an N-bit ripple-carry adder from switches set to a and b.
int add_with_circuit(int a, int b) {
    using namespace wirelogic;

    auto ground = std::make_shared<Ground>();
    Inputs a_bits;
    Inputs b_bits;
    for (int i = 0; i < ADDER_BITS; i++) {
        auto bit_a = std::make_shared<Switch>(ground);
        auto bit_b = std::make_shared<Switch>(ground);
        if ((a >> i) & 1) {
            bit_a->flip();
        }
        if ((b >> i) & 1) {
            bit_b->flip();
        }
        a_bits.push_back(bit_a);
        b_bits.push_back(bit_b);
    }

    RippleCarryAdder adder(a_bits, b_bits);
    std::vector<Signal> outputs = adder.evaluate();

    int result = 0;
    for (std::size_t i = 0; i < outputs.size(); i++) {
        if (outputs[i]) {
            result |= (1 << i);
        }
    }
    return result;
}

void run_switch_scenario() {
    using namespace wirelogic;

    auto vcc = std::make_shared<Vcc>();
    auto ground = std::make_shared<Ground>();
    auto select = std::make_shared<Switch>(vcc);
    select->set_label("select");
    auto mux = std::make_shared<Multiplexer2>(select, vcc, ground);

    std::printf("Multiplexer2(Switch(Vcc), i0=Vcc, i1=Ground)\n");
    for (int step = 0; step < 3; step++) {
        std::printf("  select %s -> %d\n", select->is_flipped() ? "flipped  " : "unflipped", mux->evaluate());
        select->flip();
    }
    std::printf("\n");
}

void run_feedback_scenario() {
    using namespace wirelogic;

    // NOT(wire) with the wire driven by the inverter itself
    auto loop = std::make_shared<Wire>();
    auto inverter = std::make_shared<Inverter>(loop);
    loop->connect(inverter);

    try {
        (void)inverter->evaluate();
    } catch (const EvaluationError& e) {
        std::printf("Feedback loop rejected: %s\n", e.what());
    }
    loop->disconnect();
}

} // namespace

int main() {
    using namespace wirelogic;

    print_table("NAND", 2,
                [](const Inputs& in) { return std::make_shared<Nand>(in); },
                {"A", "B"}, {"Y"});
    print_table("XOR (one-hot)", 3,
                [](const Inputs& in) { return std::make_shared<Xor>(in); },
                {"A", "B", "C"}, {"Y"});
    print_table("Half adder", 2,
                [](const Inputs& in) { return std::make_shared<HalfAdder>(in[0], in[1]); },
                {"A", "B"}, {"S", "C"});
    print_table("Full adder", 3,
                [](const Inputs& in) { return std::make_shared<FullAdder>(in[0], in[1], in[2]); },
                {"Cin", "A", "B"}, {"S", "Cout"});
    print_table("Multiplexer2", 3,
                [](const Inputs& in) { return std::make_shared<Multiplexer2>(in[0], in[1], in[2]); },
                {"Sel", "I0", "I1"}, {"Y"});

    run_switch_scenario();

    std::printf("%d-bit ripple-carry adder: %d + %d = %d\n\n", ADDER_BITS, ADDER_A, ADDER_B,
                add_with_circuit(ADDER_A, ADDER_B));

    run_feedback_scenario();
    return 0;
}
