/// @file test_evaluation.cpp
/// @brief Tests for wires, cycle and depth detection, and evaluation tracing

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "simulation/adder.hpp"
#include "simulation/gate.hpp"
#include "simulation/sources.hpp"
#include "simulation/switch.hpp"
#include "simulation/wire.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace wirelogic;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

namespace {

/// Reads back everything written to a temporary file
std::string read_all(std::FILE* file) {
    std::rewind(file);
    std::string text;
    char buffer[256];
    size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
        text.append(buffer, n);
    }
    return text;
}

} // namespace

// ---------- Wires ----------

TEST_CASE("A wire forwards its driver", "[evaluation][wire]") {
    auto wire = std::make_shared<Wire>();
    auto inverted = std::make_shared<Inverter>(wire);

    wire->connect(std::make_shared<Vcc>());
    REQUIRE(wire->is_connected());
    CHECK(inverted->evaluate() == false);
}

TEST_CASE("Evaluating an unconnected wire fails", "[evaluation][wire]") {
    auto wire = std::make_shared<Wire>();
    wire->set_label("floating");
    auto gate = std::make_shared<And>(Inputs{std::make_shared<Vcc>(), wire});

    try {
        (void)gate->evaluate();
        FAIL("expected EvaluationError");
    } catch (const EvaluationError& e) {
        CHECK(e.fault() == EvaluationFault::UNCONNECTED);
        CHECK_THAT(e.element(), ContainsSubstring("'floating'"));
        CHECK_THAT(e.what(), ContainsSubstring("unconnected input"));
        REQUIRE(e.path().size() == 2);
        CHECK_THAT(e.path()[0], StartsWith("AND#"));
    }
}

TEST_CASE("A disconnected wire is unconnected again", "[evaluation][wire]") {
    auto wire = std::make_shared<Wire>();
    wire->connect(std::make_shared<Ground>());
    CHECK(wire->evaluate() == false);

    wire->disconnect();
    CHECK_FALSE(wire->is_connected());
    CHECK_THROWS_AS(wire->evaluate(), EvaluationError);
}

TEST_CASE("Wire connection is validated", "[evaluation][wire]") {
    auto vcc = std::make_shared<Vcc>();
    auto wire = std::make_shared<Wire>();

    CHECK_THROWS_AS(wire->connect(nullptr), ConstructionError);
    CHECK_THROWS_AS(wire->connect(std::make_shared<HalfAdder>(vcc, vcc)), ConstructionError);

    wire->connect(vcc);
    CHECK_NOTHROW(wire->connect(vcc)); // same driver again
    CHECK(wire->get_driver() == vcc);
}

TEST_CASE("Reconnecting a driven wire is a construction error", "[evaluation][wire]") {
    auto vcc = std::make_shared<Vcc>();
    auto wire = std::make_shared<Wire>();
    wire->connect(vcc);

    try {
        wire->connect(std::make_shared<Ground>());
        FAIL("expected ConstructionError");
    } catch (const ConstructionError& e) {
        CHECK(e.fault() == ConstructionFault::ALREADY_DRIVEN);
        CHECK(e.element() == wire->describe());
        CHECK_THAT(e.what(), ContainsSubstring("already driven by " + vcc->describe()));
    }
    CHECK(wire->get_driver() == vcc);

    // The documented way to rewire
    wire->disconnect();
    CHECK_NOTHROW(wire->connect(std::make_shared<Ground>()));
    CHECK(wire->evaluate() == false);
}

TEST_CASE("A loop closed through a wire is freed once the wire is disconnected", "[evaluation][wire]") {
    std::weak_ptr<const Element> watched_inverter;
    std::weak_ptr<const Element> watched_wire;
    {
        auto loop = std::make_shared<Wire>();
        auto inverter = std::make_shared<Inverter>(loop);
        loop->connect(inverter);
        watched_inverter = inverter;
        watched_wire = loop;
        CHECK_THROWS_AS(inverter->evaluate(), EvaluationError);
        loop->disconnect();
    }
    CHECK(watched_inverter.expired());
    CHECK(watched_wire.expired());
}

TEST_CASE("A loop left connected outlives its handles", "[evaluation][wire]") {
    std::weak_ptr<Wire> watched;
    {
        auto loop = std::make_shared<Wire>();
        loop->connect(std::make_shared<Inverter>(loop));
        watched = loop;
    }
    // Still reachable through the loop; disconnecting releases it
    auto loop = watched.lock();
    REQUIRE(loop != nullptr);
    loop->disconnect();
    loop.reset();
    CHECK(watched.expired());
}

// ---------- Cycles ----------

TEST_CASE("A feedback loop is reported as a cycle, not a crash", "[evaluation][cycle]") {
    auto loop = std::make_shared<Wire>();
    auto inverter = std::make_shared<Inverter>(loop);
    loop->connect(inverter);

    try {
        (void)inverter->evaluate();
        FAIL("expected EvaluationError");
    } catch (const EvaluationError& e) {
        CHECK(e.fault() == EvaluationFault::CYCLE);
        CHECK(e.element() == inverter->describe());
        // NOT -> WIRE -> NOT
        REQUIRE(e.path().size() == 3);
        CHECK(e.path().front() == inverter->describe());
        CHECK(e.path()[1] == loop->describe());
        CHECK(e.path().back() == inverter->describe());
        CHECK_THAT(e.what(), ContainsSubstring("cycle detected"));
    }

    loop->disconnect();
}

TEST_CASE("A cycle deep inside a larger circuit is detected", "[evaluation][cycle]") {
    auto vcc = std::make_shared<Vcc>();
    auto feedback = std::make_shared<Wire>();
    auto inner = std::make_shared<Or>(Inputs{feedback, vcc});
    auto middle = std::make_shared<And>(Inputs{vcc, inner});
    auto adder = std::make_shared<FullAdder>(vcc, middle, vcc);
    feedback->connect(middle);

    CHECK_THROWS_AS(adder->evaluate(), EvaluationError);
    CHECK_THROWS_AS(middle->evaluate(), EvaluationError);

    // Breaking the loop makes the circuit evaluable again
    feedback->disconnect();
    feedback->connect(vcc);
    CHECK(middle->evaluate() == true);
    CHECK(adder->evaluate() == AdderOutput{true, true});
}

TEST_CASE("Shared inputs are not mistaken for cycles", "[evaluation][cycle]") {
    auto vcc = std::make_shared<Vcc>();
    auto shared = std::make_shared<Inverter>(vcc);
    auto wire = std::make_shared<Wire>();
    wire->connect(shared);

    // Diamond: shared reaches the XOR twice, once through the wire
    auto top = std::make_shared<Xor>(Inputs{shared, wire, std::make_shared<Inverter>(shared)});
    CHECK(top->evaluate() == true);
}

// ---------- Depth limit ----------

TEST_CASE("Depth limit stops very deep chains", "[evaluation][depth]") {
    ElementPtr chain = std::make_shared<Vcc>();
    for (int i = 0; i < 20; i++) {
        chain = std::make_shared<Inverter>(chain);
    }
    const auto& top = static_cast<const Gate&>(*chain);

    // 20 inverters + the source
    EvaluationOptions roomy;
    roomy.max_depth = 21;
    CHECK(top.evaluate(roomy) == true);

    EvaluationOptions tight;
    tight.max_depth = 20;
    try {
        (void)top.evaluate(tight);
        FAIL("expected EvaluationError");
    } catch (const EvaluationError& e) {
        CHECK(e.fault() == EvaluationFault::DEPTH_EXCEEDED);
        CHECK_THAT(e.element(), StartsWith("VCC#"));
        CHECK_THAT(e.what(), ContainsSubstring("more than 20 nested elements"));
    }
}

TEST_CASE("A depth error carries both ends of the active path", "[evaluation][depth]") {
    auto bottom = std::make_shared<Vcc>();
    ElementPtr chain = bottom;
    for (int i = 0; i < 20; i++) {
        chain = std::make_shared<Inverter>(chain);
    }

    EvaluationOptions tight;
    tight.max_depth = 20;
    try {
        (void)chain->evaluate_outputs(tight);
        FAIL("expected EvaluationError");
    } catch (const EvaluationError& e) {
        REQUIRE(e.fault() == EvaluationFault::DEPTH_EXCEEDED);
        // 20 active inverters plus the source: the 8 outermost, "...", the 8 innermost
        REQUIRE(e.path().size() == 2 * DEPTH_ERROR_PATH_EDGE + 1);
        CHECK(e.path().front() == chain->describe());
        CHECK(e.path()[DEPTH_ERROR_PATH_EDGE] == "...");
        CHECK(e.path().back() == bottom->describe());
        CHECK_THAT(e.what(), ContainsSubstring("(via " + chain->describe() + " -> "));
    }
}

TEST_CASE("A short depth error path is not truncated", "[evaluation][depth]") {
    auto vcc = std::make_shared<Vcc>();
    auto inner = std::make_shared<Inverter>(vcc);
    auto outer = std::make_shared<Inverter>(inner);

    EvaluationOptions tight;
    tight.max_depth = 2;
    try {
        (void)outer->evaluate(tight);
        FAIL("expected EvaluationError");
    } catch (const EvaluationError& e) {
        CHECK(e.fault() == EvaluationFault::DEPTH_EXCEEDED);
        CHECK(e.path() == std::vector<std::string>{outer->describe(), inner->describe(), vcc->describe()});
    }
}

TEST_CASE("Default depth limit is generous", "[evaluation][depth]") {
    ElementPtr chain = std::make_shared<Ground>();
    for (int i = 0; i < 1000; i++) {
        chain = std::make_shared<Inverter>(chain);
    }
    CHECK(chain->evaluate_outputs() == std::vector<Signal>{false});
}

TEST_CASE("A zero depth limit is rejected", "[evaluation][depth]") {
    EvaluationOptions options;
    options.max_depth = 0;
    CHECK_THROWS_AS(Evaluation(options), std::invalid_argument);
}

// ---------- Statistics and errors ----------

TEST_CASE("Evaluation statistics", "[evaluation]") {
    auto vcc = std::make_shared<Vcc>();
    auto gate = std::make_shared<And>(Inputs{vcc, std::make_shared<Inverter>(vcc)});

    Evaluation evaluation;
    CHECK(evaluation.depth() == 0);
    CHECK(gate->resolve(evaluation) == false);
    CHECK(evaluation.depth() == 0);
    CHECK(evaluation.deepest() == 3);
    CHECK(evaluation.resolutions() == 4);

    // The same evaluation can be reused; statistics accumulate
    CHECK(gate->resolve(evaluation) == false);
    CHECK(evaluation.resolutions() == 8);
}

TEST_CASE("The active stack unwinds after a failed evaluation", "[evaluation]") {
    auto wire = std::make_shared<Wire>();
    auto gate = std::make_shared<Or>(Inputs{std::make_shared<Vcc>(), wire});

    Evaluation evaluation;
    CHECK_THROWS_AS(gate->resolve(evaluation), EvaluationError);
    CHECK(evaluation.depth() == 0);

    wire->connect(std::make_shared<Ground>());
    CHECK(gate->resolve(evaluation) == true);
}

TEST_CASE("Evaluation errors are runtime_error", "[evaluation]") {
    auto wire = std::make_shared<Wire>();
    CHECK_THROWS_AS(wire->evaluate(), std::runtime_error);
}

TEST_CASE("Fault names", "[evaluation]") {
    CHECK(evaluation_fault_name(EvaluationFault::CYCLE) == "cycle detected");
    CHECK(evaluation_fault_name(EvaluationFault::DEPTH_EXCEEDED) == "depth exceeded");
    CHECK(evaluation_fault_name(EvaluationFault::UNCONNECTED) == "unconnected input");
    CHECK(construction_fault_name(ConstructionFault::ARITY_MISMATCH) == "arity mismatch");
    CHECK(construction_fault_name(ConstructionFault::MISSING_INPUT) == "missing input");
    CHECK(construction_fault_name(ConstructionFault::INVALID_OUTPUT) == "invalid output");
    CHECK(construction_fault_name(ConstructionFault::ALREADY_DRIVEN) == "already driven");
}

// ---------- Tracing ----------

TEST_CASE("Trace writes one line per resolution, indented by depth", "[evaluation][trace]") {
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    auto vcc = std::make_shared<Vcc>();
    auto inverter = std::make_shared<Inverter>(vcc);
    inverter->set_label("n");

    EvaluationOptions options;
    options.trace = sink;
    CHECK(inverter->evaluate(options) == false);

    std::string expected = "[wirelogic]   " + vcc->describe() + " -> 1\n" + "[wirelogic] " +
                           inverter->describe() + " -> 0\n";
    CHECK(read_all(sink) == expected);
    std::fclose(sink);
}

TEST_CASE("Trace prints every output of a multi-output element", "[evaluation][trace]") {
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    auto vcc = std::make_shared<Vcc>();
    HalfAdder adder(vcc, vcc);

    EvaluationOptions options;
    options.trace = sink;
    CHECK(adder.evaluate(options) == AdderOutput{false, true});

    std::string text = read_all(sink);
    CHECK_THAT(text, ContainsSubstring("[wirelogic] " + adder.describe() + " -> 01\n"));
    CHECK_THAT(text, ContainsSubstring("[wirelogic]   XOR#"));
    std::fclose(sink);
}

TEST_CASE("Trace of a tapped output names the output index", "[evaluation][trace]") {
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    auto vcc = std::make_shared<Vcc>();
    auto adder = std::make_shared<HalfAdder>(vcc, vcc);
    auto carry = std::make_shared<Tap>(adder, Adder::CARRY);

    EvaluationOptions options;
    options.trace = sink;
    CHECK(carry->evaluate(options) == true);

    std::string text = read_all(sink);
    CHECK_THAT(text, ContainsSubstring("[wirelogic]   " + adder->describe() + "[1] -> 1\n"));
    CHECK_THAT(text, ContainsSubstring("AND#"));
    CHECK_THAT(text, !ContainsSubstring("XOR#"));
    std::fclose(sink);
}

TEST_CASE("No trace sink means no output", "[evaluation][trace]") {
    auto vcc = std::make_shared<Vcc>();
    Evaluation evaluation;
    CHECK(evaluation.options().trace == nullptr);
    CHECK(vcc->resolve(evaluation) == true);
}
