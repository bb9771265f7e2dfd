/// @file adder.cpp
/// @brief Half adder, full adder and ripple-carry adder wiring

#include "simulation/adder.hpp"

#include "simulation/gate.hpp"

namespace wirelogic {

namespace {

Inputs concat(const Inputs& a, const Inputs& b) {
    Inputs all;
    all.reserve(a.size() + b.size());
    all.insert(all.end(), a.begin(), a.end());
    all.insert(all.end(), b.begin(), b.end());
    return all;
}

} // namespace

AdderOutput Adder::evaluate(const EvaluationOptions& options) const {
    std::vector<Signal> outputs = evaluate_outputs(options);
    return AdderOutput{outputs[SUM], outputs[CARRY]};
}

std::vector<Signal> Adder::compute_outputs(Evaluation& evaluation) const {
    Signal sum = sum_->resolve(evaluation);
    Signal carry = carry_->resolve(evaluation);
    return {sum, carry};
}

Signal Adder::compute_output(Evaluation& evaluation, std::size_t output) const {
    return output == SUM ? sum_->resolve(evaluation) : carry_->resolve(evaluation);
}

void Adder::release_links(Inputs& out) {
    Element::release_links(out);
    out.push_back(std::move(sum_));
    out.push_back(std::move(carry_));
}

HalfAdder::HalfAdder(ElementPtr i0, ElementPtr i1) : Adder("HALF_ADDER", {std::move(i0), std::move(i1)}) {
    sum_ = std::make_shared<Xor>(get_inputs());
    carry_ = std::make_shared<And>(get_inputs());
}

FullAdder::FullAdder(ElementPtr carry_in, ElementPtr i0, ElementPtr i1)
    : Adder("FULL_ADDER", {std::move(carry_in), std::move(i0), std::move(i1)}) {
    const Inputs& in = get_inputs();

    auto h0 = std::make_shared<HalfAdder>(in[1], in[2]);
    auto h0_sum = std::make_shared<Tap>(h0, SUM);
    auto h0_carry = std::make_shared<Tap>(h0, CARRY);

    auto h1 = std::make_shared<HalfAdder>(in[0], h0_sum);
    auto h1_carry = std::make_shared<Tap>(h1, CARRY);

    sum_ = std::make_shared<Tap>(h1, SUM);
    carry_ = std::make_shared<Or>(Inputs{h0_carry, h1_carry});
}

RippleCarryAdder::RippleCarryAdder(const Inputs& a, const Inputs& b) : Element("RIPPLE_ADDER", concat(a, b)) {
    if (a.empty()) {
        throw construction_error(ConstructionFault::ARITY_MISMATCH, "requires at least 1 bit");
    }
    if (a.size() != b.size()) {
        throw construction_error(ConstructionFault::ARITY_MISMATCH,
                                 "operand widths differ: " + std::to_string(a.size()) + " and " +
                                     std::to_string(b.size()));
    }

    const Inputs& in = get_inputs();
    const std::size_t width = a.size();
    ElementPtr carry;

    for (std::size_t i = 0; i < width; i++) {
        std::shared_ptr<const Adder> stage;
        if (i == 0) {
            // First bit: no carry-in
            stage = std::make_shared<HalfAdder>(in[i], in[width + i]);
        } else {
            stage = std::make_shared<FullAdder>(carry, in[i], in[width + i]);
        }
        outputs_.push_back(std::make_shared<Tap>(stage, Adder::SUM));
        carry = std::make_shared<Tap>(stage, Adder::CARRY);
    }
    outputs_.push_back(carry); // index width = carry-out
}

std::vector<Signal> RippleCarryAdder::compute_outputs(Evaluation& evaluation) const {
    std::vector<Signal> values;
    values.reserve(outputs_.size());
    for (const ElementPtr& output : outputs_) {
        values.push_back(output->resolve(evaluation));
    }
    return values;
}

Signal RippleCarryAdder::compute_output(Evaluation& evaluation, std::size_t output) const {
    return outputs_[output]->resolve(evaluation);
}

void RippleCarryAdder::release_links(Inputs& out) {
    Element::release_links(out);
    for (auto& output : outputs_) {
        out.push_back(std::move(output));
    }
    outputs_.clear();
}

} // namespace wirelogic
