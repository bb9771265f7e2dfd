/// @file element.cpp
/// @brief Element construction checks, resolution, and the Tap element

#include "simulation/element.hpp"

#include <stdexcept>

namespace wirelogic {

namespace {

uint32_t next_element_id = 0;

} // namespace

Element::Element(std::string_view kind, Inputs inputs, bool multi_output_inputs)
    : id_(next_element_id++), kind_(kind), inputs_(std::move(inputs)) {
    for (std::size_t i = 0; i < inputs_.size(); i++) {
        const ElementPtr& input = inputs_[i];
        if (input == nullptr) {
            throw construction_error(ConstructionFault::MISSING_INPUT,
                                     "input " + std::to_string(i) + " is not connected");
        }
        if (!multi_output_inputs && input->output_count() != 1) {
            throw construction_error(ConstructionFault::INVALID_OUTPUT,
                                     "input " + std::to_string(i) + " (" + input->describe() + ") has " +
                                         std::to_string(input->output_count()) +
                                         " outputs; wire one of them through a Tap");
        }
    }
}

Element::~Element() {
    release_all(std::move(inputs_));
}

void Element::release_links(Inputs& out) {
    for (auto& input : inputs_) {
        out.push_back(std::move(input));
    }
    inputs_.clear();
}

void Element::release_all(Inputs pending) {
    while (!pending.empty()) {
        ElementPtr next = std::move(pending.back());
        pending.pop_back();
        if (next != nullptr && next.use_count() == 1) {
            // Sole owner: empty it first so its own destructor has nothing left to free.
            // Every element is created non-const, the const is only on the shared handle.
            const_cast<Element&>(*next).release_links(pending);
        }
    }
}

std::string Element::describe() const {
    std::string text = kind_ + "#" + std::to_string(id_);
    if (!label_.empty()) {
        text += " '" + label_ + "'";
    }
    return text;
}

void Element::require_inputs(std::size_t count) const {
    if (inputs_.size() != count) {
        throw construction_error(ConstructionFault::ARITY_MISMATCH,
                                 "requires exactly " + std::to_string(count) + (count == 1 ? " input" : " inputs") +
                                     ", got " + std::to_string(inputs_.size()));
    }
}

void Element::require_at_least(std::size_t minimum) const {
    if (inputs_.size() < minimum) {
        throw construction_error(ConstructionFault::ARITY_MISMATCH,
                                 "requires at least " + std::to_string(minimum) +
                                     (minimum == 1 ? " input" : " inputs") + ", got " +
                                     std::to_string(inputs_.size()));
    }
}

ConstructionError Element::construction_error(ConstructionFault fault, const std::string& detail) const {
    return ConstructionError(describe(), fault, detail);
}

std::vector<Signal> Element::evaluate_outputs(const EvaluationOptions& options) const {
    Evaluation evaluation(options);
    return resolve_outputs(evaluation);
}

std::vector<Signal> Element::resolve_outputs(Evaluation& evaluation) const {
    auto frame = evaluation.enter(*this);
    std::vector<Signal> outputs = compute_outputs(evaluation);
    evaluation.record(*this, outputs);
    return outputs;
}

Signal Element::resolve(Evaluation& evaluation, std::size_t output) const {
    if (output >= output_count()) {
        throw std::out_of_range(describe() + " has no output " + std::to_string(output));
    }
    auto frame = evaluation.enter(*this);
    Signal value = compute_output(evaluation, output);
    evaluation.record(*this, output, value);
    return value;
}

Signal Element::compute_output(Evaluation& evaluation, std::size_t output) const {
    return compute_outputs(evaluation)[output];
}

Signal Gate::evaluate(const EvaluationOptions& options) const {
    return evaluate_outputs(options).front();
}

Tap::Tap(ElementPtr source, std::size_t output) : Gate("TAP", {std::move(source)}, true), output_(output) {
    const ElementPtr& tapped = get_inputs().front();
    if (output_ >= tapped->output_count()) {
        throw construction_error(ConstructionFault::INVALID_OUTPUT,
                                 tapped->describe() + " has no output " + std::to_string(output_));
    }
}

Signal Tap::compute(Evaluation& evaluation) const {
    return get_inputs().front()->resolve(evaluation, output_);
}

} // namespace wirelogic
