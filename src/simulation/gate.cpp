/// @file gate.cpp
/// @brief Gate reductions and primitive gate construction

#include "simulation/gate.hpp"

#include <stdexcept>

namespace wirelogic {

bool reduce(GateType type, const std::vector<bool>& inputs) {
    switch (type) {
    case GateType::NOT:
        if (inputs.size() != 1) {
            throw std::invalid_argument("NOT gate requires exactly 1 input");
        }
        return !inputs[0];

    case GateType::AND:
        if (inputs.empty()) {
            throw std::invalid_argument("AND gate requires at least 1 input");
        }
        for (bool v : inputs) {
            if (!v) {
                return false;
            }
        }
        return true;

    case GateType::OR:
        if (inputs.empty()) {
            throw std::invalid_argument("OR gate requires at least 1 input");
        }
        for (bool v : inputs) {
            if (v) {
                return true;
            }
        }
        return false;

    case GateType::XOR:
        if (inputs.empty()) {
            throw std::invalid_argument("XOR gate requires at least 1 input");
        }
        {
            int high = 0;
            for (bool v : inputs) {
                if (v) {
                    high++;
                }
            }
            return high == 1;
        }
    }
    throw std::invalid_argument("Unknown gate type");
}

PrimitiveGate::PrimitiveGate(GateType type, Inputs inputs)
    : Gate(gate_type_name(type), std::move(inputs)), type_(type) {
    if (type_ == GateType::NOT) {
        require_inputs(1);
    } else {
        require_at_least(1);
    }
}

Signal PrimitiveGate::compute(Evaluation& evaluation) const {
    // Every input is resolved, even once the result is known
    std::vector<bool> values;
    values.reserve(get_inputs().size());
    for (std::size_t i = 0; i < get_inputs().size(); i++) {
        values.push_back(input_value(evaluation, i));
    }
    return reduce(type_, values);
}

Inverter::Inverter(ElementPtr input) : PrimitiveGate(GateType::NOT, {std::move(input)}) {}

Inverter::Inverter(Inputs inputs) : PrimitiveGate(GateType::NOT, std::move(inputs)) {}

And::And(Inputs inputs) : PrimitiveGate(GateType::AND, std::move(inputs)) {}

Or::Or(Inputs inputs) : PrimitiveGate(GateType::OR, std::move(inputs)) {}

Xor::Xor(Inputs inputs) : PrimitiveGate(GateType::XOR, std::move(inputs)) {}

} // namespace wirelogic
