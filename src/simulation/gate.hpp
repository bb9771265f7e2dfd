#pragma once

/// @file gate.hpp
/// @brief Primitive gates: boolean reductions over evaluated inputs

#include "simulation/element.hpp"

#include <string_view>
#include <vector>

namespace wirelogic {

/// Reductions implemented directly (everything else is composed from these)
enum class GateType { NOT, AND, OR, XOR };

/// Returns the human-readable name of a gate type
[[nodiscard]] constexpr std::string_view gate_type_name(GateType type) {
    switch (type) {
    case GateType::NOT:
        return "NOT";
    case GateType::AND:
        return "AND";
    case GateType::OR:
        return "OR";
    case GateType::XOR:
        return "XOR";
    }
    return "UNKNOWN";
}

/// Applies a gate's reduction to already-evaluated input values.
/// This is a pure function with no side effects.
///
/// XOR is one-hot: true iff exactly one input is true, for any input count.
/// @throws std::invalid_argument if the input count is wrong for the gate type
[[nodiscard]] bool reduce(GateType type, const std::vector<bool>& inputs);

/// A gate that evaluates every input and reduces the values with reduce().
class PrimitiveGate : public Gate {
  public:
    [[nodiscard]] GateType get_type() const { return type_; }

  protected:
    PrimitiveGate(GateType type, Inputs inputs);

    Signal compute(Evaluation& evaluation) const override;

  private:
    GateType type_;
};

/// Negates its single input
class Inverter : public PrimitiveGate {
  public:
    explicit Inverter(ElementPtr input);

    /// @throws ConstructionError unless inputs holds exactly one element
    explicit Inverter(Inputs inputs);
};

/// True iff every input is true. Accepts one or more inputs.
class And : public PrimitiveGate {
  public:
    explicit And(Inputs inputs);
};

/// True iff at least one input is true. Accepts one or more inputs.
class Or : public PrimitiveGate {
  public:
    explicit Or(Inputs inputs);
};

/// True iff exactly one input is true. Accepts one or more inputs.
class Xor : public PrimitiveGate {
  public:
    explicit Xor(Inputs inputs);
};

} // namespace wirelogic
