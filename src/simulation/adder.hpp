#pragma once

/// @file adder.hpp
/// @brief Adders composed from primitive gates

#include "simulation/element.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace wirelogic {

/// Result of a one-bit adder, in (sum, carry) order
struct AdderOutput {
    Signal sum = false;
    Signal carry = false;

    bool operator==(const AdderOutput& other) const { return sum == other.sum && carry == other.carry; }
    bool operator!=(const AdderOutput& other) const { return !(*this == other); }
};

/// A one-bit adder with outputs Sum (index 0) and Carry (index 1).
/// Each output is its own gate network; resolving one output walks only that network.
class Adder : public Element {
  public:
    static constexpr std::size_t SUM = 0;
    static constexpr std::size_t CARRY = 1;

    [[nodiscard]] std::size_t output_count() const final { return 2; }

    /// Evaluates both outputs in a fresh Evaluation
    [[nodiscard]] AdderOutput evaluate(const EvaluationOptions& options = {}) const;

  protected:
    using Element::Element;

    void release_links(Inputs& out) override;

    /// Set by the derived constructor
    ElementPtr sum_;
    ElementPtr carry_;

  private:
    std::vector<Signal> compute_outputs(Evaluation& evaluation) const final;
    Signal compute_output(Evaluation& evaluation, std::size_t output) const final;
};

/// Sum = XOR(i0, i1), Carry = AND(i0, i1)
class HalfAdder : public Adder {
  public:
    HalfAdder(ElementPtr i0, ElementPtr i1);
};

/// Two chained half adders:
///   h0 = HalfAdder(i0, i1), h1 = HalfAdder(carry_in, h0.sum)
///   Sum = h1.sum, Carry = OR(h0.carry, h1.carry)
class FullAdder : public Adder {
  public:
    FullAdder(ElementPtr carry_in, ElementPtr i0, ElementPtr i1);
};

/// N-bit ripple-carry adder.
/// Inputs:  A[0..N-1] (indices 0..N-1), B[0..N-1] (indices N..2N-1), index 0 = LSB
/// Outputs: Sum[0..N-1] (indices 0..N-1), Carry-out (index N)
///
/// Bit 0 is a half adder, every higher bit a full adder fed by the previous carry.
class RippleCarryAdder : public Element {
  public:
    /// @throws ConstructionError if a and b are empty or differ in width
    RippleCarryAdder(const Inputs& a, const Inputs& b);

    [[nodiscard]] std::size_t bits() const { return outputs_.size() - 1; }
    [[nodiscard]] std::size_t output_count() const override { return outputs_.size(); }

    /// Evaluates all outputs in a fresh Evaluation
    [[nodiscard]] std::vector<Signal> evaluate(const EvaluationOptions& options = {}) const {
        return evaluate_outputs(options);
    }

  protected:
    std::vector<Signal> compute_outputs(Evaluation& evaluation) const override;
    Signal compute_output(Evaluation& evaluation, std::size_t output) const override;
    void release_links(Inputs& out) override;

  private:
    std::vector<ElementPtr> outputs_;
};

} // namespace wirelogic
