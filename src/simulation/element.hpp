#pragma once

/// @file element.hpp
/// @brief Element model: the evaluable unit every circuit is wired from

#include "simulation/errors.hpp"
#include "simulation/evaluation.hpp"
#include "simulation/signal.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wirelogic {

class Element;

/// Shared, read-only reference to an input. The same element may feed any
/// number of other elements and stays alive as long as one of them does.
using ElementPtr = std::shared_ptr<const Element>;

/// Ordered input list passed to n-ary constructors
using Inputs = std::vector<ElementPtr>;

/// Base of every logic element.
///
/// An element has a kind (AND, SWITCH, ...), a process-unique id, an ordered
/// list of inputs fixed at construction, and one or more outputs. Outputs are
/// never stored: each resolution walks the whole input subtree again.
class Element {
  public:
    /// Releases sole-owned inputs iteratively, so dropping a very long chain
    /// does not recurse once per link
    virtual ~Element();

    // Identity matters for cycle detection; elements are shared, never copied
    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    [[nodiscard]] uint32_t get_id() const { return id_; }
    [[nodiscard]] std::string_view get_kind() const { return kind_; }
    [[nodiscard]] const std::string& get_label() const { return label_; }
    [[nodiscard]] const Inputs& get_inputs() const { return inputs_; }

    /// Attaches a human-readable name used in error messages and traces
    void set_label(std::string label) { label_ = std::move(label); }

    /// "KIND#id", or "KIND#id 'label'" once a label is set
    [[nodiscard]] std::string describe() const;

    /// Number of signals this element produces
    [[nodiscard]] virtual std::size_t output_count() const = 0;

    /// Evaluates all outputs in a fresh Evaluation.
    /// @throws EvaluationError on a cycle, an unconnected wire, or excessive depth
    [[nodiscard]] std::vector<Signal> evaluate_outputs(const EvaluationOptions& options = {}) const;

    /// Evaluates all outputs inside a caller-owned Evaluation
    [[nodiscard]] std::vector<Signal> resolve_outputs(Evaluation& evaluation) const;

    /// Evaluates a single output inside a caller-owned Evaluation. Only the
    /// part of the circuit feeding that output is walked.
    /// @throws std::out_of_range if output >= output_count()
    [[nodiscard]] Signal resolve(Evaluation& evaluation, std::size_t output = 0) const;

  protected:
    /// Validates that no input is null and, unless multi_output_inputs is set,
    /// that every input produces exactly one signal.
    /// @throws ConstructionError
    Element(std::string_view kind, Inputs inputs, bool multi_output_inputs = false);

    /// @throws ConstructionError unless the element has exactly `count` inputs
    void require_inputs(std::size_t count) const;

    /// @throws ConstructionError unless the element has at least `minimum` inputs
    void require_at_least(std::size_t minimum) const;

    [[nodiscard]] ConstructionError construction_error(ConstructionFault fault, const std::string& detail) const;

    /// Resolves the single output of the index-th input
    [[nodiscard]] Signal input_value(Evaluation& evaluation, std::size_t index) const {
        return inputs_[index]->resolve(evaluation);
    }

    virtual std::vector<Signal> compute_outputs(Evaluation& evaluation) const = 0;

    /// Computes one output; the default computes all of them and picks one
    virtual Signal compute_output(Evaluation& evaluation, std::size_t output) const;

    /// Moves every element reference this element owns into `out`.
    /// Called only on an element about to be destroyed; subclasses holding
    /// internal networks or late-bound drivers append those too.
    virtual void release_links(Inputs& out);

    /// Drops references one at a time, unwrapping any element whose last
    /// reference is being dropped
    static void release_all(Inputs pending);

  private:
    uint32_t id_;
    std::string kind_;
    std::string label_;
    Inputs inputs_;
};

/// An element with exactly one output. Everything that can be wired into
/// another element's input is a Gate (or a Tap on a multi-output element).
class Gate : public Element {
  public:
    [[nodiscard]] std::size_t output_count() const final { return 1; }

    /// Evaluates the output in a fresh Evaluation
    [[nodiscard]] Signal evaluate(const EvaluationOptions& options = {}) const;

  protected:
    using Element::Element;

    virtual Signal compute(Evaluation& evaluation) const = 0;

  private:
    std::vector<Signal> compute_outputs(Evaluation& evaluation) const final { return {compute(evaluation)}; }
    Signal compute_output(Evaluation& evaluation, std::size_t /*output*/) const final { return compute(evaluation); }
};

/// Forwards one output of a multi-output element as a single signal.
/// This is how an adder's sum or carry feeds the input of another element.
class Tap : public Gate {
  public:
    /// @throws ConstructionError if output is not a valid index of source
    Tap(ElementPtr source, std::size_t output);

    [[nodiscard]] std::size_t get_output_index() const { return output_; }

  protected:
    Signal compute(Evaluation& evaluation) const override;

  private:
    std::size_t output_;
};

} // namespace wirelogic
