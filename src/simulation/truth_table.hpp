#pragma once

/// @file truth_table.hpp
/// @brief Exhaustive enumeration of a circuit's input assignments

#include "simulation/element.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace wirelogic {

/// Largest input count tabulate() accepts
constexpr std::size_t MAX_TABULATED_INPUTS = 16;

struct TruthRow {
    std::vector<Signal> inputs;
    std::vector<Signal> outputs;
};

/// Builds the circuit under test from the driven input elements
using CircuitFactory = std::function<ElementPtr(const Inputs& inputs)>;

/// Drives input_count Switches over a shared Ground, builds the circuit once
/// from them, and evaluates it for every assignment.
///
/// Row k sets input j to bit j of k, so row 0 is all-false and inputs[0]
/// toggles fastest.
/// @throws std::invalid_argument if input_count exceeds MAX_TABULATED_INPUTS
///         or the factory returns null
[[nodiscard]] std::vector<TruthRow> tabulate(std::size_t input_count, const CircuitFactory& build);

/// Renders rows as an aligned text table with a header line, e.g.
///   A B | S C
///   0 0 | 0 0
/// Missing names are filled with in0.. / out0..
[[nodiscard]] std::string format_truth_table(const std::vector<TruthRow>& rows,
                                             const std::vector<std::string>& input_names = {},
                                             const std::vector<std::string>& output_names = {});

} // namespace wirelogic
