#pragma once

/// @file errors.hpp
/// @brief Exceptions raised while wiring or evaluating elements

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wirelogic {

/// Why an element could not be constructed
enum class ConstructionFault { ARITY_MISMATCH, MISSING_INPUT, INVALID_OUTPUT, ALREADY_DRIVEN };

/// Why an evaluation could not complete
enum class EvaluationFault { CYCLE, DEPTH_EXCEEDED, UNCONNECTED };

[[nodiscard]] constexpr std::string_view construction_fault_name(ConstructionFault fault) {
    switch (fault) {
    case ConstructionFault::ARITY_MISMATCH:
        return "arity mismatch";
    case ConstructionFault::MISSING_INPUT:
        return "missing input";
    case ConstructionFault::INVALID_OUTPUT:
        return "invalid output";
    case ConstructionFault::ALREADY_DRIVEN:
        return "already driven";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view evaluation_fault_name(EvaluationFault fault) {
    switch (fault) {
    case EvaluationFault::CYCLE:
        return "cycle detected";
    case EvaluationFault::DEPTH_EXCEEDED:
        return "depth exceeded";
    case EvaluationFault::UNCONNECTED:
        return "unconnected input";
    }
    return "unknown";
}

/// Thrown by element constructors (and Wire::connect) when the wiring is invalid.
///
/// what() reads "<element>: <fault>: <detail>", e.g.
///   "INVERTER#4: arity mismatch: requires exactly 1 input, got 2"
class ConstructionError : public std::invalid_argument {
  public:
    ConstructionError(std::string element, ConstructionFault fault, const std::string& detail);

    [[nodiscard]] const std::string& element() const { return element_; }
    [[nodiscard]] ConstructionFault fault() const { return fault_; }

  private:
    std::string element_;
    ConstructionFault fault_;
};

/// Thrown from evaluate() when the input subtree cannot be resolved.
/// No partial result is produced.
class EvaluationError : public std::runtime_error {
  public:
    /// @param element Description of the element where evaluation failed
    /// @param path Descriptions of the active elements, outermost first
    EvaluationError(std::string element, EvaluationFault fault, const std::string& detail,
                    std::vector<std::string> path = {});

    [[nodiscard]] const std::string& element() const { return element_; }
    [[nodiscard]] EvaluationFault fault() const { return fault_; }
    [[nodiscard]] const std::vector<std::string>& path() const { return path_; }

  private:
    std::string element_;
    EvaluationFault fault_;
    std::vector<std::string> path_;
};

} // namespace wirelogic
