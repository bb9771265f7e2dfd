/// @file errors.cpp
/// @brief Message formatting for construction and evaluation errors

#include "simulation/errors.hpp"

#include <utility>

namespace wirelogic {

namespace {

std::string format_message(const std::string& element, std::string_view fault, const std::string& detail) {
    std::string message = element;
    message += ": ";
    message += fault;
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return message;
}

std::string format_path(const std::vector<std::string>& path) {
    std::string text;
    for (const auto& step : path) {
        if (!text.empty()) {
            text += " -> ";
        }
        text += step;
    }
    return text;
}

} // namespace

ConstructionError::ConstructionError(std::string element, ConstructionFault fault, const std::string& detail)
    : std::invalid_argument(format_message(element, construction_fault_name(fault), detail)),
      element_(std::move(element)), fault_(fault) {}

EvaluationError::EvaluationError(std::string element, EvaluationFault fault, const std::string& detail,
                                 std::vector<std::string> path)
    : std::runtime_error(path.empty()
                             ? format_message(element, evaluation_fault_name(fault), detail)
                             : format_message(element, evaluation_fault_name(fault), detail) + " (via " +
                                   format_path(path) + ")"),
      element_(std::move(element)), fault_(fault), path_(std::move(path)) {}

} // namespace wirelogic
