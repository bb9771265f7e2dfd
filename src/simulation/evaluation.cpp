/// @file evaluation.cpp
/// @brief Active-stack bookkeeping, cycle detection and trace output

#include "simulation/evaluation.hpp"

#include "simulation/element.hpp"
#include "simulation/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace wirelogic {

Evaluation::Frame::~Frame() {
    evaluation_.leave();
}

Evaluation::Evaluation(EvaluationOptions options) : options_(options) {
    if (options_.max_depth == 0) {
        throw std::invalid_argument("Evaluation max_depth must be at least 1");
    }
}

Evaluation::Frame Evaluation::enter(const Element& element) {
    if (active_.count(&element) != 0) {
        std::vector<std::string> path = active_path();
        path.push_back(element.describe());
        throw EvaluationError(element.describe(), EvaluationFault::CYCLE,
                              "re-entered while still being evaluated", std::move(path));
    }
    if (stack_.size() >= options_.max_depth) {
        std::vector<std::string> path;
        const std::size_t total = stack_.size() + 1;
        for (std::size_t i = 0; i < stack_.size(); i++) {
            if (total > 2 * DEPTH_ERROR_PATH_EDGE && i >= DEPTH_ERROR_PATH_EDGE &&
                i < total - DEPTH_ERROR_PATH_EDGE) {
                if (i == DEPTH_ERROR_PATH_EDGE) {
                    path.emplace_back("...");
                }
                continue;
            }
            path.push_back(stack_[i]->describe());
        }
        path.push_back(element.describe());
        throw EvaluationError(element.describe(), EvaluationFault::DEPTH_EXCEEDED,
                              "more than " + std::to_string(options_.max_depth) + " nested elements",
                              std::move(path));
    }

    stack_.push_back(&element);
    active_.insert(&element);
    deepest_ = std::max(deepest_, stack_.size());
    return Frame(*this);
}

void Evaluation::leave() {
    active_.erase(stack_.back());
    stack_.pop_back();
}

void Evaluation::record(const Element& element, const std::vector<Signal>& outputs) {
    resolutions_++;
    if (options_.trace != nullptr) {
        write_trace(element.describe(), to_bits(outputs));
    }
}

void Evaluation::record(const Element& element, std::size_t output, Signal value) {
    resolutions_++;
    if (options_.trace == nullptr) {
        return;
    }
    std::string subject = element.describe();
    if (element.output_count() != 1) {
        subject += "[" + std::to_string(output) + "]";
    }
    write_trace(subject, value ? "1" : "0");
}

void Evaluation::write_trace(const std::string& subject, const std::string& bits) const {
    // Called while the element's own frame is still on the stack
    std::string indent(2 * (stack_.empty() ? 0 : stack_.size() - 1), ' ');
    std::fprintf(options_.trace, "[wirelogic] %s%s -> %s\n", indent.c_str(), subject.c_str(), bits.c_str());
}

std::vector<std::string> Evaluation::active_path() const {
    std::vector<std::string> path;
    path.reserve(stack_.size());
    for (const Element* element : stack_) {
        path.push_back(element->describe());
    }
    return path;
}

} // namespace wirelogic
