/// @file wire.cpp
/// @brief Wire class implementation

#include "simulation/wire.hpp"

namespace wirelogic {

Wire::Wire() : Gate("WIRE", {}) {}

Wire::~Wire() {
    Inputs pending;
    pending.push_back(std::move(driver_));
    release_all(std::move(pending));
}

void Wire::connect(ElementPtr driver) {
    if (driver == nullptr) {
        throw construction_error(ConstructionFault::MISSING_INPUT, "connect() requires a non-null driver");
    }
    if (driver->output_count() != 1) {
        throw construction_error(ConstructionFault::INVALID_OUTPUT,
                                 "driver " + driver->describe() + " has " +
                                     std::to_string(driver->output_count()) + " outputs");
    }
    if (driver_ != nullptr && driver_ != driver) {
        throw construction_error(ConstructionFault::ALREADY_DRIVEN,
                                 "already driven by " + driver_->describe() + ", disconnect() it first");
    }
    driver_ = std::move(driver);
}

Signal Wire::compute(Evaluation& evaluation) const {
    if (driver_ == nullptr) {
        throw EvaluationError(describe(), EvaluationFault::UNCONNECTED, "no driver connected",
                              evaluation.active_path());
    }
    return driver_->resolve(evaluation);
}

void Wire::release_links(Inputs& out) {
    Element::release_links(out);
    out.push_back(std::move(driver_));
}

} // namespace wirelogic
