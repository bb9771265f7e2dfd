/// @file sources.cpp
/// @brief Vcc and Ground

#include "simulation/sources.hpp"

namespace wirelogic {

Vcc::Vcc() : Gate("VCC", {}) {}

Signal Vcc::compute(Evaluation& /*evaluation*/) const {
    return true;
}

Ground::Ground() : Gate("GND", {}) {}

Signal Ground::compute(Evaluation& /*evaluation*/) const {
    return false;
}

} // namespace wirelogic
