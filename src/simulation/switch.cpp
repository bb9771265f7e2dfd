/// @file switch.cpp
/// @brief Switch evaluation

#include "simulation/switch.hpp"

namespace wirelogic {

Switch::Switch(ElementPtr input) : Gate("SWITCH", {std::move(input)}) {}

Signal Switch::compute(Evaluation& evaluation) const {
    Signal base = input_value(evaluation, 0);
    return flipped_ ? !base : base;
}

} // namespace wirelogic
