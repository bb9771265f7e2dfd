#pragma once

/// @file signal.hpp
/// @brief The boolean value carried between elements

#include <string>
#include <vector>

namespace wirelogic {

/// A single logic level. There is no unknown or high-impedance state.
using Signal = bool;

/// Renders signals as a string of '0'/'1', first signal first
[[nodiscard]] inline std::string to_bits(const std::vector<Signal>& signals) {
    std::string bits;
    bits.reserve(signals.size());
    for (Signal s : signals) {
        bits.push_back(s ? '1' : '0');
    }
    return bits;
}

} // namespace wirelogic
