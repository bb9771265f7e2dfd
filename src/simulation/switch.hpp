#pragma once

/// @file switch.hpp
/// @brief Toggle switch: the only element with mutable state

#include "simulation/element.hpp"

namespace wirelogic {

/// Passes its input through, inverted while flipped.
///
/// flip() only changes the flag; the new value is seen by the next
/// evaluation. Flipping while an evaluation of the same circuit is in
/// progress is not supported.
class Switch : public Gate {
  public:
    explicit Switch(ElementPtr input);

    /// Toggles the inversion flag
    void flip() { flipped_ = !flipped_; }

    [[nodiscard]] bool is_flipped() const { return flipped_; }

  protected:
    Signal compute(Evaluation& evaluation) const override;

  private:
    bool flipped_ = false;
};

} // namespace wirelogic
