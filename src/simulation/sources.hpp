#pragma once

/// @file sources.hpp
/// @brief Constant source elements (logic high and logic low)

#include "simulation/element.hpp"

namespace wirelogic {

/// Always evaluates to true. Usually built once and shared by many gates.
class Vcc : public Gate {
  public:
    Vcc();

  protected:
    Signal compute(Evaluation& evaluation) const override;
};

/// Always evaluates to false
class Ground : public Gate {
  public:
    Ground();

  protected:
    Signal compute(Evaluation& evaluation) const override;
};

} // namespace wirelogic
