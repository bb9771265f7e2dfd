#pragma once

/// @file nand.hpp
/// @brief NAND built by negating an AND over the same inputs

#include "simulation/element.hpp"
#include "simulation/gate.hpp"

#include <memory>

namespace wirelogic {

/// Two-input NAND. Holds an internal And over its inputs and negates it;
/// there is no dedicated NAND reduction.
class Nand : public Gate {
  public:
    Nand(ElementPtr a, ElementPtr b);

    /// @throws ConstructionError unless inputs holds exactly two elements
    explicit Nand(Inputs inputs);

  protected:
    Signal compute(Evaluation& evaluation) const override;
    void release_links(Inputs& out) override;

  private:
    std::shared_ptr<const And> and_;
};

} // namespace wirelogic
