#pragma once

/// @file multiplexer.hpp
/// @brief Multiplexers composed from primitive gates

#include "simulation/element.hpp"

namespace wirelogic {

/// Two-input multiplexer: i1 when select is true, otherwise i0.
/// Wired as OR(AND(select, i1), AND(NOT(select), i0)).
class Multiplexer2 : public Gate {
  public:
    Multiplexer2(ElementPtr select, ElementPtr i0, ElementPtr i1);

  protected:
    Signal compute(Evaluation& evaluation) const override;
    void release_links(Inputs& out) override;

  private:
    ElementPtr network_;
};

/// Four-input multiplexer selecting i[s1 * 2 + s0].
/// Wired as Multiplexer2(s1, Multiplexer2(s0, i0, i1), Multiplexer2(s0, i2, i3)).
class Multiplexer4 : public Gate {
  public:
    Multiplexer4(ElementPtr s0, ElementPtr s1, ElementPtr i0, ElementPtr i1, ElementPtr i2, ElementPtr i3);

  protected:
    Signal compute(Evaluation& evaluation) const override;
    void release_links(Inputs& out) override;

  private:
    ElementPtr network_;
};

} // namespace wirelogic
