/// @file nand.cpp
/// @brief Nand implementation

#include "simulation/nand.hpp"

namespace wirelogic {

Nand::Nand(ElementPtr a, ElementPtr b) : Nand(Inputs{std::move(a), std::move(b)}) {}

Nand::Nand(Inputs inputs) : Gate("NAND", std::move(inputs)) {
    require_inputs(2);
    and_ = std::make_shared<And>(get_inputs());
}

Signal Nand::compute(Evaluation& evaluation) const {
    return !and_->resolve(evaluation);
}

void Nand::release_links(Inputs& out) {
    Element::release_links(out);
    out.push_back(std::move(and_));
}

} // namespace wirelogic
