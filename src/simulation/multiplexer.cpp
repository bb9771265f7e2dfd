/// @file multiplexer.cpp
/// @brief Multiplexer wiring

#include "simulation/multiplexer.hpp"

#include "simulation/gate.hpp"

#include <memory>

namespace wirelogic {

Multiplexer2::Multiplexer2(ElementPtr select, ElementPtr i0, ElementPtr i1)
    : Gate("MUX2", {std::move(select), std::move(i0), std::move(i1)}) {
    const Inputs& in = get_inputs();
    const ElementPtr& sel = in[0];

    auto pick_i1 = std::make_shared<And>(Inputs{sel, in[2]});
    auto not_sel = std::make_shared<Inverter>(sel);
    auto pick_i0 = std::make_shared<And>(Inputs{not_sel, in[1]});
    network_ = std::make_shared<Or>(Inputs{pick_i1, pick_i0});
}

Signal Multiplexer2::compute(Evaluation& evaluation) const {
    return network_->resolve(evaluation);
}

void Multiplexer2::release_links(Inputs& out) {
    Element::release_links(out);
    out.push_back(std::move(network_));
}

Multiplexer4::Multiplexer4(ElementPtr s0, ElementPtr s1, ElementPtr i0, ElementPtr i1, ElementPtr i2,
                           ElementPtr i3)
    : Gate("MUX4", {std::move(s0), std::move(s1), std::move(i0), std::move(i1), std::move(i2), std::move(i3)}) {
    const Inputs& in = get_inputs();

    auto low = std::make_shared<Multiplexer2>(in[0], in[2], in[3]);
    auto high = std::make_shared<Multiplexer2>(in[0], in[4], in[5]);
    network_ = std::make_shared<Multiplexer2>(in[1], low, high);
}

Signal Multiplexer4::compute(Evaluation& evaluation) const {
    return network_->resolve(evaluation);
}

void Multiplexer4::release_links(Inputs& out) {
    Element::release_links(out);
    out.push_back(std::move(network_));
}

} // namespace wirelogic
