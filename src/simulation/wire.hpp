#pragma once

/// @file wire.hpp
/// @brief Wire model: a connection whose driver is attached after construction

#include "simulation/element.hpp"

namespace wirelogic {

/// A single-output element that forwards the value of its driver.
///
/// Every other element receives its inputs at construction, which makes
/// feedback impossible. A Wire can be created first, used as an input, and
/// driven later, so it is the one place a loop can be formed. A loop is
/// reported as an EvaluationError when evaluated.
///
/// The wire owns a shared reference to its driver. A loop closed through a
/// wire owns itself: dropping every outside handle does not free it. Callers
/// that close a loop must call disconnect() on the wire before dropping the
/// circuit, or the loop's elements are never destroyed.
class Wire : public Gate {
  public:
    Wire();
    ~Wire() override;

    [[nodiscard]] const ElementPtr& get_driver() const { return driver_; }
    [[nodiscard]] bool is_connected() const { return driver_ != nullptr; }

    /// Attaches the element driving this wire. Connecting the current driver
    /// again is a no-op.
    /// @throws ConstructionError if driver is null (MISSING_INPUT), has more
    ///         than one output (INVALID_OUTPUT), or the wire already has a
    ///         different driver (ALREADY_DRIVEN)
    void connect(ElementPtr driver);

    /// Removes the driver; evaluating afterwards fails as unconnected.
    /// This is what releases a loop closed through this wire.
    void disconnect() { driver_.reset(); }

  protected:
    /// @throws EvaluationError if no driver is connected
    Signal compute(Evaluation& evaluation) const override;
    void release_links(Inputs& out) override;

  private:
    ElementPtr driver_;
};

} // namespace wirelogic
