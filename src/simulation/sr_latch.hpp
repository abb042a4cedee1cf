#pragma once

/// @file sr_latch.hpp
/// @brief SR latch built from two cross-coupled NOR or NAND gates

#include "simulation/device.hpp"
#include "simulation/gate.hpp"

#include <memory>

namespace latchwork {

/// SR latch with named inputs "R" and "S".
///
/// Internally IC1 and IC2 are cross-wired:
///   IC1 = gate(R, IC2)   -> Q
///   IC2 = gate(S, IC1)   -> Q_
///
/// The NOR form has active-high inputs: S=HIGH sets Q, R=HIGH resets it.
/// The NAND form has active-low inputs and, with the same wiring, R=LOW
/// drives Q HIGH and S=LOW drives Q_ HIGH; put inverters in front to get
/// the usual sense.
///
/// Both inputs at their active level is rejected with ConflictError before
/// either gate is evaluated.
class SrLatch : public Device {
  public:
    /// @param family GateType::NOR (default) or GateType::NAND
    /// @throws std::invalid_argument for any other gate type
    explicit SrLatch(GateType family = GateType::NOR);

    using Device::set_input;

    /// Binds "R" or "S" and rewires the corresponding gate
    void set_input(const std::string& name, Source source) override;

    /// Q output (IC1)
    [[nodiscard]] Signal q() { return evaluate(); }

    /// Complementary output (IC2). FLOATING when the latch is disabled.
    [[nodiscard]] Signal q_bar();

    /// Outputs as sources, for wiring into other devices or indicators
    [[nodiscard]] Source q_source();
    [[nodiscard]] Source q_bar_source();

    [[nodiscard]] GateType family() const { return family_; }
    [[nodiscard]] Gate& ic1() { return *ic1_; }
    [[nodiscard]] Gate& ic2() { return *ic2_; }

    void reset() override;

  protected:
    [[nodiscard]] Signal compute() override;

  private:
    /// @throws ConflictError when R and S are both at the active level
    void check_inputs() const;

    GateType family_;
    std::unique_ptr<Gate> ic1_;
    std::unique_ptr<Gate> ic2_;
};

} // namespace latchwork
