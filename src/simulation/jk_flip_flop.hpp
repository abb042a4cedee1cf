#pragma once

/// @file jk_flip_flop.hpp
/// @brief Gated JK flip-flop built from four NAND gates

#include "simulation/device.hpp"
#include "simulation/gate.hpp"

#include <memory>

namespace latchwork {

/// JK flip-flop with named inputs "J", "K" and "CLK".
///
///   ICJ = NAND(Q_, J, CLK)      ICK = NAND(Q, K, CLK)
///   IC1 = NAND(ICJ, IC2) -> Q   IC2 = NAND(ICK, IC1) -> Q_
///
/// The steering gates ICJ/ICK are only connected while J, K and CLK all
/// resolve to a driven value. Binding any of them to a floating source puts
/// ICJ/ICK back on unconnected placeholder inputs and the latch pair holds.
///
/// The topology is level-sensitive: CLK LOW holds, CLK HIGH with J=1,K=0
/// sets and with J=0,K=1 resets. J=K=1 while CLK is HIGH is the classic
/// race; pulled on demand it reads Q = Q_ = HIGH until CLK drops.
///
/// The four gates form several overlapping feedback loops. They rely on the
/// default ReentryPolicy::HOLD to keep evaluation depth bounded.
class JkFlipFlop : public Device {
  public:
    JkFlipFlop();

    using Device::set_input;

    /// Binds "J", "K" or "CLK". Completes the steering wiring once all three
    /// are driven; otherwise disconnects it without error.
    void set_input(const std::string& name, Source source) override;

    /// Whether the steering gates are connected to J, K and CLK
    [[nodiscard]] bool is_wired() const { return wired_; }

    /// Q output (IC1)
    [[nodiscard]] Signal q() { return evaluate(); }

    /// Complementary output (IC2). FLOATING when disabled.
    [[nodiscard]] Signal q_bar();

    [[nodiscard]] Source q_source();
    [[nodiscard]] Source q_bar_source();

    [[nodiscard]] Gate& ic1() { return *ic1_; }
    [[nodiscard]] Gate& ic2() { return *ic2_; }
    [[nodiscard]] Gate& icj() { return *icj_; }
    [[nodiscard]] Gate& ick() { return *ick_; }

    void reset() override;

  protected:
    [[nodiscard]] Signal compute() override;

  private:
    std::unique_ptr<Gate> ic1_;
    std::unique_ptr<Gate> ic2_;
    std::unique_ptr<Gate> icj_;
    std::unique_ptr<Gate> ick_;
    bool wired_ = false;
};

} // namespace latchwork
