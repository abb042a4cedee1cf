/// @file jk_flip_flop.cpp
/// @brief JK flip-flop wiring and evaluation

#include "simulation/jk_flip_flop.hpp"

#include "simulation/input_resolver.hpp"

#include <utility>

namespace latchwork {

JkFlipFlop::JkFlipFlop()
    : Device(1, {"J", "K", "CLK"}), ic1_(std::make_unique<Gate>(GateType::NAND)),
      ic2_(std::make_unique<Gate>(GateType::NAND)), icj_(std::make_unique<Gate>(GateType::NAND)),
      ick_(std::make_unique<Gate>(GateType::NAND)) {
    ic1_->set_inputs({to_source(*icj_), to_source(*ic2_)});
    ic2_->set_inputs({to_source(*ick_), to_source(*ic1_)});
}

void JkFlipFlop::set_input(const std::string& name, Source source) {
    Device::set_input(name, std::move(source));

    for (const char* pin : {"J", "K", "CLK"}) {
        if (get_input(pin) == Signal::FLOATING) {
            // Back to the unconnected placeholders until all three are driven again
            icj_->set_inputs({Source(), Source()});
            ick_->set_inputs({Source(), Source()});
            wired_ = false;
            return;
        }
    }
    icj_->set_inputs({to_source(*ic2_), named_input("J"), named_input("CLK")});
    ick_->set_inputs({to_source(*ic1_), named_input("K"), named_input("CLK")});
    wired_ = true;
}

Signal JkFlipFlop::q_bar() {
    if (!is_enabled()) {
        return Signal::FLOATING;
    }
    return ic2_->evaluate();
}

Source JkFlipFlop::q_source() {
    return to_source(*this);
}

Source JkFlipFlop::q_bar_source() {
    JkFlipFlop* flip_flop = this;
    return Source(std::function<Signal()>([flip_flop] { return flip_flop->q_bar(); }));
}

void JkFlipFlop::reset() {
    Device::reset();
    for (Gate* gate : {ic1_.get(), ic2_.get(), icj_.get(), ick_.get()}) {
        gate->reset();
    }
}

Signal JkFlipFlop::compute() {
    return ic1_->evaluate();
}

} // namespace latchwork
