/// @file sr_latch.cpp
/// @brief SR latch wiring and evaluation

#include "simulation/sr_latch.hpp"

#include "simulation/input_resolver.hpp"

#include <utility>

namespace latchwork {

namespace {

GateType checked_family(GateType family) {
    if (family != GateType::NOR && family != GateType::NAND) {
        throw std::invalid_argument("SR latch gate family must be NOR or NAND, got " +
                                    std::string(gate_type_name(family)));
    }
    return family;
}

} // namespace

SrLatch::SrLatch(GateType family)
    : Device(1, {"R", "S"}), family_(checked_family(family)),
      ic1_(std::make_unique<Gate>(family)), ic2_(std::make_unique<Gate>(family)) {}

void SrLatch::set_input(const std::string& name, Source source) {
    Device::set_input(name, source);
    // The gates can only be wired once the latch's own inputs are known
    if (name == "R") {
        ic1_->set_inputs({std::move(source), to_source(*ic2_)});
    } else if (name == "S") {
        ic2_->set_inputs({std::move(source), to_source(*ic1_)});
    }
}

Signal SrLatch::q_bar() {
    if (!is_enabled()) {
        return Signal::FLOATING;
    }
    check_inputs();
    return ic2_->evaluate();
}

Source SrLatch::q_source() {
    return to_source(*this);
}

Source SrLatch::q_bar_source() {
    SrLatch* latch = this;
    return Source(std::function<Signal()>([latch] { return latch->q_bar(); }));
}

void SrLatch::reset() {
    Device::reset();
    ic1_->reset();
    ic2_->reset();
}

Signal SrLatch::compute() {
    check_inputs();
    return ic1_->evaluate();
}

void SrLatch::check_inputs() const {
    const Signal active = family_ == GateType::NOR ? Signal::HIGH : Signal::LOW;
    if (get_input("R") == active && get_input("S") == active) {
        throw ConflictError(std::string("Conflicting inputs: R and S both ") +
                            std::string(signal_name(active)) + " on " +
                            std::string(gate_type_name(family_)) + " latch");
    }
}

} // namespace latchwork
