/// @file gate.cpp
/// @brief Gate evaluation logic

#include "simulation/gate.hpp"

#include "simulation/input_resolver.hpp"

namespace latchwork {

Gate::Gate(GateType type) : Device(gate_min_inputs(type)), type_(type) {}

Signal Gate::compute() {
    const std::vector<Source>& in = inputs();

    switch (type_) {
    case GateType::NOT:
        switch (resolve(in[0])) {
        case Signal::HIGH:
            return Signal::LOW;
        case Signal::LOW:
        case Signal::FLOATING: // open input
            return Signal::HIGH;
        }
        break;

    case GateType::AND:
        for (const Source& source : in) {
            if (!is_high(resolve(source))) {
                return Signal::LOW;
            }
        }
        return Signal::HIGH;

    case GateType::NAND:
        for (const Source& source : in) {
            if (!is_high(resolve(source))) {
                return Signal::HIGH;
            }
        }
        return Signal::LOW;

    case GateType::NOR:
        for (const Source& source : in) {
            if (is_high(resolve(source))) {
                return Signal::LOW;
            }
        }
        return Signal::HIGH;

    case GateType::OR:
        for (const Source& source : in) {
            if (is_high(resolve(source))) {
                return Signal::HIGH;
            }
        }
        return Signal::LOW;

    case GateType::XOR: {
        bool result = false;
        for (const Source& source : in) {
            result ^= is_high(resolve(source));
        }
        return to_signal(result);
    }
    }
    throw std::invalid_argument("Unknown gate type");
}

} // namespace latchwork
