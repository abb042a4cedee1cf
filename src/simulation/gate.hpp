#pragma once

/// @file gate.hpp
/// @brief Stateless logic gate devices: NOT, AND, NAND, NOR, OR, XOR

#include "simulation/device.hpp"

#include <cstddef>
#include <string_view>

namespace latchwork {

/// Types of logic gates supported by the simulator
enum class GateType { NOT, AND, NAND, NOR, OR, XOR };

/// Returns the human-readable name of a gate type
[[nodiscard]] constexpr std::string_view gate_type_name(GateType type) {
    switch (type) {
    case GateType::NOT:
        return "NOT";
    case GateType::AND:
        return "AND";
    case GateType::NAND:
        return "NAND";
    case GateType::NOR:
        return "NOR";
    case GateType::OR:
        return "OR";
    case GateType::XOR:
        return "XOR";
    }
    return "UNKNOWN";
}

/// Minimum number of positional inputs: 1 for NOT, 2 for the multi-input gates
[[nodiscard]] constexpr size_t gate_min_inputs(GateType type) {
    return type == GateType::NOT ? 1 : 2;
}

/// A stateless gate: a pure function of its resolved inputs.
///
/// Inputs are resolved lazily, in order, stopping as soon as the result is
/// known. Inside a feedback loop this decides which upstream devices are
/// pulled at all. Multi-input gates treat FLOATING as "not HIGH"; NOT treats
/// a FLOATING input as pulled up and outputs HIGH.
///
/// Gates are still guarded: a gate with no state of its own can sit in a
/// feedback loop.
class Gate : public Device {
  public:
    explicit Gate(GateType type);

    [[nodiscard]] GateType get_type() const { return type_; }

  protected:
    [[nodiscard]] Signal compute() override;

  private:
    GateType type_;
};

} // namespace latchwork
