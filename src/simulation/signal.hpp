#pragma once

/// @file signal.hpp
/// @brief Tri-state signal values and the Source abstraction that produces them

#include <functional>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace latchwork {

class Device; // Forward declaration

/// Tri-state value carried on every connection in a device graph.
/// FLOATING means no driver asserted a value; it is distinct from LOW.
enum class Signal { LOW, HIGH, FLOATING };

/// Returns the human-readable name of a signal value
[[nodiscard]] constexpr std::string_view signal_name(Signal signal) {
    switch (signal) {
    case Signal::LOW:
        return "LOW";
    case Signal::HIGH:
        return "HIGH";
    case Signal::FLOATING:
        return "FLOATING";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_high(Signal signal) { return signal == Signal::HIGH; }
[[nodiscard]] constexpr bool is_low(Signal signal) { return signal == Signal::LOW; }

[[nodiscard]] constexpr Signal to_signal(bool value) { return value ? Signal::HIGH : Signal::LOW; }

/// std::nullopt is the floating (undriven) value
[[nodiscard]] constexpr Signal to_signal(std::optional<bool> value) {
    return value.has_value() ? to_signal(*value) : Signal::FLOATING;
}

[[nodiscard]] constexpr Signal to_signal(Signal value) { return value; }

/// Anything that can be resolved to a Signal: a constant, or a zero-argument
/// evaluator (a device output, a widget, a lambda).
///
/// Sources are cheap to copy and never own what they refer to. A
/// default-constructed Source is a FLOATING constant, i.e. an unconnected pin.
class Source {
  public:
    Source() = default;

    /// Constant source
    Source(Signal constant) : constant_(constant) {}

    /// Evaluator source. An empty function is treated as FLOATING.
    explicit Source(std::function<Signal()> evaluator) : evaluator_(std::move(evaluator)) {}

    /// Evaluates the source
    [[nodiscard]] Signal operator()() const;

    [[nodiscard]] bool is_constant() const { return !evaluator_; }

  private:
    Signal constant_ = Signal::FLOATING;
    std::function<Signal()> evaluator_;
};

// -----------------------------------------------------------------------
// Conversions from external shapes into Source. Device& lives in device.hpp.
// -----------------------------------------------------------------------

[[nodiscard]] inline Source to_source(Signal value) { return Source(value); }
[[nodiscard]] inline Source to_source(bool value) { return Source(to_signal(value)); }
[[nodiscard]] inline Source to_source(std::optional<bool> value) { return Source(to_signal(value)); }
[[nodiscard]] inline Source to_source(Source source) { return source; }

/// Wraps any zero-argument callable returning Signal, bool or
/// std::optional<bool>. The callable is copied into the source.
/// Devices are not copied; they go through to_source(Device&).
template <typename F, typename = std::enable_if_t<std::is_invocable_v<F&> &&
                                                  !std::is_base_of_v<Device, F>>>
[[nodiscard]] Source to_source(F callable) {
    using Result = std::invoke_result_t<F&>;
    static_assert(std::is_same_v<Result, Signal> || std::is_same_v<Result, bool> ||
                      std::is_same_v<Result, std::optional<bool>>,
                  "source callables must return Signal, bool or std::optional<bool>");
    return Source(std::function<Signal()>(
        [fn = std::move(callable)]() mutable { return to_signal(fn()); }));
}

} // namespace latchwork
