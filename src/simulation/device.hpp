#pragma once

/// @file device.hpp
/// @brief Abstract boolean device: positional and named inputs, enable, guarded evaluation

#include "simulation/evaluation_guard.hpp"
#include "simulation/signal.hpp"

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace latchwork {

/// Raised when a device is given fewer inputs than its minimum arity
class ArityError : public std::invalid_argument {
  public:
    explicit ArityError(const std::string& what) : std::invalid_argument(what) {}
};

/// Base class for every simulated device.
///
/// A device holds an ordered list of positional input sources, an optional
/// set of named inputs, and an enable source. Calling a device pulls its
/// inputs on demand; nothing is propagated forward.
///
/// Devices are themselves sources (see to_source(Device&)), so they can be
/// wired into each other, including back into themselves through a cycle.
/// Input sources are non-owning: every device a source refers to must
/// outlive the devices wired to it.
class Device {
  public:
    virtual ~Device() = default;

    // Non-copyable: sources hold the device's address
    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;

    /// Replaces the positional inputs.
    /// @throws ArityError if fewer than min_inputs() sources are given
    void set_inputs(std::vector<Source> sources);

    /// Replaces the positional inputs with a single source
    /// @throws ArityError if the device needs more than one input
    void set_input(Source source);

    [[nodiscard]] const std::vector<Source>& inputs() const { return inputs_; }
    [[nodiscard]] size_t min_inputs() const { return min_inputs_; }

    /// The device outputs FLOATING unless the enable source resolves HIGH
    void set_enable(Source source) { enable_ = std::move(source); }
    [[nodiscard]] const Source& enable() const { return enable_; }
    [[nodiscard]] bool is_enabled() const;

    /// Returns FLOATING when disabled; otherwise the guarded compute() result.
    /// @throws ConflictError if any input has disagreeing drivers
    [[nodiscard]] Signal evaluate();
    Signal operator()() { return evaluate(); }

    /// Resolves the current value of a named input
    /// @throws std::out_of_range for an unknown name
    [[nodiscard]] Signal get_input(const std::string& name) const;

    /// The source bound to a named input
    /// @throws std::out_of_range for an unknown name
    [[nodiscard]] const Source& named_input(const std::string& name) const;

    /// Rebinds a named input. Composite devices override this to rewire
    /// their internal gates.
    /// @throws std::out_of_range for an unknown name
    virtual void set_input(const std::string& name, Source source);

    [[nodiscard]] std::vector<std::string> input_names() const;

    [[nodiscard]] const EvaluationGuard& guard() const { return guard_; }
    void set_reentry_policy(ReentryPolicy policy) { guard_.set_policy(policy); }

    /// Forgets the cached output value and evaluation counters
    virtual void reset() { guard_.reset(); }

  protected:
    /// @param min_inputs Minimum positional input count (at least 1)
    /// @param named_inputs Names of the semantically named pins, if any
    /// @throws ArityError if min_inputs is zero
    explicit Device(size_t min_inputs, const std::vector<std::string>& named_inputs = {});

    /// The device's boolean function of its inputs. Always called through
    /// the evaluation guard.
    [[nodiscard]] virtual Signal compute() = 0;

  private:
    size_t min_inputs_;
    std::vector<Source> inputs_;
    std::map<std::string, Source> named_inputs_;
    Source enable_ = Signal::HIGH;
    EvaluationGuard guard_;
};

/// Wraps a device as a source. The source refers to the device without
/// owning it.
[[nodiscard]] Source to_source(Device& device);

} // namespace latchwork
