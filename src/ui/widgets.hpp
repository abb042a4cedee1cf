/// @file widgets.hpp
/// @brief Bench widgets: toggle switches and push-buttons that drive signals,
/// indicator lamps that pull them once per frame.
///
/// All widgets are drawn with Raylib primitives. A widget hands out sources
/// that refer to it by address, so widgets are non-copyable and must stay
/// in place for as long as anything is wired to them.

#pragma once

#include "simulation/signal.hpp"

#include <raylib.h>

#include <string>

namespace latchwork {

/// Latching on/off switch. Outputs HIGH when on, LOW when off.
class ToggleSwitch {
  public:
    ToggleSwitch(Vector2 position, std::string label, bool initially_on = false);

    ToggleSwitch(const ToggleSwitch&) = delete;
    ToggleSwitch& operator=(const ToggleSwitch&) = delete;

    /// Flips the switch when clicked. Call once per frame before drawing.
    void update();
    void draw() const;

    [[nodiscard]] Signal signal() const { return to_signal(on_); }
    [[nodiscard]] Source source() const;

  private:
    Rectangle bounds_;
    std::string label_;
    bool on_;
};

/// Momentary button. Outputs HIGH while held with the left mouse button,
/// otherwise its rest level (FLOATING unless configured).
class PushButton {
  public:
    PushButton(Vector2 position, std::string label, Signal rest = Signal::FLOATING);

    PushButton(const PushButton&) = delete;
    PushButton& operator=(const PushButton&) = delete;

    void update();
    void draw() const;

    [[nodiscard]] Signal signal() const { return held_ ? Signal::HIGH : rest_; }
    [[nodiscard]] Source source() const;

  private:
    Vector2 center_;
    std::string label_;
    Signal rest_;
    bool held_ = false;
};

/// Lamp that displays the value of a source.
///
/// sample() pulls the source exactly once; it is the per-tick evaluation
/// that lets feedback circuits settle over successive frames. A conflicting
/// evaluation is reported as "no valid output this tick" rather than
/// aborting the frame.
class Indicator {
  public:
    Indicator(Vector2 position, std::string label, Source source);

    void sample();
    void draw() const;

    [[nodiscard]] Signal value() const { return value_; }
    [[nodiscard]] bool has_conflict() const { return conflict_; }
    [[nodiscard]] const std::string& last_error() const { return last_error_; }

  private:
    Vector2 center_;
    std::string label_;
    Source source_;
    Signal value_ = Signal::FLOATING;
    bool conflict_ = false;
    std::string last_error_;
};

} // namespace latchwork
