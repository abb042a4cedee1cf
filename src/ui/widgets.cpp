/// @file widgets.cpp
/// @brief Raylib drawing and mouse handling for the bench widgets

#include "ui/widgets.hpp"

#include "simulation/input_resolver.hpp"

#include <cstdio>
#include <functional>
#include <utility>

namespace latchwork {

namespace {

// --- Layout constants ---
constexpr float SWITCH_WIDTH = 26.0f;
constexpr float SWITCH_HEIGHT = 44.0f;
constexpr float BUTTON_RADIUS = 18.0f;
constexpr float LAMP_RADIUS = 14.0f;
constexpr float LABEL_GAP = 8.0f;
constexpr int FONT_SIZE = 16;

// --- Colors ---
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color SWITCH_ON = {40, 160, 70, 255};
const Color SWITCH_OFF = {70, 70, 85, 255};
const Color SWITCH_KNOB = {200, 200, 215, 255};
const Color BUTTON_REST = {60, 90, 140, 180};
const Color BUTTON_HELD = {120, 170, 255, 230};
const Color LAMP_HIGH = {255, 70, 60, 255};
const Color LAMP_LOW = {70, 25, 25, 255};
const Color LAMP_FLOATING = {55, 55, 60, 255};
const Color LAMP_CONFLICT = {255, 200, 40, 255};

/// Draws a label to the right of a widget, vertically centered on y
void draw_label(const std::string& text, float x, float y) {
    DrawText(text.c_str(), static_cast<int>(x + LABEL_GAP),
             static_cast<int>(y - static_cast<float>(FONT_SIZE) / 2.0f), FONT_SIZE, LABEL_COLOR);
}

Color lamp_color(Signal value) {
    switch (value) {
    case Signal::HIGH:
        return LAMP_HIGH;
    case Signal::LOW:
        return LAMP_LOW;
    case Signal::FLOATING:
        return LAMP_FLOATING;
    }
    return LAMP_FLOATING;
}

} // namespace

// -----------------------------------------------------------------------
// ToggleSwitch
// -----------------------------------------------------------------------

ToggleSwitch::ToggleSwitch(Vector2 position, std::string label, bool initially_on)
    : bounds_{position.x, position.y, SWITCH_WIDTH, SWITCH_HEIGHT}, label_(std::move(label)),
      on_(initially_on) {}

void ToggleSwitch::update() {
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && CheckCollisionPointRec(GetMousePosition(), bounds_)) {
        on_ = !on_;
    }
}

void ToggleSwitch::draw() const {
    DrawRectangleRounded(bounds_, 0.5f, 6, on_ ? SWITCH_ON : SWITCH_OFF);
    DrawRectangleRoundedLines(bounds_, 0.5f, 6, 1.0f, BORDER_COLOR);

    // Knob sits in the upper half when on
    float knob_y = on_ ? bounds_.y + bounds_.height * 0.28f : bounds_.y + bounds_.height * 0.72f;
    DrawCircleV({bounds_.x + bounds_.width / 2.0f, knob_y}, bounds_.width * 0.38f, SWITCH_KNOB);

    draw_label(label_, bounds_.x + bounds_.width, bounds_.y + bounds_.height / 2.0f);
}

Source ToggleSwitch::source() const {
    const ToggleSwitch* self = this;
    return Source(std::function<Signal()>([self] { return self->signal(); }));
}

// -----------------------------------------------------------------------
// PushButton
// -----------------------------------------------------------------------

PushButton::PushButton(Vector2 position, std::string label, Signal rest)
    : center_(position), label_(std::move(label)), rest_(rest) {}

void PushButton::update() {
    held_ = IsMouseButtonDown(MOUSE_BUTTON_LEFT) &&
            CheckCollisionPointCircle(GetMousePosition(), center_, BUTTON_RADIUS);
}

void PushButton::draw() const {
    DrawCircleV(center_, BUTTON_RADIUS, held_ ? BUTTON_HELD : BUTTON_REST);
    DrawCircleLines(static_cast<int>(center_.x), static_cast<int>(center_.y), BUTTON_RADIUS,
                    BORDER_COLOR);
    draw_label(label_, center_.x + BUTTON_RADIUS, center_.y);
}

Source PushButton::source() const {
    const PushButton* self = this;
    return Source(std::function<Signal()>([self] { return self->signal(); }));
}

// -----------------------------------------------------------------------
// Indicator
// -----------------------------------------------------------------------

Indicator::Indicator(Vector2 position, std::string label, Source source)
    : center_(position), label_(std::move(label)), source_(std::move(source)) {}

void Indicator::sample() {
    try {
        value_ = resolve(source_);
    } catch (const ConflictError& e) {
        if (!conflict_ || last_error_ != e.what()) {
            std::fprintf(stderr, "[latchwork] %s: %s\n", label_.c_str(), e.what());
        }
        conflict_ = true;
        last_error_ = e.what();
        value_ = Signal::FLOATING;
        return;
    }
    if (conflict_) {
        std::fprintf(stderr, "[latchwork] %s: conflict cleared\n", label_.c_str());
        conflict_ = false;
    }
}

void Indicator::draw() const {
    Color fill = conflict_ ? LAMP_CONFLICT : lamp_color(value_);
    DrawCircleV(center_, LAMP_RADIUS, fill);
    DrawCircleLines(static_cast<int>(center_.x), static_cast<int>(center_.y), LAMP_RADIUS,
                    BORDER_COLOR);
    draw_label(label_, center_.x + LAMP_RADIUS, center_.y);
}

} // namespace latchwork
