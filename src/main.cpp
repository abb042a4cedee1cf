/// @file main.cpp
/// @brief latchwork entry point: interactive logic bench
///
/// Wires toggle switches and push-buttons into an AND gate, a NOT gate, a
/// NAND SR latch and a JK flip-flop, and shows their outputs on indicator
/// lamps. Every lamp pulls its device once per frame, so feedback circuits
/// settle over successive frames. Supports both native desktop and
/// Emscripten/WASM builds.

#include "simulation/gate.hpp"
#include "simulation/jk_flip_flop.hpp"
#include "simulation/sr_latch.hpp"
#include "ui/widgets.hpp"

#include <raylib.h>

#ifdef __EMSCRIPTEN__
#include <emscripten/emscripten.h>
#endif

#include <vector>

namespace {

constexpr int INITIAL_WIDTH = 1024;
constexpr int INITIAL_HEIGHT = 600;
constexpr int MIN_WIDTH = 800;
constexpr int MIN_HEIGHT = 480;
constexpr int TARGET_FPS = 60;

constexpr float PANEL_WIDTH = 240.0f;
constexpr float PANEL_HEIGHT = 420.0f;
constexpr float PANEL_TOP = 70.0f;
constexpr float PANEL_LEFT = 16.0f;
constexpr float PANEL_GAP = 12.0f;
constexpr float ROW_HEIGHT = 70.0f;
constexpr float INPUT_COLUMN = 30.0f;
constexpr float OUTPUT_COLUMN = 160.0f;

const Color BG_COLOR = {25, 25, 30, 255};
const Color PANEL_BG = {35, 35, 42, 230};
const Color PANEL_BORDER = {70, 70, 85, 255};
const Color TITLE_COLOR = {240, 240, 240, 255};
const Color HINT_COLOR = {140, 140, 140, 255};
const Color WARN_COLOR = {255, 200, 80, 255};

/// Left edge of the i-th panel
float panel_x(int index) {
    return PANEL_LEFT + static_cast<float>(index) * (PANEL_WIDTH + PANEL_GAP);
}

/// Screen position of a widget inside a panel
Vector2 slot(int panel, float column, int row) {
    return {panel_x(panel) + column, PANEL_TOP + 50.0f + static_cast<float>(row) * ROW_HEIGHT};
}

/// All devices, widgets and lamps on the bench.
///
/// Widgets and devices are referenced by address from the sources wired
/// between them, so the bench is built in place and never moved.
struct Bench {
    // --- AND gate ---
    latchwork::ToggleSwitch and_a{slot(0, INPUT_COLUMN, 0), "A"};
    latchwork::ToggleSwitch and_b{slot(0, INPUT_COLUMN, 1), "B"};
    latchwork::Gate and_gate{latchwork::GateType::AND};

    // --- NOT gate on a floating push-button ---
    latchwork::PushButton not_button{slot(1, INPUT_COLUMN, 0), "IN"};
    latchwork::Gate not_gate{latchwork::GateType::NOT};

    // --- NAND SR latch behind inverters ---
    latchwork::PushButton sr_set{slot(2, INPUT_COLUMN, 0), "SET"};
    latchwork::PushButton sr_reset{slot(2, INPUT_COLUMN, 1), "RESET"};
    latchwork::Gate sr_set_inverter{latchwork::GateType::NOT};
    latchwork::Gate sr_reset_inverter{latchwork::GateType::NOT};
    latchwork::SrLatch sr_latch{latchwork::GateType::NAND};

    // --- JK flip-flop; the clock button rests LOW so the steering is wired ---
    latchwork::ToggleSwitch jk_j{slot(3, INPUT_COLUMN, 0), "J"};
    latchwork::ToggleSwitch jk_k{slot(3, INPUT_COLUMN, 1), "K"};
    latchwork::PushButton jk_clock{slot(3, INPUT_COLUMN, 2), "CLK", latchwork::Signal::LOW};
    latchwork::JkFlipFlop jk_flip_flop;

    std::vector<latchwork::Indicator> lamps;

    Bench() {
        and_gate.set_inputs({and_a.source(), and_b.source()});
        not_gate.set_input(not_button.source());

        // A NAND latch sets Q when R goes LOW
        sr_set_inverter.set_input(sr_set.source());
        sr_reset_inverter.set_input(sr_reset.source());
        sr_latch.set_input("R", latchwork::to_source(sr_set_inverter));
        sr_latch.set_input("S", latchwork::to_source(sr_reset_inverter));

        jk_flip_flop.set_input("J", jk_j.source());
        jk_flip_flop.set_input("K", jk_k.source());
        jk_flip_flop.set_input("CLK", jk_clock.source());

        lamps.emplace_back(slot(0, OUTPUT_COLUMN, 0), "A.B", latchwork::to_source(and_gate));
        lamps.emplace_back(slot(1, OUTPUT_COLUMN, 0), "/IN", latchwork::to_source(not_gate));
        lamps.emplace_back(slot(2, OUTPUT_COLUMN, 0), "Q", sr_latch.q_source());
        lamps.emplace_back(slot(2, OUTPUT_COLUMN, 1), "Q_", sr_latch.q_bar_source());
        lamps.emplace_back(slot(3, OUTPUT_COLUMN, 0), "Q", jk_flip_flop.q_source());
        lamps.emplace_back(slot(3, OUTPUT_COLUMN, 1), "Q_", jk_flip_flop.q_bar_source());
    }

    Bench(const Bench&) = delete;
    Bench& operator=(const Bench&) = delete;

    void update() {
        and_a.update();
        and_b.update();
        not_button.update();
        sr_set.update();
        sr_reset.update();
        jk_j.update();
        jk_k.update();
        jk_clock.update();
    }

    void draw() const {
        and_a.draw();
        and_b.draw();
        not_button.draw();
        sr_set.draw();
        sr_reset.draw();
        jk_j.draw();
        jk_k.draw();
        jk_clock.draw();
        for (const latchwork::Indicator& lamp : lamps) {
            lamp.draw();
        }
    }
};

void draw_panel(int index, const char* title) {
    Rectangle rect = {panel_x(index), PANEL_TOP, PANEL_WIDTH, PANEL_HEIGHT};
    DrawRectangleRec(rect, PANEL_BG);
    DrawRectangleLinesEx(rect, 1.0f, PANEL_BORDER);
    DrawText(title, static_cast<int>(rect.x + 10.0f), static_cast<int>(rect.y + 10.0f), 18,
             TITLE_COLOR);
}

/// One frame of the application: called each tick by the native loop or by
/// emscripten_set_main_loop_arg.
void frame_tick(Bench& bench) {
    // --- Read widgets, then pull every lamp once ---
    bench.update();
    for (latchwork::Indicator& lamp : bench.lamps) {
        lamp.sample();
    }

    int screen_h = GetScreenHeight();

    // --- Draw ---
    BeginDrawing();
    ClearBackground(BG_COLOR);

    DrawText("latchwork bench", 16, 20, 24, TITLE_COLOR);

    draw_panel(0, "AND");
    draw_panel(1, "NOT (open input)");
    draw_panel(2, "SR latch (NAND)");
    draw_panel(3, "JK flip-flop");
    bench.draw();

    if (!bench.jk_flip_flop.is_wired()) {
        DrawText("CLK not driven: steering unwired", static_cast<int>(panel_x(3) + 10.0f),
                 static_cast<int>(PANEL_TOP + PANEL_HEIGHT - 30.0f), 13, WARN_COLOR);
    }

    // --- HUD: most recent conflict, if any lamp is showing one ---
    for (const latchwork::Indicator& lamp : bench.lamps) {
        if (lamp.has_conflict()) {
            DrawText(lamp.last_error().c_str(), 16, screen_h - 50, 14, WARN_COLOR);
            break;
        }
    }
    DrawText("Click switches to toggle, hold buttons to drive HIGH", 16, screen_h - 28, 13,
             HINT_COLOR);

    EndDrawing();
}

#ifdef __EMSCRIPTEN__
/// Emscripten main loop callback: unwraps the void* to Bench.
void emscripten_frame(void* arg) {
    auto* bench = static_cast<Bench*>(arg);
    frame_tick(*bench);
}
#endif

} // namespace

int main() {
    // --- Initialize Raylib window ---
    SetConfigFlags(FLAG_WINDOW_RESIZABLE);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "latchwork - Logic Device Bench");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);

    Bench bench;

#ifdef __EMSCRIPTEN__
    // Emscripten takes ownership of the main loop: we pass state via void*.
    emscripten_set_main_loop_arg(emscripten_frame, &bench, 0, 1);
#else
    while (!WindowShouldClose()) {
        frame_tick(bench);
    }
#endif

    CloseWindow();
    return 0;
}
