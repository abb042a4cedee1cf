/// @file test_jk_flip_flop.cpp
/// @brief Tests for the JK flip-flop: deferred wiring, gated set/reset/hold, bounded evaluation

#include <catch2/catch_test_macros.hpp>

#include "simulation/jk_flip_flop.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace latchwork;

namespace {

std::pair<Signal, Signal> tick(JkFlipFlop& flip_flop) {
    Signal q = flip_flop.q();
    Signal q_bar = flip_flop.q_bar();
    return {q, q_bar};
}

const std::pair<Signal, Signal> SET_STATE = {Signal::HIGH, Signal::LOW};
const std::pair<Signal, Signal> RESET_STATE = {Signal::LOW, Signal::HIGH};

} // namespace

TEST_CASE("Steering wiring waits for J, K and CLK", "[jk]") {
    JkFlipFlop flip_flop;
    CHECK_FALSE(flip_flop.is_wired());

    flip_flop.set_input("J", Signal::HIGH);
    CHECK_FALSE(flip_flop.is_wired());
    flip_flop.set_input("K", Signal::LOW);
    CHECK_FALSE(flip_flop.is_wired());

    // ICJ/ICK still hold their unconnected placeholders
    CHECK(flip_flop.icj().inputs().size() == 2);
    CHECK(flip_flop.icj().inputs()[0].is_constant());

    flip_flop.set_input("CLK", Signal::LOW);
    CHECK(flip_flop.is_wired());
    CHECK(flip_flop.icj().inputs().size() == 3);
    CHECK(flip_flop.ick().inputs().size() == 3);
}

TEST_CASE("A floating pin defers wiring without raising", "[jk]") {
    JkFlipFlop flip_flop;
    CHECK_NOTHROW(flip_flop.set_input("J", Signal::FLOATING));
    CHECK_NOTHROW(flip_flop.set_input("K", Signal::HIGH));
    CHECK_NOTHROW(flip_flop.set_input("CLK", Signal::HIGH));
    CHECK_FALSE(flip_flop.is_wired());

    flip_flop.set_input("J", Signal::LOW);
    CHECK(flip_flop.is_wired());
}

TEST_CASE("Floating a pin after wiring disconnects the steering gates", "[jk]") {
    JkFlipFlop flip_flop;
    bool j = true;
    bool clk = false;
    flip_flop.set_input("J", to_source([&j] { return j; }));
    flip_flop.set_input("K", Signal::LOW);
    flip_flop.set_input("CLK", to_source([&clk] { return clk; }));
    REQUIRE(flip_flop.is_wired());
    CHECK(tick(flip_flop) == RESET_STATE);

    flip_flop.set_input("J", Signal::FLOATING);
    CHECK_FALSE(flip_flop.is_wired());
    CHECK(flip_flop.icj().inputs().size() == 2);
    CHECK(flip_flop.ick().inputs().size() == 2);

    // The old J source still reads HIGH but is no longer bound to anything
    clk = true;
    for (int i = 0; i < 3; i++) {
        CHECK(tick(flip_flop) == RESET_STATE);
    }

    flip_flop.set_input("J", to_source([&j] { return j; }));
    CHECK(flip_flop.is_wired());
    CHECK(tick(flip_flop) == SET_STATE);
}

TEST_CASE("Unwired flip-flop holds its power-up state", "[jk]") {
    JkFlipFlop flip_flop;
    for (int i = 0; i < 3; i++) {
        CHECK(tick(flip_flop) == RESET_STATE);
    }
}

TEST_CASE("Gated set, reset and hold", "[jk]") {
    JkFlipFlop flip_flop;
    bool j = true;
    bool k = false;
    bool clk = false;
    flip_flop.set_input("J", to_source([&j] { return j; }));
    flip_flop.set_input("K", to_source([&k] { return k; }));
    flip_flop.set_input("CLK", to_source([&clk] { return clk; }));
    REQUIRE(flip_flop.is_wired());

    // Clock LOW: J has no effect
    for (int i = 0; i < 3; i++) {
        CHECK(tick(flip_flop) == RESET_STATE);
    }

    // Clock HIGH with J: set
    clk = true;
    for (int i = 0; i < 3; i++) {
        CHECK(tick(flip_flop) == SET_STATE);
    }

    // Clock LOW: hold
    clk = false;
    CHECK(tick(flip_flop) == SET_STATE);
    j = false;
    k = true;
    CHECK(tick(flip_flop) == SET_STATE);

    // Clock HIGH with K: reset
    clk = true;
    for (int i = 0; i < 3; i++) {
        CHECK(tick(flip_flop) == RESET_STATE);
    }

    clk = false;
    CHECK(tick(flip_flop) == RESET_STATE);
}

TEST_CASE("J and K both HIGH while clocked is the race condition", "[jk]") {
    JkFlipFlop flip_flop;
    bool clk = false;
    flip_flop.set_input("J", Signal::HIGH);
    flip_flop.set_input("K", Signal::LOW);
    flip_flop.set_input("CLK", to_source([&clk] { return clk; }));
    CHECK(tick(flip_flop) == RESET_STATE);

    // Rebinding K keeps the live clock source
    flip_flop.set_input("K", Signal::HIGH);
    clk = true;
    CHECK(tick(flip_flop) == std::make_pair(Signal::HIGH, Signal::HIGH));

    clk = false;
    auto [q, q_bar] = tick(flip_flop);
    CHECK(q != q_bar);
}

TEST_CASE("Overlapping loops are evaluated with bounded work", "[jk]") {
    JkFlipFlop flip_flop;
    flip_flop.set_input("J", Signal::HIGH);
    flip_flop.set_input("K", Signal::LOW);
    flip_flop.set_input("CLK", Signal::HIGH);
    (void)flip_flop.q();

    auto total = [&flip_flop] {
        return flip_flop.ic1().guard().compute_count() + flip_flop.ic2().guard().compute_count() +
               flip_flop.icj().guard().compute_count() + flip_flop.ick().guard().compute_count();
    };

    const auto before = total();
    CHECK(flip_flop.q() == Signal::HIGH);
    CHECK(total() - before == 6);

    CHECK(flip_flop.ic1().guard().policy() == ReentryPolicy::HOLD);
    CHECK(flip_flop.icj().guard().policy() == ReentryPolicy::HOLD);
}

TEST_CASE("Disabled flip-flop outputs FLOATING", "[jk]") {
    JkFlipFlop flip_flop;
    flip_flop.set_enable(Signal::LOW);
    CHECK(flip_flop.q() == Signal::FLOATING);
    CHECK(flip_flop.q_bar() == Signal::FLOATING);
}

TEST_CASE("Flip-flop outputs as sources", "[jk]") {
    JkFlipFlop flip_flop;
    flip_flop.set_input("J", Signal::HIGH);
    flip_flop.set_input("K", Signal::LOW);
    flip_flop.set_input("CLK", Signal::HIGH);

    Source q = flip_flop.q_source();
    Source q_bar = flip_flop.q_bar_source();
    CHECK(q() == Signal::HIGH);
    CHECK(q_bar() == Signal::LOW);
    CHECK(flip_flop.input_names() == std::vector<std::string>{"CLK", "J", "K"});
}
