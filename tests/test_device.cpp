/// @file test_device.cpp
/// @brief Tests for the Device base: arity, named inputs, enable, guarded evaluation

#include <catch2/catch_test_macros.hpp>

#include "simulation/device.hpp"
#include "simulation/input_resolver.hpp"

#include <string>
#include <type_traits>
#include <vector>

using namespace latchwork;

namespace {

/// Minimal device with two named pins: outputs in1 AND in2, counting computes
class PairDevice : public Device {
  public:
    PairDevice() : Device(1, {"in1", "in2"}) {}

    int computes = 0;

  protected:
    Signal compute() override {
        computes++;
        return to_signal(is_high(get_input("in1")) && is_high(get_input("in2")));
    }
};

/// Device that echoes its first positional input
class EchoDevice : public Device {
  public:
    explicit EchoDevice(size_t min_inputs) : Device(min_inputs) {}

  protected:
    Signal compute() override { return resolve(inputs()[0]); }
};

} // namespace

static_assert(std::is_abstract_v<Device>, "Device must not be instantiable");

// ---------- Arity ----------

TEST_CASE("Inputs start as floating pins at minimum arity", "[device]") {
    EchoDevice device(3);
    REQUIRE(device.inputs().size() == 3);
    for (const Source& pin : device.inputs()) {
        CHECK(pin() == Signal::FLOATING);
    }
    CHECK(device.min_inputs() == 3);
}

TEST_CASE("Zero minimum arity is rejected at construction", "[device]") {
    CHECK_THROWS_AS(EchoDevice(0), ArityError);
}

TEST_CASE("Wiring fewer inputs than the minimum is rejected", "[device]") {
    EchoDevice device(2);
    CHECK_THROWS_AS(device.set_input(Signal::HIGH), ArityError);
    CHECK_THROWS_AS(device.set_inputs({Signal::HIGH}), ArityError);
    CHECK_THROWS_AS(device.set_inputs({Signal::HIGH}), std::invalid_argument);

    // The previous wiring is untouched
    CHECK(device.inputs().size() == 2);
}

TEST_CASE("More inputs than the minimum are accepted", "[device]") {
    EchoDevice device(1);
    device.set_inputs({Signal::LOW, Signal::HIGH, Signal::HIGH});
    CHECK(device.inputs().size() == 3);
    CHECK(device() == Signal::LOW);
}

TEST_CASE("A single source is normalised to a one-element sequence", "[device]") {
    EchoDevice device(1);
    device.set_input(Signal::HIGH);
    REQUIRE(device.inputs().size() == 1);
    CHECK(device() == Signal::HIGH);
}

// ---------- Named inputs ----------

TEST_CASE("Named inputs start floating", "[device]") {
    PairDevice device;
    CHECK(device.get_input("in1") == Signal::FLOATING);
    CHECK(device.get_input("in2") == Signal::FLOATING);
    CHECK(device.input_names() == std::vector<std::string>{"in1", "in2"});
}

TEST_CASE("set_input rebinds a named input", "[device]") {
    PairDevice device;
    bool level = false;
    device.set_input("in1", to_source([&level] { return level; }));
    device.set_input("in2", Signal::HIGH);

    CHECK(device.get_input("in1") == Signal::LOW);
    CHECK(device() == Signal::LOW);

    level = true;
    CHECK(device.get_input("in1") == Signal::HIGH);
    CHECK(device() == Signal::HIGH);
}

TEST_CASE("Unknown input names are rejected", "[device]") {
    PairDevice device;
    CHECK_THROWS_AS(device.get_input("in3"), std::out_of_range);
    CHECK_THROWS_AS(device.named_input("clk"), std::out_of_range);
    CHECK_THROWS_AS(device.set_input("in3", Signal::HIGH), std::out_of_range);
}

// ---------- Enable ----------

TEST_CASE("Enable gates the output", "[device]") {
    EchoDevice device(1);
    device.set_input(Signal::HIGH);
    CHECK(device.is_enabled());

    SECTION("LOW enable forces FLOATING") {
        device.set_enable(Signal::LOW);
        CHECK_FALSE(device.is_enabled());
        CHECK(device() == Signal::FLOATING);
    }

    SECTION("FLOATING enable forces FLOATING") {
        device.set_enable(Signal::FLOATING);
        CHECK(device() == Signal::FLOATING);
    }

    SECTION("Enable can be driven by another source") {
        bool enabled = false;
        device.set_enable(to_source([&enabled] { return enabled; }));
        CHECK(device() == Signal::FLOATING);
        enabled = true;
        CHECK(device() == Signal::HIGH);
    }
}

TEST_CASE("A disabled device does not compute", "[device]") {
    PairDevice device;
    device.set_enable(Signal::LOW);
    (void)device.evaluate();
    CHECK(device.computes == 0);
    CHECK(device.guard().compute_count() == 0);
}

// ---------- Guarded evaluation ----------

TEST_CASE("Evaluation goes through the guard", "[device]") {
    PairDevice device;
    device.set_input("in1", Signal::HIGH);
    device.set_input("in2", Signal::HIGH);

    CHECK(device() == Signal::HIGH);
    CHECK(device.guard().compute_count() == 1);
    CHECK(device.guard().last_value() == Signal::HIGH);

    device.reset();
    CHECK(device.guard().compute_count() == 0);
    CHECK(device.guard().last_value() == Signal::FLOATING);
}

TEST_CASE("A device wired to itself returns its cached value on re-entry", "[device]") {
    EchoDevice device(1);
    device.set_input(to_source(device));

    // Nothing ever drives the loop, so it stays FLOATING and terminates
    CHECK(device() == Signal::FLOATING);
    CHECK(device.guard().compute_count() == 1);
    CHECK(device.guard().reentry_count() == 1);
    CHECK_FALSE(device.guard().in_evaluation());
}

TEST_CASE("Conflicting inputs fail the evaluation and propagate", "[device]") {
    EchoDevice device(1);
    device.set_input(junction({Signal::HIGH, Signal::LOW}));
    CHECK_THROWS_AS(device(), ConflictError);
    CHECK_FALSE(device.guard().in_evaluation());
}
