/// @file input_resolver.cpp
/// @brief Tri-state input resolution with conflict detection

#include "simulation/input_resolver.hpp"

#include <utility>

namespace latchwork {

Signal resolve(const Source& source) {
    return source();
}

Signal resolve(const std::vector<Source>& sources) {
    int highs = 0;
    int lows = 0;
    // Every driver is evaluated, even after the result is known
    for (const Source& source : sources) {
        switch (source()) {
        case Signal::HIGH:
            highs++;
            break;
        case Signal::LOW:
            lows++;
            break;
        case Signal::FLOATING:
            break;
        }
    }

    if (highs > 0 && lows > 0) {
        throw ConflictError("Conflicting inputs: " + std::to_string(highs) + " HIGH and " +
                            std::to_string(lows) + " LOW drivers");
    }
    if (highs > 0) {
        return Signal::HIGH;
    }
    if (lows > 0) {
        return Signal::LOW;
    }
    return Signal::FLOATING;
}

Source junction(std::vector<Source> drivers) {
    return Source(std::function<Signal()>(
        [drivers = std::move(drivers)] { return resolve(drivers); }));
}

} // namespace latchwork
