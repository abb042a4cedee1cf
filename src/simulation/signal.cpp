/// @file signal.cpp
/// @brief Source evaluation

#include "simulation/signal.hpp"

namespace latchwork {

Signal Source::operator()() const {
    if (!evaluator_) {
        return constant_;
    }
    return evaluator_();
}

} // namespace latchwork
