/// @file evaluation_guard.cpp
/// @brief EvaluationGuard implementation

#include "simulation/evaluation_guard.hpp"

namespace latchwork {

Signal EvaluationGuard::reenter() {
    reentry_count_++;
    if (policy_ == ReentryPolicy::RELEASE) {
        in_evaluation_ = false;
    }
    return last_value_;
}

void EvaluationGuard::reset() {
    in_evaluation_ = false;
    last_value_ = Signal::FLOATING;
    compute_count_ = 0;
    reentry_count_ = 0;
}

} // namespace latchwork
