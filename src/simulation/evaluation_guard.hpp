#pragma once

/// @file evaluation_guard.hpp
/// @brief Per-device reentrancy guard that breaks recursion through feedback loops

#include "simulation/signal.hpp"

#include <cstdint>

namespace latchwork {

/// What a re-entrant call does to the guard's in-evaluation mark
enum class ReentryPolicy {
    /// Keep the mark until the original call returns. Each device appears at
    /// most once on the call stack, so depth is bounded by the device count
    /// even when feedback loops overlap. The default.
    HOLD,
    /// Clear the mark on re-entry. A later pull in the same outer evaluation
    /// may compute the device again. Terminates on a single feedback loop
    /// only; overlapping loops can recurse without bound.
    RELEASE,
};

/// Turns unbounded recursive pulls around a cycle into a fixed-point walk.
///
/// The first call marks the guard and runs the wrapped computation. If the
/// cycle reaches back to the same device before that computation returns,
/// the inner call gets last_value() immediately instead of recursing.
/// The value seen at the point of re-entry may be stale (FLOATING on the
/// very first pass); repeated external calls let a loop settle.
class EvaluationGuard {
  public:
    explicit EvaluationGuard(ReentryPolicy policy = ReentryPolicy::HOLD) : policy_(policy) {}

    /// Runs compute() unless this is a re-entrant call.
    /// Exceptions from compute() propagate; the mark is cleared either way.
    template <typename Compute> [[nodiscard]] Signal run(Compute&& compute) {
        if (in_evaluation_) {
            return reenter();
        }
        Scope scope(in_evaluation_);
        compute_count_++;
        last_value_ = compute();
        return last_value_;
    }

    /// Restores the initial state (not in evaluation, last value FLOATING, counters zero)
    void reset();

    [[nodiscard]] bool in_evaluation() const { return in_evaluation_; }
    [[nodiscard]] Signal last_value() const { return last_value_; }
    [[nodiscard]] ReentryPolicy policy() const { return policy_; }
    void set_policy(ReentryPolicy policy) { policy_ = policy; }

    /// Number of times the wrapped computation actually ran
    [[nodiscard]] uint64_t compute_count() const { return compute_count_; }

    /// Number of re-entrant calls answered from last_value()
    [[nodiscard]] uint64_t reentry_count() const { return reentry_count_; }

  private:
    /// Clears the in-evaluation mark when the original call unwinds
    class Scope {
      public:
        explicit Scope(bool& flag) : flag_(flag) { flag_ = true; }
        ~Scope() { flag_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

      private:
        bool& flag_;
    };

    /// Answers a re-entrant call from last_value()
    Signal reenter();

    ReentryPolicy policy_;
    bool in_evaluation_ = false;
    Signal last_value_ = Signal::FLOATING;
    uint64_t compute_count_ = 0;
    uint64_t reentry_count_ = 0;
};

} // namespace latchwork
