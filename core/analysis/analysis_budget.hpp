#pragma once

#include <chrono>

namespace trustnet {

/// Bounds a structural traversal by wall-clock time and expansion count.
/// Path enumeration over a dense graph is exponential; the budget keeps
/// one analysis pass from starving the callers waiting on the graph lock.
class AnalysisBudget {
public:
    AnalysisBudget(double max_seconds, int max_expansions)
        : max_seconds_(max_seconds), max_expansions_(max_expansions) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
        exhausted_ = false;
    }

    void recordExpansion() { expansions_++; }

    bool canContinue() {
        if (exhausted_) return false;
        if (expansions_ >= max_expansions_ || elapsedSeconds() >= max_seconds_) {
            exhausted_ = true;
        }
        return !exhausted_;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int expansions() const { return expansions_; }
    bool exhausted() const { return exhausted_; }

private:
    double max_seconds_;
    int max_expansions_;
    int expansions_ = 0;
    bool exhausted_ = false;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace trustnet
