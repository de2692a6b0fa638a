#pragma once

#include <chrono>

namespace astar {

/// Tracks the computational budget of one search: wall-clock time and
/// expansion count. A limit of zero means unlimited.
class BudgetManager {
public:
    BudgetManager(double max_seconds, int max_expansions)
        : max_seconds_(max_seconds), max_expansions_(max_expansions) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_ = 0;
    }

    void recordExpansion() { expansions_++; }

    bool canContinue() const {
        return !isExpansionExhausted() && !isTimeExhausted();
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int expansions() const { return expansions_; }

    bool isTimeExhausted() const {
        return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_;
    }

    bool isExpansionExhausted() const {
        return max_expansions_ > 0 && expansions_ >= max_expansions_;
    }

private:
    double max_seconds_;
    int max_expansions_;
    int expansions_ = 0;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace astar
