#pragma once
#include "fleet.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

// Keeps the most recent `capacity` runs. Safe to share between threads.
class OptimizationLedger {
public:
    explicit OptimizationLedger(std::size_t capacity = 100);

    void record(const OptimizationRun& run);

    // Last n runs, oldest first.
    std::vector<OptimizationRun> recent(std::size_t n) const;

    // Total ever recorded, including runs already evicted.
    std::size_t count() const;
    std::size_t retained() const;
    std::size_t capacity() const { return slots.size(); }

private:
    mutable std::mutex mtx;
    std::vector<OptimizationRun> slots;
    std::size_t next = 0;
    std::size_t stored = 0;
    std::size_t total = 0;
};
