#include "ledger.hpp"
#include <algorithm>
#include <stdexcept>

using namespace std;

OptimizationLedger::OptimizationLedger(size_t capacity)
{
    if (capacity == 0) throw invalid_argument("ledger capacity must be positive");
    slots.resize(capacity);
}

void OptimizationLedger::record(const OptimizationRun& run)
{
    lock_guard<mutex> lock(mtx);
    slots[next] = run;
    next = (next + 1) % slots.size();
    if (stored < slots.size()) stored++;
    total++;
}

vector<OptimizationRun> OptimizationLedger::recent(size_t n) const
{
    lock_guard<mutex> lock(mtx);
    size_t k = min(n, stored);
    vector<OptimizationRun> out;
    out.reserve(k);
    // oldest of the requested window sits k slots behind `next`
    size_t start = (next + slots.size() - k) % slots.size();
    for (size_t i = 0; i < k; i++)
        out.push_back(slots[(start + i) % slots.size()]);
    return out;
}

size_t OptimizationLedger::count() const
{
    lock_guard<mutex> lock(mtx);
    return total;
}

size_t OptimizationLedger::retained() const
{
    lock_guard<mutex> lock(mtx);
    return stored;
}
