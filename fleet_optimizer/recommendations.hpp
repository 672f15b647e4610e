#pragma once
#include "fleet.hpp"
#include "config.hpp"
#include <vector>

// `history` is the ledger tail, oldest first. The efficiency check only fires
// when more than cfg.efficiency_window runs are available.
std::vector<Recommendation> recommend(
    const std::vector<Vehicle>& vehicles,
    const std::vector<OptimizationRun>& history,
    const EngineConfig& cfg = EngineConfig()
);

std::string format_percent(double value, int decimals = 1);
