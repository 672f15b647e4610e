#pragma once
#include "optimizer.hpp"
#include "nlohmann/json.hpp"

// Answers one request event {id, type, ...payload}. Never throws for bad
// input: failures come back as {id, error, status}.
nlohmann::json process_request(FleetOptimizer& engine, const nlohmann::json& request);

nlohmann::json optimize_to_json(const OptimizeOutput& out);
