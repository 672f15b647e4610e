#pragma once
#include "fleet.hpp"
#include "config.hpp"
#include <vector>

// Greedy partition of `deliveries` over `vehicles`. Vehicles are visited
// most-fueled first; each takes up to cfg.max_candidates stops (pool order)
// lying within cfg.max_start_distance_km of its position.
AssignmentResult assign_routes(
    const std::vector<DeliveryStop>& deliveries,
    const std::vector<Vehicle>& vehicles,
    const EngineConfig& cfg = EngineConfig()
);

std::vector<int> vehicle_order(const std::vector<Vehicle>& vehicles);
