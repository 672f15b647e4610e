#pragma once
#include "fleet.hpp"
#include <vector>

// Orders `stops` by priority-biased nearest neighbour starting at (start_lat, start_lon).
// The discount only ranks candidates; total_distance sums the raw legs.
RouteAssignment build_route(
    const std::vector<DeliveryStop>& stops,
    double start_lat,
    double start_lon,
    double average_speed_kmh = 40.0,
    double priority_discount = 0.1
);

double priority_factor(int priority, double priority_discount = 0.1);
