#pragma once
#include "fleet.hpp"

FuelFeasibility evaluate_fuel(
    const Vehicle& vehicle,
    double route_distance_km,
    double consumption_per_km = 0.08,
    double refuel_deficit_l = 5.0
);
