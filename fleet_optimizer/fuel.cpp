#include "fuel.hpp"
#include <algorithm>

FuelFeasibility evaluate_fuel(
    const Vehicle& vehicle,
    double route_distance_km,
    double consumption_per_km,
    double refuel_deficit_l
) {
    FuelFeasibility f;
    f.vehicle_id = vehicle.id;
    f.route_distance = route_distance_km;
    f.estimated_fuel_consumption = route_distance_km * consumption_per_km;
    f.current_fuel_level = vehicle.fuel_level;
    f.max_fuel = vehicle.max_fuel;
    f.fuel_deficit = std::max(0.0, f.estimated_fuel_consumption - vehicle.fuel_level);
    f.fuel_percentage = vehicle.fuel_level / vehicle.max_fuel * 100.0;
    f.needs_refuel = f.fuel_deficit > refuel_deficit_l;
    return f;
}
