#pragma once
#include <optional>
#include <string>
#include <vector>

struct DeliveryStop {
    std::string id;
    std::string name;
    double latitude = 0.0;
    double longitude = 0.0;
    int priority = 3;                 // 1 (highest) .. 5
    std::string time_window_start = "09:00";
    std::string time_window_end = "17:00";
    int estimated_duration = 15;      // minutes on site
};

struct Vehicle {
    std::string id;
    std::string driver_name = "Unknown";
    double capacity = 1000.0;         // carried, never checked
    double current_lat = 0.0;
    double current_lon = 0.0;
    double fuel_level = 50.0;         // litres
    double max_fuel = 60.0;
};

struct RouteAssignment {
    std::string vehicle_id;
    std::vector<DeliveryStop> route;
    double total_distance = 0.0;      // km
    double estimated_time = 0.0;      // minutes
    int stops_count = 0;
    std::string optimization_method = "nearest_neighbor_with_priority";
};

struct AssignmentResult {
    std::vector<RouteAssignment> assignments;   // in vehicle processing order
    std::vector<DeliveryStop> unassigned;        // in submission order
    int total_deliveries_assigned = 0;
};

struct OptimizationRun {
    std::string id;
    std::string timestamp;
    int total_deliveries = 0;
    int total_vehicles = 0;
    int assignments_made = 0;
    double efficiency_score = 0.0;
};

struct FuelFeasibility {
    std::string vehicle_id;
    double route_distance = 0.0;
    double estimated_fuel_consumption = 0.0;
    double current_fuel_level = 0.0;
    double max_fuel = 0.0;
    double fuel_deficit = 0.0;
    double fuel_percentage = 0.0;
    bool needs_refuel = false;
};

struct Recommendation {
    std::string type;                 // fuel_alert | fuel_warning | efficiency_improvement
    std::optional<std::string> vehicle_id;
    std::optional<std::string> driver_name;
    std::optional<double> fuel_percentage;
    std::optional<double> average_efficiency;
    std::string priority;             // high | medium
    std::string message;
    std::string recommendation;
};
