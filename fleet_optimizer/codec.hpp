#pragma once
#include "fleet.hpp"
#include "nlohmann/json.hpp"
#include <string>
#include <vector>

// Numeric fields accept JSON numbers or strings holding a complete number.
// Anything else present raises ValidationError; absent fields take `def`.
double number_field(const nlohmann::json& obj, const std::string& key, double def);
double required_number(const nlohmann::json& obj, const std::string& key);
int integer_field(const nlohmann::json& obj, const std::string& key, int def);
std::string string_field(const nlohmann::json& obj, const std::string& key, const std::string& def);

DeliveryStop parse_delivery(const nlohmann::json& j);
Vehicle parse_vehicle(const nlohmann::json& j);

std::vector<DeliveryStop> parse_deliveries(const nlohmann::json& payload);
std::vector<Vehicle> parse_vehicles(const nlohmann::json& payload);

// Vehicle fields of a fuel-efficiency request (flat payload, "vehicle_id" key).
Vehicle parse_fuel_vehicle(const nlohmann::json& payload);

void to_json(nlohmann::json& j, const DeliveryStop& s);
void to_json(nlohmann::json& j, const RouteAssignment& r);
void to_json(nlohmann::json& j, const OptimizationRun& r);
void to_json(nlohmann::json& j, const FuelFeasibility& f);
void to_json(nlohmann::json& j, const Recommendation& r);

// {assignments: {vehicle_id: route}, unassigned_deliveries, total_vehicles_used,
//  total_deliveries_assigned, optimization_timestamp}
nlohmann::json assignment_to_json(const AssignmentResult& res, const std::string& timestamp);
