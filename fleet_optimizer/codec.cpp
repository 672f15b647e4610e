#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>

using namespace std;
using json = nlohmann::json;

static string trim(const string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

static ValidationError bad_field(const string& key, const json& value)
{
    return ValidationError("field '" + key + "' is not a number: " + value.dump());
}

static bool decimal_text(const string& s)
{
    // digits, sign, point and exponent only; keeps hex and inf/nan spellings out
    if (s.empty()) return false;
    for (char c : s)
        if (!isdigit((unsigned char)c) && c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E')
            return false;
    return true;
}

static double coerce_double(const string& key, const json& value)
{
    double out = 0.0;
    if (value.is_number()) {
        out = value.get<double>();
    } else if (value.is_string()) {
        string s = trim(value.get<string>());
        if (!decimal_text(s)) throw bad_field(key, value);
        size_t used = 0;
        try {
            out = stod(s, &used);
        } catch (const logic_error&) {
            throw bad_field(key, value);
        }
        if (used != s.size()) throw bad_field(key, value);
    } else {
        throw bad_field(key, value);
    }
    if (!isfinite(out)) throw ValidationError("field '" + key + "' must be finite");
    return out;
}

static ValidationError outside_int(const string& key, const json& value)
{
    return ValidationError("field '" + key + "' is out of range: " + value.dump());
}

static int coerce_int(const string& key, const json& value)
{
    if (value.is_number_unsigned()) {
        uint64_t u = value.get<uint64_t>();
        if (u > (uint64_t)numeric_limits<int>::max()) throw outside_int(key, value);
        return (int)u;
    }
    if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        if (v < numeric_limits<int>::min() || v > numeric_limits<int>::max())
            throw outside_int(key, value);
        return (int)v;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!isfinite(d)) throw bad_field(key, value);
        d = trunc(d);
        if (d < numeric_limits<int>::min() || d > numeric_limits<int>::max())
            throw outside_int(key, value);
        return (int)d;
    }
    if (value.is_string()) {
        string s = trim(value.get<string>());
        if (!decimal_text(s)) throw bad_field(key, value);
        size_t used = 0;
        long long v = 0;
        try {
            v = stoll(s, &used);
        } catch (const invalid_argument&) {
            throw bad_field(key, value);
        } catch (const out_of_range&) {
            throw outside_int(key, value);
        }
        if (used != s.size()) throw bad_field(key, value);
        if (v < numeric_limits<int>::min() || v > numeric_limits<int>::max())
            throw outside_int(key, value);
        return (int)v;
    }
    throw bad_field(key, value);
}

double number_field(const json& obj, const string& key, double def)
{
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    return coerce_double(key, *it);
}

double required_number(const json& obj, const string& key)
{
    auto it = obj.find(key);
    if (it == obj.end()) throw ValidationError("missing required field '" + key + "'");
    return coerce_double(key, *it);
}

int integer_field(const json& obj, const string& key, int def)
{
    auto it = obj.find(key);
    if (it == obj.end()) return def;
    return coerce_int(key, *it);
}

string string_field(const json& obj, const string& key, const string& def)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return def;
    if (it->is_string()) return it->get<string>();
    if (it->is_number()) return it->dump();
    throw ValidationError("field '" + key + "' must be a string");
}

static void check_object(const json& j, const char* what)
{
    if (!j.is_object()) throw ValidationError(string(what) + " entry must be an object");
}

DeliveryStop parse_delivery(const json& j)
{
    check_object(j, "delivery");
    DeliveryStop s;
    s.id = string_field(j, "id", "");
    if (s.id.empty()) s.id = make_uuid();
    s.name = string_field(j, "name", "Delivery Point");
    s.latitude = required_number(j, "latitude");
    s.longitude = required_number(j, "longitude");
    s.priority = integer_field(j, "priority", 3);
    s.time_window_start = string_field(j, "time_window_start", "09:00");
    s.time_window_end = string_field(j, "time_window_end", "17:00");
    s.estimated_duration = integer_field(j, "estimated_duration", 15);

    if (s.priority < 1 || s.priority > 5)
        throw ValidationError("delivery " + s.id + ": priority must be between 1 and 5");
    if (s.estimated_duration < 0)
        throw ValidationError("delivery " + s.id + ": estimated_duration must be >= 0");
    return s;
}

static void check_fuel(const Vehicle& v)
{
    if (v.max_fuel <= 0)
        throw ValidationError("vehicle " + v.id + ": max_fuel must be positive");
    if (v.fuel_level < 0)
        throw ValidationError("vehicle " + v.id + ": fuel_level must be >= 0");
    if (v.capacity < 0)
        throw ValidationError("vehicle " + v.id + ": capacity must be >= 0");
}

Vehicle parse_vehicle(const json& j)
{
    check_object(j, "vehicle");
    Vehicle v;
    v.id = string_field(j, "id", "");
    if (v.id.empty()) v.id = make_uuid();
    v.driver_name = string_field(j, "driver_name", "Unknown");
    v.capacity = number_field(j, "capacity", 1000.0);
    v.current_lat = number_field(j, "current_lat", 0.0);
    v.current_lon = number_field(j, "current_lon", 0.0);
    v.fuel_level = number_field(j, "fuel_level", 50.0);
    v.max_fuel = number_field(j, "max_fuel", 60.0);
    check_fuel(v);
    return v;
}

static const json& array_field(const json& payload, const char* key)
{
    static const json empty = json::array();
    if (!payload.is_object()) throw ValidationError("request payload must be an object");
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return empty;
    if (!it->is_array()) throw ValidationError(string("field '") + key + "' must be an array");
    return *it;
}

vector<DeliveryStop> parse_deliveries(const json& payload)
{
    vector<DeliveryStop> out;
    for (const auto& d : array_field(payload, "deliveries"))
        out.push_back(parse_delivery(d));
    return out;
}

vector<Vehicle> parse_vehicles(const json& payload)
{
    vector<Vehicle> out;
    set<string> seen;
    for (const auto& jv : array_field(payload, "vehicles")) {
        Vehicle v = parse_vehicle(jv);
        if (!seen.insert(v.id).second)
            throw ValidationError("duplicate vehicle id " + v.id);
        out.push_back(v);
    }
    return out;
}

Vehicle parse_fuel_vehicle(const json& payload)
{
    check_object(payload, "fuel-efficiency request");
    Vehicle v;
    v.id = string_field(payload, "vehicle_id", "unknown");
    v.driver_name = string_field(payload, "driver_name", "Unknown");
    v.capacity = number_field(payload, "capacity", 1000.0);
    v.current_lat = number_field(payload, "current_lat", 0.0);
    v.current_lon = number_field(payload, "current_lon", 0.0);
    v.fuel_level = number_field(payload, "fuel_level", 50.0);
    v.max_fuel = number_field(payload, "max_fuel", 60.0);
    check_fuel(v);
    return v;
}

void to_json(json& j, const DeliveryStop& s)
{
    j = {
        {"id", s.id},
        {"name", s.name},
        {"latitude", s.latitude},
        {"longitude", s.longitude},
        {"priority", s.priority},
        {"time_window_start", s.time_window_start},
        {"time_window_end", s.time_window_end},
        {"estimated_duration", s.estimated_duration}
    };
}

void to_json(json& j, const RouteAssignment& r)
{
    j["vehicle_id"] = r.vehicle_id;
    j["route"] = r.route;
    j["total_distance"] = r.total_distance;
    j["estimated_time"] = r.estimated_time;
    j["stops_count"] = r.stops_count;
    j["optimization_method"] = r.optimization_method;
}

void to_json(json& j, const OptimizationRun& r)
{
    j = {
        {"id", r.id},
        {"timestamp", r.timestamp},
        {"total_deliveries", r.total_deliveries},
        {"total_vehicles", r.total_vehicles},
        {"assignments_made", r.assignments_made},
        {"efficiency_score", r.efficiency_score}
    };
}

void to_json(json& j, const FuelFeasibility& f)
{
    j = {
        {"vehicle_id", f.vehicle_id},
        {"route_distance", f.route_distance},
        {"estimated_fuel_consumption", f.estimated_fuel_consumption},
        {"current_fuel_level", f.current_fuel_level},
        {"max_fuel", f.max_fuel},
        {"fuel_deficit", f.fuel_deficit},
        {"fuel_percentage", f.fuel_percentage},
        {"needs_refuel", f.needs_refuel}
    };
}

void to_json(json& j, const Recommendation& r)
{
    j["type"] = r.type;
    if (r.vehicle_id) j["vehicle_id"] = *r.vehicle_id;
    if (r.driver_name) j["driver_name"] = *r.driver_name;
    if (r.fuel_percentage) j["fuel_percentage"] = *r.fuel_percentage;
    if (r.average_efficiency) j["average_efficiency"] = *r.average_efficiency;
    j["priority"] = r.priority;
    j["message"] = r.message;
    j["recommendation"] = r.recommendation;
}

json assignment_to_json(const AssignmentResult& res, const string& timestamp)
{
    json out;
    out["assignments"] = json::object();
    for (const auto& a : res.assignments)
        out["assignments"][a.vehicle_id] = a;
    out["unassigned_deliveries"] = res.unassigned;
    out["total_vehicles_used"] = res.assignments.size();
    out["total_deliveries_assigned"] = res.total_deliveries_assigned;
    out["optimization_timestamp"] = timestamp;
    return out;
}
