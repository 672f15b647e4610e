#include "config.hpp"
#include <iostream>
#include <stdexcept>

using namespace std;

template <typename T>
static void read_key(const YAML::Node& section, const char* key, T& out)
{
    if (section && section[key])
        out = section[key].as<T>();
}

static void require(bool ok, const string& msg)
{
    if (!ok) throw invalid_argument(msg);
}

EngineConfig parse_config(const YAML::Node& node)
{
    EngineConfig cfg;
    if (!node || node.IsNull()) return cfg;

    read_key(node["ledger"], "capacity", cfg.ledger_capacity);

    auto assignment = node["assignment"];
    read_key(assignment, "max_candidates", cfg.max_candidates);
    read_key(assignment, "max_start_distance_km", cfg.max_start_distance_km);

    auto routing = node["routing"];
    read_key(routing, "average_speed_kmh", cfg.average_speed_kmh);
    read_key(routing, "priority_discount", cfg.priority_discount);

    auto fuel = node["fuel"];
    read_key(fuel, "consumption_per_km", cfg.consumption_per_km);
    read_key(fuel, "refuel_deficit_l", cfg.refuel_deficit_l);

    auto rec = node["recommendations"];
    read_key(rec, "fuel_alert_pct", cfg.fuel_alert_pct);
    read_key(rec, "fuel_warning_pct", cfg.fuel_warning_pct);
    read_key(rec, "efficiency_window", cfg.efficiency_window);
    read_key(rec, "efficiency_threshold", cfg.efficiency_threshold);

    read_key(node["history"], "default_limit", cfg.default_history_limit);

    require(cfg.ledger_capacity > 0, "ledger.capacity must be positive");
    require(cfg.max_candidates > 0, "assignment.max_candidates must be positive");
    require(cfg.max_start_distance_km >= 0, "assignment.max_start_distance_km must be >= 0");
    require(cfg.average_speed_kmh > 0, "routing.average_speed_kmh must be positive");
    // priority 5 must keep a non-negative factor
    require(cfg.priority_discount >= 0 && cfg.priority_discount <= 0.25,
            "routing.priority_discount must be in [0, 0.25]");
    require(cfg.consumption_per_km >= 0, "fuel.consumption_per_km must be >= 0");
    require(cfg.refuel_deficit_l >= 0, "fuel.refuel_deficit_l must be >= 0");
    require(cfg.fuel_alert_pct >= 0 && cfg.fuel_warning_pct >= cfg.fuel_alert_pct,
            "recommendations: need 0 <= fuel_alert_pct <= fuel_warning_pct");
    require(cfg.efficiency_window > 0, "recommendations.efficiency_window must be positive");
    require(cfg.efficiency_threshold >= 0, "recommendations.efficiency_threshold must be >= 0");
    require(cfg.default_history_limit >= 0, "history.default_limit must be >= 0");

    return cfg;
}

bool load_config(const string& file, EngineConfig& cfg)
{
    try {
        cfg = parse_config(YAML::LoadFile(file));
    } catch (const YAML::BadFile&) {
        cerr << "Could not open config file: " << file << "\n";
        return false;
    } catch (const YAML::Exception& e) {
        cerr << "Error parsing config " << file << ": " << e.what() << "\n";
        return false;
    } catch (const invalid_argument& e) {
        cerr << "Invalid config " << file << ": " << e.what() << "\n";
        return false;
    }
    return true;
}
