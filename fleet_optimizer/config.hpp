#pragma once
#include <string>
#include <yaml-cpp/yaml.h>

struct EngineConfig {
    int ledger_capacity = 100;

    int max_candidates = 5;
    double max_start_distance_km = 50.0;

    double average_speed_kmh = 40.0;
    double priority_discount = 0.1;

    double consumption_per_km = 0.08;   // litres per km
    double refuel_deficit_l = 5.0;

    double fuel_alert_pct = 20.0;
    double fuel_warning_pct = 40.0;
    int efficiency_window = 5;
    double efficiency_threshold = 0.7;

    int default_history_limit = 10;
};

// Overlays the keys present in `node` on top of the defaults.
// Throws std::invalid_argument on out-of-range values and YAML::Exception on bad types.
EngineConfig parse_config(const YAML::Node& node);

bool load_config(const std::string& file, EngineConfig& cfg);
