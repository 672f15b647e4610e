#include "recommendations.hpp"
#include <iomanip>
#include <sstream>

using namespace std;

string format_percent(double value, int decimals)
{
    ostringstream os;
    os << fixed << setprecision(decimals) << value << "%";
    return os.str();
}

static Recommendation fuel_entry(const Vehicle& v, double pct, bool urgent)
{
    Recommendation r;
    r.vehicle_id = v.id;
    r.driver_name = v.driver_name;
    r.fuel_percentage = pct;
    if (urgent) {
        r.type = "fuel_alert";
        r.priority = "high";
        r.message = "Vehicle " + v.id + " (driver " + v.driver_name +
                    ") needs refueling urgently: fuel at " + format_percent(pct);
        r.recommendation = "Route vehicle to nearest fuel station";
    } else {
        r.type = "fuel_warning";
        r.priority = "medium";
        r.message = "Vehicle " + v.id + " (driver " + v.driver_name +
                    ") fuel level is low: fuel at " + format_percent(pct);
        r.recommendation = "Plan refuel within next 4 hours";
    }
    return r;
}

vector<Recommendation> recommend(
    const vector<Vehicle>& vehicles,
    const vector<OptimizationRun>& history,
    const EngineConfig& cfg
) {
    vector<Recommendation> out;

    for (const auto& v : vehicles) {
        double pct = v.fuel_level / v.max_fuel * 100.0;
        if (pct < cfg.fuel_alert_pct)
            out.push_back(fuel_entry(v, pct, true));
        else if (pct < cfg.fuel_warning_pct)
            out.push_back(fuel_entry(v, pct, false));
    }

    int window = cfg.efficiency_window;
    if ((int)history.size() > window) {
        double sum = 0.0;
        for (int i = history.size() - window; i < (int)history.size(); i++)
            sum += history[i].efficiency_score;
        double avg = sum / window;

        if (avg < cfg.efficiency_threshold) {
            Recommendation r;
            r.type = "efficiency_improvement";
            r.priority = "medium";
            r.average_efficiency = avg;
            r.message = "Fleet efficiency is below optimal (" + format_percent(avg * 100.0) + ")";
            r.recommendation = "Consider reassigning delivery zones or adjusting time windows";
            out.push_back(r);
        }
    }
    return out;
}
