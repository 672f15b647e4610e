#include "route_builder.hpp"
#include "geo.hpp"
#include <limits>

using namespace std;

double priority_factor(int priority, double priority_discount)
{
    return 1.0 - (priority - 1) * priority_discount;
}

RouteAssignment build_route(
    const vector<DeliveryStop>& stops,
    double start_lat,
    double start_lon,
    double average_speed_kmh,
    double priority_discount
) {
    RouteAssignment out;
    if (stops.empty()) return out;

    vector<bool> visited(stops.size(), false);
    double cur_lat = start_lat;
    double cur_lon = start_lon;
    int remaining = stops.size();

    while (remaining > 0) {
        double best_score = numeric_limits<double>::infinity();
        double best_raw = 0.0;
        int best_idx = -1;

        for (int i = 0; i < (int)stops.size(); i++) {
            if (visited[i]) continue;
            double d = haversine_km(cur_lat, cur_lon, stops[i].latitude, stops[i].longitude);
            double score = d * priority_factor(stops[i].priority, priority_discount);
            if (best_idx == -1 || score < best_score) {
                best_score = score;
                best_raw = d;
                best_idx = i;
            }
        }

        visited[best_idx] = true;
        remaining--;
        out.route.push_back(stops[best_idx]);
        out.total_distance += best_raw;
        cur_lat = stops[best_idx].latitude;
        cur_lon = stops[best_idx].longitude;
    }

    double service_minutes = 0.0;
    for (const auto& s : out.route) service_minutes += s.estimated_duration;

    out.estimated_time = out.total_distance / average_speed_kmh * 60.0 + service_minutes;
    out.stops_count = out.route.size();
    return out;
}
