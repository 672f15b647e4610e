#include "assignment.hpp"
#include "geo.hpp"
#include "route_builder.hpp"
#include <algorithm>
#include <numeric>

using namespace std;

static double fuel_ratio(const Vehicle& v)
{
    return v.fuel_level / v.max_fuel;
}

vector<int> vehicle_order(const vector<Vehicle>& vehicles)
{
    vector<int> order(vehicles.size());
    iota(order.begin(), order.end(), 0);
    stable_sort(order.begin(), order.end(), [&](int a, int b) {
        return fuel_ratio(vehicles[a]) > fuel_ratio(vehicles[b]);
    });
    return order;
}

AssignmentResult assign_routes(
    const vector<DeliveryStop>& deliveries,
    const vector<Vehicle>& vehicles,
    const EngineConfig& cfg
) {
    AssignmentResult result;
    vector<bool> taken(deliveries.size(), false);
    int pool_left = deliveries.size();

    for (int vi : vehicle_order(vehicles)) {
        if (pool_left == 0) break;
        const Vehicle& v = vehicles[vi];

        vector<int> picked;
        for (int i = 0; i < (int)deliveries.size(); i++) {
            if ((int)picked.size() >= cfg.max_candidates) break;
            if (taken[i]) continue;
            double d = haversine_km(v.current_lat, v.current_lon,
                                    deliveries[i].latitude, deliveries[i].longitude);
            if (d < cfg.max_start_distance_km) picked.push_back(i);
        }
        if (picked.empty()) continue;

        vector<DeliveryStop> candidates;
        candidates.reserve(picked.size());
        for (int i : picked) candidates.push_back(deliveries[i]);

        RouteAssignment ra = build_route(candidates, v.current_lat, v.current_lon,
                                         cfg.average_speed_kmh, cfg.priority_discount);
        ra.vehicle_id = v.id;
        result.assignments.push_back(move(ra));

        for (int i : picked) taken[i] = true;
        pool_left -= picked.size();
        result.total_deliveries_assigned += picked.size();
    }

    for (int i = 0; i < (int)deliveries.size(); i++)
        if (!taken[i]) result.unassigned.push_back(deliveries[i]);

    return result;
}
