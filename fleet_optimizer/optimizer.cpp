#include "optimizer.hpp"
#include "assignment.hpp"
#include "errors.hpp"
#include "fuel.hpp"
#include "recommendations.hpp"
#include "util.hpp"
#include <algorithm>
#include <stdexcept>

using namespace std;

FleetOptimizer::FleetOptimizer(const EngineConfig& c)
    : FleetOptimizer(c, assign_routes)
{
}

FleetOptimizer::FleetOptimizer(const EngineConfig& c, AssignFn a)
    : cfg(c), assign(move(a)), runs(c.ledger_capacity)
{
    if (!assign) throw invalid_argument("assignment function must be set");
}

OptimizeOutput FleetOptimizer::optimize(const vector<DeliveryStop>& deliveries,
                                        const vector<Vehicle>& vehicles)
{
    OptimizeOutput out;
    try {
        out.result = assign(deliveries, vehicles, cfg);
    } catch (const exception& e) {
        throw ComputationError(string("route assignment failed: ") + e.what());
    }

    int assigned = out.result.total_deliveries_assigned;
    if (assigned + (int)out.result.unassigned.size() != (int)deliveries.size())
        throw ComputationError("route assignment lost or duplicated deliveries");

    out.optimization_id = make_uuid();
    out.timestamp = iso_timestamp();

    OptimizationRun run;
    run.id = out.optimization_id;
    run.timestamp = out.timestamp;
    run.total_deliveries = deliveries.size();
    run.total_vehicles = vehicles.size();
    run.assignments_made = assigned;
    run.efficiency_score = (double)assigned / max(1, (int)deliveries.size());
    runs.record(run);

    {
        lock_guard<mutex> lock(fleet_mtx);
        fleet = vehicles;
    }
    out.recommendations = recommend_for(vehicles);
    return out;
}

FuelFeasibility FleetOptimizer::fuel_efficiency(const Vehicle& vehicle, double route_distance) const
{
    if (route_distance < 0)
        throw ValidationError("route_distance must be >= 0");
    return evaluate_fuel(vehicle, route_distance, cfg.consumption_per_km, cfg.refuel_deficit_l);
}

vector<Recommendation> FleetOptimizer::recommend_for(const vector<Vehicle>& vehicles) const
{
    // one extra run so recommend() can tell "more than window" apart
    return recommend(vehicles, runs.recent(cfg.efficiency_window + 1), cfg);
}

vector<Recommendation> FleetOptimizer::recommendations() const
{
    vector<Vehicle> snapshot;
    {
        lock_guard<mutex> lock(fleet_mtx);
        snapshot = fleet;
    }
    return recommend_for(snapshot);
}

vector<OptimizationRun> FleetOptimizer::history(int limit) const
{
    if (limit < 0) throw ValidationError("limit must be >= 0");
    return runs.recent(limit);
}

size_t FleetOptimizer::registered_vehicles() const
{
    lock_guard<mutex> lock(fleet_mtx);
    return fleet.size();
}
