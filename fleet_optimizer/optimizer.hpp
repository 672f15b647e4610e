#pragma once
#include "config.hpp"
#include "fleet.hpp"
#include "ledger.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct OptimizeOutput {
    std::string optimization_id;
    std::string timestamp;
    AssignmentResult result;
    std::vector<Recommendation> recommendations;
};

using AssignFn = std::function<AssignmentResult(
    const std::vector<DeliveryStop>&, const std::vector<Vehicle>&, const EngineConfig&)>;

// One engine per caller. Owns the run ledger and the last submitted fleet.
class FleetOptimizer {
public:
    explicit FleetOptimizer(const EngineConfig& cfg = EngineConfig());
    // `assign` replaces assign_routes as the partitioning step.
    FleetOptimizer(const EngineConfig& cfg, AssignFn assign);

    // Assigns and sequences, then records the run. Throws ComputationError if
    // assignment fails; nothing is recorded in that case.
    OptimizeOutput optimize(const std::vector<DeliveryStop>& deliveries,
                            const std::vector<Vehicle>& vehicles);

    FuelFeasibility fuel_efficiency(const Vehicle& vehicle, double route_distance) const;

    std::vector<Recommendation> recommendations() const;

    std::vector<OptimizationRun> history(int limit) const;

    std::size_t registered_vehicles() const;

    const EngineConfig& config() const { return cfg; }
    const OptimizationLedger& ledger() const { return runs; }

private:
    std::vector<Recommendation> recommend_for(const std::vector<Vehicle>& vehicles) const;

    EngineConfig cfg;
    AssignFn assign;
    OptimizationLedger runs;
    mutable std::mutex fleet_mtx;
    std::vector<Vehicle> fleet;
};
