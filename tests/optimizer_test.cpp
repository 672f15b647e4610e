#include "optimizer.hpp"
#include "assignment.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(FleetOptimizer, RecordsEachCompletedRun) {
    FleetOptimizer engine;
    std::vector<DeliveryStop> deliveries = {make_stop("D1", 0, 0.1), make_stop("D2", 0, 0.2), make_stop("far", 0, 3.0)};
    std::vector<Vehicle> vehicles = {make_vehicle("V1", 0, 0)};

    OptimizeOutput out = engine.optimize(deliveries, vehicles);
    EXPECT_EQ(out.optimization_id.size(), 36u);
    EXPECT_FALSE(out.timestamp.empty());
    EXPECT_EQ(out.result.total_deliveries_assigned, 2);

    ASSERT_EQ(engine.ledger().count(), 1u);
    auto hist = engine.history(10);
    ASSERT_EQ(hist.size(), 1u);
    EXPECT_EQ(hist[0].id, out.optimization_id);
    EXPECT_EQ(hist[0].total_deliveries, 3);
    EXPECT_EQ(hist[0].total_vehicles, 1);
    EXPECT_EQ(hist[0].assignments_made, 2);
    EXPECT_DOUBLE_EQ(hist[0].efficiency_score, 2.0 / 3.0);
}

TEST(FleetOptimizer, NoVehiclesIsNotAnError) {
    FleetOptimizer engine;
    OptimizeOutput out = engine.optimize({make_stop("a", 0, 0), make_stop("b", 1, 1), make_stop("c", 2, 2)}, {});
    EXPECT_TRUE(out.result.assignments.empty());
    EXPECT_EQ(out.result.unassigned.size(), 3u);
    EXPECT_EQ(engine.ledger().count(), 1u);
    EXPECT_DOUBLE_EQ(engine.history(1)[0].efficiency_score, 0.0);
}

TEST(FleetOptimizer, EmptyRunScoresZero) {
    FleetOptimizer engine;
    engine.optimize({}, {make_vehicle("V1", 0, 0)});
    EXPECT_DOUBLE_EQ(engine.history(1)[0].efficiency_score, 0.0);
}

TEST(FleetOptimizer, OptimizeRecommendsForSubmittedFleet) {
    FleetOptimizer engine;
    OptimizeOutput out = engine.optimize({make_stop("D1", 0, 0.1)},
                                         {make_vehicle("ok", 0, 0, 50, 60), make_vehicle("low", 0, 0, 6, 60)});
    ASSERT_EQ(out.recommendations.size(), 1u);
    EXPECT_EQ(out.recommendations[0].type, "fuel_alert");
    EXPECT_EQ(*out.recommendations[0].vehicle_id, "low");

    EXPECT_EQ(engine.registered_vehicles(), 2u);
    auto again = engine.recommendations();
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(*again[0].vehicle_id, "low");
}

TEST(FleetOptimizer, PoorRunsTriggerEfficiencyRecommendation) {
    FleetOptimizer engine;
    std::vector<DeliveryStop> half = {make_stop("near", 0, 0.1), make_stop("far", 0, 5.0)};
    std::vector<Vehicle> fleet = {make_vehicle("V1", 0, 0)};

    for (int i = 0; i < 5; i++) engine.optimize(half, fleet);
    EXPECT_TRUE(engine.recommendations().empty());

    OptimizeOutput sixth = engine.optimize(half, fleet);
    ASSERT_EQ(sixth.recommendations.size(), 1u);
    EXPECT_EQ(sixth.recommendations[0].type, "efficiency_improvement");
}

TEST(FleetOptimizer, GoodRunsDoNotTriggerEfficiencyRecommendation) {
    FleetOptimizer engine;
    std::vector<DeliveryStop> all_near = {make_stop("a", 0, 0.1), make_stop("b", 0, 0.2)};
    for (int i = 0; i < 8; i++) engine.optimize(all_near, {make_vehicle("V1", 0, 0)});
    EXPECT_TRUE(engine.recommendations().empty());
}

TEST(FleetOptimizer, HistoryHonoursLimitAndRetention) {
    EngineConfig cfg;
    cfg.ledger_capacity = 4;
    FleetOptimizer engine(cfg);
    for (int i = 0; i < 6; i++) engine.optimize({}, {});

    EXPECT_EQ(engine.history(2).size(), 2u);
    EXPECT_EQ(engine.history(10).size(), 4u);
    EXPECT_TRUE(engine.history(0).empty());
    EXPECT_EQ(engine.ledger().count(), 6u);
    EXPECT_THROW(engine.history(-1), ValidationError);
}

TEST(FleetOptimizer, FuelEfficiencyUsesConfiguredRates) {
    EngineConfig cfg;
    cfg.consumption_per_km = 0.1;
    FleetOptimizer engine(cfg);
    FuelFeasibility f = engine.fuel_efficiency(make_vehicle("V1", 0, 0, 10, 60), 200.0);
    EXPECT_NEAR(f.estimated_fuel_consumption, 20.0, 1e-9);
    EXPECT_NEAR(f.fuel_deficit, 10.0, 1e-9);
    EXPECT_TRUE(f.needs_refuel);
    EXPECT_THROW(engine.fuel_efficiency(make_vehicle("V1", 0, 0), -1.0), ValidationError);
}

TEST(FleetOptimizer, CallerInputsAreUntouched) {
    FleetOptimizer engine;
    std::vector<DeliveryStop> deliveries = {make_stop("b", 0, 0.2, 5), make_stop("a", 0, 0.15, 1)};
    std::vector<Vehicle> vehicles = {make_vehicle("low", 0, 0, 5, 60), make_vehicle("high", 0, 0, 55, 60)};
    engine.optimize(deliveries, vehicles);

    EXPECT_EQ(deliveries[0].id, "b");
    EXPECT_EQ(deliveries[1].id, "a");
    EXPECT_EQ(vehicles[0].id, "low");
    EXPECT_EQ(vehicles[1].id, "high");
}

TEST(FleetOptimizer, FailedAssignmentIsNotRecorded) {
    FleetOptimizer engine(EngineConfig(), [](const std::vector<DeliveryStop>&, const std::vector<Vehicle>&,
                                             const EngineConfig&) -> AssignmentResult {
        throw std::runtime_error("pool exhausted unexpectedly");
    });

    EXPECT_THROW(engine.optimize({make_stop("D1", 0, 0.1)}, {make_vehicle("V1", 0, 0)}), ComputationError);
    EXPECT_EQ(engine.ledger().count(), 0u);
    EXPECT_EQ(engine.registered_vehicles(), 0u);
}

TEST(FleetOptimizer, AssignmentThatLosesStopsIsRejected) {
    FleetOptimizer engine(EngineConfig(), [](const std::vector<DeliveryStop>& deliveries,
                                             const std::vector<Vehicle>& vehicles, const EngineConfig& cfg) {
        AssignmentResult r = assign_routes(deliveries, vehicles, cfg);
        if (!r.unassigned.empty()) r.unassigned.pop_back();
        return r;
    });

    std::vector<DeliveryStop> deliveries = {make_stop("near", 0, 0.1), make_stop("far", 0, 5.0)};
    EXPECT_THROW(engine.optimize(deliveries, {make_vehicle("V1", 0, 0)}), ComputationError);
    EXPECT_EQ(engine.ledger().count(), 0u);
    EXPECT_TRUE(engine.history(10).empty());
}

TEST(FleetOptimizer, EmptyAssignFunctionIsRejected) {
    EXPECT_THROW(FleetOptimizer(EngineConfig(), AssignFn()), std::invalid_argument);
}
