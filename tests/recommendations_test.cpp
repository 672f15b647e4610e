#include "recommendations.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

static std::vector<OptimizationRun> runs_with_score(int n, double score)
{
    std::vector<OptimizationRun> out;
    for (int i = 0; i < n; i++) {
        OptimizationRun r;
        r.id = "run-" + std::to_string(i);
        r.efficiency_score = score;
        out.push_back(r);
    }
    return out;
}

TEST(Recommend, FuelBands) {
    std::vector<Vehicle> fleet = {
        make_vehicle("alert", 0, 0, 19.99, 100),
        make_vehicle("edge20", 0, 0, 20, 100),
        make_vehicle("warn", 0, 0, 39.9, 100),
        make_vehicle("edge40", 0, 0, 40, 100),
        make_vehicle("full", 0, 0, 90, 100),
    };
    auto recs = recommend(fleet, {});

    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].type, "fuel_alert");
    EXPECT_EQ(*recs[0].vehicle_id, "alert");
    EXPECT_EQ(recs[0].priority, "high");
    EXPECT_EQ(recs[1].type, "fuel_warning");
    EXPECT_EQ(*recs[1].vehicle_id, "edge20");
    EXPECT_EQ(recs[1].priority, "medium");
    EXPECT_EQ(recs[2].type, "fuel_warning");
    EXPECT_EQ(*recs[2].vehicle_id, "warn");
}

TEST(Recommend, MessageNamesVehicleDriverAndRatio) {
    auto recs = recommend({make_vehicle("V9", 0, 0, 9, 60)}, {});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_NE(recs[0].message.find("V9"), std::string::npos);
    EXPECT_NE(recs[0].message.find("Driver V9"), std::string::npos);
    EXPECT_NE(recs[0].message.find("15.0%"), std::string::npos);
    EXPECT_DOUBLE_EQ(*recs[0].fuel_percentage, 15.0);
    EXPECT_EQ(*recs[0].driver_name, "Driver V9");
}

TEST(Recommend, LowRecentEfficiencyAddsOneEntry) {
    auto recs = recommend({}, runs_with_score(6, 0.5));
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].type, "efficiency_improvement");
    EXPECT_EQ(recs[0].priority, "medium");
    EXPECT_FALSE(recs[0].vehicle_id.has_value());
    EXPECT_DOUBLE_EQ(*recs[0].average_efficiency, 0.5);
    EXPECT_NE(recs[0].message.find("50.0%"), std::string::npos);
}

TEST(Recommend, HighRecentEfficiencyAddsNothing) {
    EXPECT_TRUE(recommend({}, runs_with_score(6, 0.9)).empty());
}

TEST(Recommend, NeedsMoreThanWindowRuns) {
    EXPECT_TRUE(recommend({}, runs_with_score(5, 0.5)).empty());
}

TEST(Recommend, OnlyTheLatestWindowCounts) {
    auto history = runs_with_score(1, 0.0);
    auto good = runs_with_score(5, 0.9);
    history.insert(history.end(), good.begin(), good.end());
    EXPECT_TRUE(recommend({}, history).empty());

    auto bad_tail = runs_with_score(3, 1.0);
    auto poor = runs_with_score(5, 0.4);
    bad_tail.insert(bad_tail.end(), poor.begin(), poor.end());
    EXPECT_EQ(recommend({}, bad_tail).size(), 1u);
}

TEST(Recommend, VehicleEntriesComeBeforeEfficiency) {
    std::vector<Vehicle> fleet = {make_vehicle("a", 0, 0, 5, 60), make_vehicle("b", 0, 0, 20, 60)};
    auto recs = recommend(fleet, runs_with_score(8, 0.2));
    ASSERT_EQ(recs.size(), 3u);
    EXPECT_EQ(recs[0].type, "fuel_alert");
    EXPECT_EQ(recs[1].type, "fuel_warning");
    EXPECT_EQ(recs[2].type, "efficiency_improvement");
}

TEST(FormatPercent, OneDecimal) {
    EXPECT_EQ(format_percent(33.333), "33.3%");
    EXPECT_EQ(format_percent(70.0, 0), "70%");
}
