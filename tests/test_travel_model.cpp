#include "core/TravelModel.hpp"
#include "models/Errors.hpp"
#include <gtest/gtest.h>

TEST(TravelModel, OffPeakUsesBaseSpeed) {
  TrafficConfig cfg; // 30 km/h
  EXPECT_DOUBLE_EQ(TravelModel::estimate_travel_time(15.0, 12, cfg), 30.0);
  EXPECT_DOUBLE_EQ(TravelModel::estimate_travel_time(0.0, 3, cfg), 0.0);
}

TEST(TravelModel, PeakHoursAreSlower) {
  TrafficConfig cfg;
  for (int h : {8, 9, 17, 18})
    EXPECT_DOUBLE_EQ(TravelModel::estimate_travel_time(15.0, h, cfg), 45.0)
        << "hour " << h;
  for (int h : {7, 10, 16, 19})
    EXPECT_DOUBLE_EQ(TravelModel::estimate_travel_time(15.0, h, cfg), 30.0)
        << "hour " << h;
}

TEST(TravelModel, UsesConfiguredTable) {
  TrafficConfig cfg;
  cfg.speed_kmph = 35.0;
  cfg.peak_hours = {6, 7};
  cfg.peak_multiplier = 1.4;
  cfg.offpeak_multiplier = 0.9;
  EXPECT_DOUBLE_EQ(TravelModel::traffic_multiplier(6, cfg), 1.4);
  EXPECT_DOUBLE_EQ(TravelModel::traffic_multiplier(8, cfg), 0.9);
  EXPECT_NEAR(TravelModel::estimate_travel_time(35.0, 7, cfg), 84.0, 1e-9);
}

TEST(TravelModel, RejectsBadHourAndDistance) {
  TrafficConfig cfg;
  EXPECT_THROW(TravelModel::estimate_travel_time(1.0, 24, cfg),
               ValidationError);
  EXPECT_THROW(TravelModel::estimate_travel_time(1.0, -1, cfg),
               ValidationError);
  EXPECT_THROW(TravelModel::estimate_travel_time(-0.5, 10, cfg),
               ValidationError);
  EXPECT_THROW(TravelModel::estimate_cost(-1.0, CostConfig{}),
               ValidationError);
}

TEST(TravelModel, CostIsLinearInDistance) {
  CostConfig cfg;
  cfg.fuel_cost_per_km = 8.0;
  cfg.co2_kg_per_km = 0.2;
  const TripCost c = TravelModel::estimate_cost(82.5, cfg);
  EXPECT_DOUBLE_EQ(c.fuel_cost, 660.0);
  EXPECT_DOUBLE_EQ(c.co2_kg, 16.5);
  const TripCost zero = TravelModel::estimate_cost(0.0, cfg);
  EXPECT_EQ(zero.fuel_cost, 0.0);
  EXPECT_EQ(zero.co2_kg, 0.0);
}

TEST(TravelModel, DefaultCostMatchesTwelveKmPerLitre) {
  // 82.5 km at 12 km/l and 95 per litre
  const TripCost c = TravelModel::estimate_cost(82.5, CostConfig{});
  EXPECT_NEAR(c.fuel_cost, 653.125, 1e-9);
  EXPECT_NEAR(c.co2_kg, 82.5 / 12.0 * 2.31, 1e-9);
}

TEST(TravelModel, FormatsDurations) {
  EXPECT_EQ(TravelModel::format_duration(150.0), "2h 30m");
  EXPECT_EQ(TravelModel::format_duration(45.0), "45m");
  EXPECT_EQ(TravelModel::format_duration(60.0), "1h 0m");
  EXPECT_EQ(TravelModel::format_duration(0.4), "0m");
}

TEST(TrafficConfig, ValidateRejectsNonsense) {
  TrafficConfig cfg;
  cfg.speed_kmph = 0.0;
  EXPECT_THROW(cfg.validate(), ValidationError);
  cfg = TrafficConfig{};
  cfg.peak_hours = {25};
  EXPECT_THROW(cfg.validate(), ValidationError);
  cfg = TrafficConfig{};
  cfg.peak_multiplier = -1.0;
  EXPECT_THROW(cfg.validate(), ValidationError);
  EXPECT_NO_THROW(TrafficConfig{}.validate());
}
