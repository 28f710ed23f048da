#pragma once

#include "models/Errors.hpp"
#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <set>
#include <string>

// Hour-of-day traffic model used to turn distance into travel time.
struct TrafficConfig {
  double speed_kmph = 30.0;
  std::set<int> peak_hours{8, 9, 17, 18}; // 08:00-10:00, 17:00-19:00
  double peak_multiplier = 1.5;
  double offpeak_multiplier = 1.0;
  // When set, each segment uses the hour in which it starts rather than the
  // departure hour.
  bool advance_clock = false;

  void validate() const {
    if (!std::isfinite(speed_kmph) || speed_kmph <= 0.0)
      throw ValidationError("speed_kmph must be positive");
    if (!std::isfinite(peak_multiplier) || peak_multiplier <= 0.0 ||
        !std::isfinite(offpeak_multiplier) || offpeak_multiplier <= 0.0)
      throw ValidationError("traffic multipliers must be positive");
    for (int h : peak_hours)
      if (h < 0 || h > 23)
        throw ValidationError("peak hour " + std::to_string(h) +
                              " outside 0-23");
  }
};

// Linear fuel/emission rates. Defaults: 12 km per litre, 95 per litre,
// 2.31 kg CO2 per litre of diesel.
struct CostConfig {
  double fuel_cost_per_km = 95.0 / 12.0;
  double co2_kg_per_km = 2.31 / 12.0;

  void validate() const {
    if (!std::isfinite(fuel_cost_per_km) || fuel_cost_per_km < 0.0)
      throw ValidationError("fuel_cost_per_km must be non-negative");
    if (!std::isfinite(co2_kg_per_km) || co2_kg_per_km < 0.0)
      throw ValidationError("co2_kg_per_km must be non-negative");
  }
};

enum class KMeansInit { PlusPlus, FirstK };

// User-supplied parameters controlling the whole optimisation.
struct EngineConfig {
  int k_zones = 4;
  std::uint32_t seed = 42;
  int max_2opt_passes = 1000;
  int max_kmeans_iterations = 100;
  KMeansInit kmeans_init = KMeansInit::PlusPlus;
  bool reseed_empty_zones = false;
  bool polish_full_route = false;
  unsigned max_workers = 0; // 0 = hardware concurrency
  int time_budget_ms = 0;   // 0 = no deadline
  TrafficConfig traffic;
  CostConfig cost;

  void validate() const {
    if (k_zones < 1)
      throw ValidationError("k_zones must be >= 1");
    if (max_2opt_passes < 1 || max_kmeans_iterations < 1)
      throw ValidationError("iteration caps must be >= 1");
    if (time_budget_ms < 0)
      throw ValidationError("time_budget_ms must be >= 0");
    traffic.validate();
    cost.validate();
  }

  // Overlays the keys present in `j` on top of `base`.
  static EngineConfig from_json(const nlohmann::json &j, EngineConfig base) {
    EngineConfig p = base;
    if (j.contains("k_zones"))
      p.k_zones = j.at("k_zones").get<int>();
    if (j.contains("seed"))
      p.seed = j.at("seed").get<std::uint32_t>();
    if (j.contains("max_2opt_passes"))
      p.max_2opt_passes = j.at("max_2opt_passes").get<int>();
    if (j.contains("max_kmeans_iterations"))
      p.max_kmeans_iterations = j.at("max_kmeans_iterations").get<int>();
    if (j.contains("kmeans_init")) {
      const auto s = j.at("kmeans_init").get<std::string>();
      if (s == "kmeans++")
        p.kmeans_init = KMeansInit::PlusPlus;
      else if (s == "first_k")
        p.kmeans_init = KMeansInit::FirstK;
      else
        throw ValidationError("unknown kmeans_init: " + s);
    }
    if (j.contains("reseed_empty_zones"))
      p.reseed_empty_zones = j.at("reseed_empty_zones").get<bool>();
    if (j.contains("polish_full_route"))
      p.polish_full_route = j.at("polish_full_route").get<bool>();
    if (j.contains("max_workers"))
      p.max_workers = j.at("max_workers").get<unsigned>();
    if (j.contains("time_budget_ms"))
      p.time_budget_ms = j.at("time_budget_ms").get<int>();

    // traffic / cost keys are flat, matching the dashboard's settings panel
    if (j.contains("speed_kmph"))
      p.traffic.speed_kmph = j.at("speed_kmph").get<double>();
    if (j.contains("peak_hours"))
      p.traffic.peak_hours = j.at("peak_hours").get<std::set<int>>();
    if (j.contains("peak_multiplier"))
      p.traffic.peak_multiplier = j.at("peak_multiplier").get<double>();
    if (j.contains("offpeak_multiplier"))
      p.traffic.offpeak_multiplier = j.at("offpeak_multiplier").get<double>();
    if (j.contains("advance_clock"))
      p.traffic.advance_clock = j.at("advance_clock").get<bool>();
    if (j.contains("fuel_cost_per_km"))
      p.cost.fuel_cost_per_km = j.at("fuel_cost_per_km").get<double>();
    if (j.contains("co2_kg_per_km"))
      p.cost.co2_kg_per_km = j.at("co2_kg_per_km").get<double>();
    p.validate();
    return p;
  }

  // Overlays on the built-in defaults.
  static EngineConfig from_json(const nlohmann::json &j);

  nlohmann::json to_json() const {
    return {{"k_zones", k_zones},
            {"seed", seed},
            {"max_2opt_passes", max_2opt_passes},
            {"max_kmeans_iterations", max_kmeans_iterations},
            {"kmeans_init",
             kmeans_init == KMeansInit::PlusPlus ? "kmeans++" : "first_k"},
            {"reseed_empty_zones", reseed_empty_zones},
            {"polish_full_route", polish_full_route},
            {"max_workers", max_workers},
            {"time_budget_ms", time_budget_ms},
            {"speed_kmph", traffic.speed_kmph},
            {"peak_hours", traffic.peak_hours},
            {"peak_multiplier", traffic.peak_multiplier},
            {"offpeak_multiplier", traffic.offpeak_multiplier},
            {"advance_clock", traffic.advance_clock},
            {"fuel_cost_per_km", cost.fuel_cost_per_km},
            {"co2_kg_per_km", cost.co2_kg_per_km}};
  }
};

inline EngineConfig EngineConfig::from_json(const nlohmann::json &j) {
  return from_json(j, EngineConfig{});
}
