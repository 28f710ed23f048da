#pragma once
#include "models/params.hpp"
#include <string>

struct TripCost {
  double fuel_cost = 0.0;
  double co2_kg = 0.0;
};

// Converts distance into time, fuel and emissions. Stateless; the
// configuration is passed in on every call.
class TravelModel {
public:
  // Multiplier for an hour in 0..23; other hours throw ValidationError.
  static double traffic_multiplier(int hour, const TrafficConfig &cfg);

  // distance / speed, scaled by the hour's traffic multiplier, in minutes.
  static double estimate_travel_time(double distance_km, int hour,
                                     const TrafficConfig &cfg);

  static TripCost estimate_cost(double distance_km, const CostConfig &cfg);

  // "2h 30m", "45m"
  static std::string format_duration(double minutes);
};
