#include "core/TravelModel.hpp"
#include "models/Errors.hpp"
#include <cmath>

static void check_hour(int hour) {
  if (hour < 0 || hour > 23)
    throw ValidationError("time_of_day must be an hour in 0-23, got " +
                          std::to_string(hour));
}

static void check_distance(double distance_km) {
  if (!std::isfinite(distance_km) || distance_km < 0.0)
    throw ValidationError("distance must be non-negative");
}

double TravelModel::traffic_multiplier(int hour, const TrafficConfig &cfg) {
  check_hour(hour);
  return cfg.peak_hours.count(hour) ? cfg.peak_multiplier
                                    : cfg.offpeak_multiplier;
}

double TravelModel::estimate_travel_time(double distance_km, int hour,
                                         const TrafficConfig &cfg) {
  check_distance(distance_km);
  const double multiplier = traffic_multiplier(hour, cfg);
  if (cfg.speed_kmph <= 0.0)
    throw ValidationError("speed_kmph must be positive");
  return distance_km / cfg.speed_kmph * 60.0 * multiplier;
}

TripCost TravelModel::estimate_cost(double distance_km, const CostConfig &cfg) {
  check_distance(distance_km);
  return {distance_km * cfg.fuel_cost_per_km, distance_km * cfg.co2_kg_per_km};
}

std::string TravelModel::format_duration(double minutes) {
  if (!std::isfinite(minutes) || minutes < 0.0)
    minutes = 0.0;
  const long total = static_cast<long>(minutes);
  const long h = total / 60;
  const long m = total % 60;
  if (h > 0)
    return std::to_string(h) + "h " + std::to_string(m) + "m";
  return std::to_string(m) + "m";
}
