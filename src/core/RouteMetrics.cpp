#include "core/RouteMetrics.hpp"
#include "core/TravelModel.hpp"
#include "models/Errors.hpp"
#include <cmath>
#include <string>
#include <unordered_map>

void validate_route(const Route &route, const DistanceMatrix &m) {
  const auto depot = m.depot_id();
  if (!depot)
    throw InvalidRouteError("location set has no depot");
  const auto &s = route.stops;
  if (s.size() < 2)
    throw InvalidRouteError("route must contain the depot at both ends");
  if (s.front() != *depot || s.back() != *depot)
    throw InvalidRouteError("route must start and end at depot " +
                            std::to_string(*depot));

  std::unordered_map<int, int> seen;
  for (std::size_t i = 1; i + 1 < s.size(); ++i) {
    if (s[i] == *depot)
      throw InvalidRouteError("depot appears inside the route at position " +
                              std::to_string(i));
    if (!m.contains(s[i]))
      throw InvalidRouteError("unknown location id " + std::to_string(s[i]));
    if (++seen[s[i]] > 1)
      throw InvalidRouteError("location " + std::to_string(s[i]) +
                              " visited more than once");
  }
  if (seen.size() != m.size() - 1)
    throw InvalidRouteError("route omits " +
                            std::to_string(m.size() - 1 - seen.size()) +
                            " stops");
}

double route_distance(const Route &route, const DistanceMatrix &m) {
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < route.stops.size(); ++i)
    total += m.between(route.stops[i], route.stops[i + 1]);
  return total;
}

RouteMetrics compute_metrics(const Route &route, const DistanceMatrix &m,
                             int time_of_day, const TrafficConfig &traffic,
                             const CostConfig &cost,
                             const std::vector<Location> *locations) {
  validate_route(route, m);
  if (time_of_day < 0 || time_of_day > 23)
    throw ValidationError("time_of_day must be an hour in 0-23, got " +
                          std::to_string(time_of_day));
  traffic.validate();
  cost.validate();

  RouteMetrics out;
  const auto &s = route.stops;
  out.segment_breakdown.reserve(s.size() - 1);
  double clock = 0.0; // minutes since departure
  for (std::size_t i = 0; i + 1 < s.size(); ++i) {
    RouteSegment seg;
    seg.from_id = s[i];
    seg.to_id = s[i + 1];
    seg.distance_km = m.between(seg.from_id, seg.to_id);
    int hour = time_of_day;
    if (traffic.advance_clock)
      hour = (time_of_day + static_cast<int>(std::floor(clock / 60.0))) % 24;
    seg.time_minutes =
        TravelModel::estimate_travel_time(seg.distance_km, hour, traffic);
    clock += seg.time_minutes;
    seg.arrival_minutes = clock;

    out.total_distance_km += seg.distance_km;
    out.total_time_minutes += seg.time_minutes;
    out.segment_breakdown.push_back(seg);
  }

  const TripCost trip = TravelModel::estimate_cost(out.total_distance_km, cost);
  out.fuel_cost = trip.fuel_cost;
  out.co2_kg = trip.co2_kg;
  out.num_stops = static_cast<int>(s.size()) - 2;
  if (out.num_stops > 0)
    out.avg_distance_per_stop_km = out.total_distance_km / out.num_stops;

  if (locations) {
    for (const auto &loc : *locations)
      if (!loc.is_depot)
        out.total_packages += loc.package_count;
  }
  return out;
}
