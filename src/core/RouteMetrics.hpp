#pragma once
#include "core/DistanceEngine.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>

// Throws InvalidRouteError unless `route` starts and ends at the matrix's
// depot and visits every other matrix id exactly once.
void validate_route(const Route &route, const DistanceMatrix &m);

// Sum of matrix distances over consecutive stops.
double route_distance(const Route &route, const DistanceMatrix &m);

// Walks the route edge by edge (closing edge included) and aggregates
// distance, time, fuel and CO2. `locations`, when given, supplies package
// counts.
RouteMetrics compute_metrics(const Route &route, const DistanceMatrix &m,
                             int time_of_day, const TrafficConfig &traffic,
                             const CostConfig &cost,
                             const std::vector<Location> *locations = nullptr);
