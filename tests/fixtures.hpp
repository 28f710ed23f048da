#pragma once
#include "models/CoreTypes.hpp"
#include <random>
#include <string>
#include <vector>

// Small location sets shared by the test suites. Coordinates are around the
// Hitech City depot used in the dashboard sample data.

inline Location make_location(int id, double lat, double lon,
                              bool depot = false, int packages = 1) {
  Location l;
  l.id = id;
  l.name = depot ? "Warehouse" : "Customer " + std::to_string(id);
  l.lat = lat;
  l.lon = lon;
  l.locality = depot ? "Warehouse" : "Test";
  l.package_count = depot ? 0 : packages;
  l.is_depot = depot;
  return l;
}

inline std::vector<Location> hyderabad_locations() {
  return {make_location(0, 17.4485, 78.3908, true),
          make_location(1, 17.4400, 78.3811, false, 2),
          make_location(2, 17.4239, 78.3460, false, 3),
          make_location(3, 17.4609, 78.3671, false, 1),
          make_location(4, 17.4950, 78.3595, false, 2)};
}

// Depot plus `n` stops due north of it, roughly 1.1 km apart.
inline std::vector<Location> line_locations(int n) {
  std::vector<Location> out{make_location(0, 17.0, 78.0, true)};
  for (int i = 1; i <= n; ++i)
    out.push_back(make_location(i, 17.0 + 0.01 * i, 78.0));
  return out;
}

// Depot at the centre plus `n` stops scattered in a ~20 km box.
inline std::vector<Location> scattered_locations(int n, unsigned seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> jitter(-0.1, 0.1);
  std::vector<Location> out{make_location(0, 17.40, 78.40, true)};
  for (int i = 1; i <= n; ++i)
    out.push_back(make_location(i, 17.40 + jitter(rng), 78.40 + jitter(rng)));
  return out;
}
