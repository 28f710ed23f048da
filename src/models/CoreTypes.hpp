#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Json = nlohmann::json;

// Basic spatial coordinate (degrees).
struct Coordinate {
  double lat = 0.0;
  double lon = 0.0;
};

// A delivery stop or the depot, as resolved by the loader.
struct Location {
  int id = 0;
  std::string name;
  double lat = 0.0;
  double lon = 0.0;
  std::string locality;
  int package_count = 0;
  bool is_depot = false;

  Coordinate coord() const { return {lat, lon}; }
};

// A geographic cluster of stops solved as one sub-tour. The depot is never a
// member.
struct Zone {
  int zone_id = 0;
  std::vector<int> member_ids; // ascending
  Coordinate centroid;
};

// Ordered stop ids; depot at both ends.
struct Route {
  std::vector<int> stops;
};

struct RouteSegment {
  int from_id = 0;
  int to_id = 0;
  double distance_km = 0.0;
  double time_minutes = 0.0;
  double arrival_minutes = 0.0; // cumulative since departure
};

struct RouteMetrics {
  double total_distance_km = 0.0;
  double total_time_minutes = 0.0;
  double fuel_cost = 0.0;
  double co2_kg = 0.0;
  int num_stops = 0; // excludes the depot
  double avg_distance_per_stop_km = 0.0;
  int total_packages = 0;
  std::vector<RouteSegment> segment_breakdown;
};

// Raised (as a value, not an exception) when clustering or 2-opt stops on an
// iteration cap or time budget.
struct NonConvergenceWarning {
  std::string stage; // "kmeans", "2opt", "zone_order", "polish"
  int iterations = 0;
  std::string reason;
};

// Define from_json()/to_json() overloads for structs to work with json::get()

// --- Coordinate ----
inline void to_json(Json &j, const Coordinate &c) {
  j = Json{{"lat", c.lat}, {"lon", c.lon}};
}
inline void from_json(const Json &j, Coordinate &c) {
  c.lat = j.at("lat").get<double>();
  // the dashboard exports "lng", the engine writes "lon"
  c.lon = j.contains("lon") ? j.at("lon").get<double>()
                            : j.at("lng").get<double>();
}

// --- Location ----
inline void from_json(const Json &j, Location &l) {
  l.id = j.at("id").get<int>();
  l.name = j.value("name", "");
  l.lat = j.at("lat").get<double>();
  l.lon = j.contains("lon") ? j.at("lon").get<double>()
                            : j.at("lng").get<double>();
  l.locality = j.value("locality", "");
  l.package_count = j.value("package_count", 0);
  l.is_depot = j.value("is_depot", false);
}
inline void to_json(Json &j, const Location &l) {
  j = Json{{"id", l.id},
           {"name", l.name},
           {"lat", l.lat},
           {"lon", l.lon},
           {"locality", l.locality},
           {"package_count", l.package_count},
           {"is_depot", l.is_depot}};
}

// --- Zone ----
inline void to_json(Json &j, const Zone &z) {
  j = Json{{"zone_id", z.zone_id},
           {"member_ids", z.member_ids},
           {"centroid", z.centroid}};
}

// --- Route ----
inline void from_json(const Json &j, Route &r) {
  r.stops.clear();
  // accept either a bare id array or {"stops": [...]}
  const Json &arr = j.is_array() ? j : j.at("stops");
  for (const auto &id : arr)
    r.stops.push_back(id.get<int>());
}
inline void to_json(Json &j, const Route &r) { j = r.stops; }

// --- Metrics ----
inline void to_json(Json &j, const RouteSegment &s) {
  j = Json{{"from_id", s.from_id},
           {"to_id", s.to_id},
           {"distance_km", s.distance_km},
           {"time_minutes", s.time_minutes},
           {"arrival_minutes", s.arrival_minutes}};
}
inline void to_json(Json &j, const RouteMetrics &m) {
  j = Json{{"total_distance_km", m.total_distance_km},
           {"total_time_minutes", m.total_time_minutes},
           {"fuel_cost", m.fuel_cost},
           {"co2_kg", m.co2_kg},
           {"num_stops", m.num_stops},
           {"avg_distance_per_stop_km", m.avg_distance_per_stop_km},
           {"total_packages", m.total_packages},
           {"segment_breakdown", m.segment_breakdown}};
}

inline void to_json(Json &j, const NonConvergenceWarning &w) {
  j = Json{
      {"stage", w.stage}, {"iterations", w.iterations}, {"reason", w.reason}};
}
