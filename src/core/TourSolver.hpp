#pragma once
#include "core/Deadline.hpp"
#include "core/DistanceEngine.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct TwoOptStats {
  double initial_distance_km = 0.0;
  double optimized_distance_km = 0.0;
  double improvement_km = 0.0;
  double improvement_pct = 0.0;
  int passes = 0;
  int improvements = 0;
  bool converged = true;
  std::string stop_reason; // set when converged == false
};

// Internal depot-to-depot tour of one zone.
struct ZoneTour {
  int zone_id = 0;
  std::vector<int> stops; // depot, members..., depot
  double nn_distance_km = 0.0;
  double distance_km = 0.0;
  TwoOptStats stats;
};

struct RouteSolution {
  Route route;
  std::vector<int> zone_order; // zone ids in visiting order, empty zones left out
  std::vector<ZoneTour> zone_tours; // indexed like the input zones
  double distance_km = 0.0;
  int time_of_day = 0;
  bool converged = true;
  std::vector<NonConvergenceWarning> warnings;
};

struct SolverOptions {
  int max_2opt_passes = 1000;
  bool apply_2opt = true;
  bool polish_full_route = false;
  unsigned max_workers = 0; // 0 = hardware concurrency
  Deadline deadline;

  static SolverOptions from_config(const EngineConfig &cfg,
                                   Deadline deadline = Deadline{}) {
    SolverOptions o;
    o.max_2opt_passes = cfg.max_2opt_passes;
    o.polish_full_route = cfg.polish_full_route;
    o.max_workers = cfg.max_workers;
    o.deadline = deadline;
    return o;
  }
};

//------------------------------------------------------------------------------
// TourSolver: nearest-neighbour construction + first-improvement 2-opt, run per
// zone on a bounded pool of tasks, then over the zone centroids to order the
// zones.
//------------------------------------------------------------------------------
class TourSolver {
public:
  using index_t = std::size_t;

  explicit TourSolver(SolverOptions opts = SolverOptions{}) : opts_(opts) {}

  // Closed tour anchor -> members (greedy nearest, ties to lowest id) ->
  // anchor. Positions refer to `m`.
  static std::vector<index_t> nearest_neighbor(const DistanceMatrix &m,
                                               index_t anchor,
                                               std::vector<index_t> members);

  // Improves `tour` in place with both endpoints fixed. Never lengthens it.
  TwoOptStats two_opt(std::vector<index_t> &tour,
                      const DistanceMatrix &m) const;

  static double tour_length(const std::vector<index_t> &tour,
                            const DistanceMatrix &m);

  // Zones with one member skip both phases; empty zones give an empty tour.
  ZoneTour solve_zone(const Zone &zone, const DistanceMatrix &m,
                      int depot_id) const;

  // Visiting order of the non-empty zones, treating each as a node at its
  // centroid with the depot as anchor.
  std::vector<int> order_zones(const std::vector<Zone> &zones,
                               const Coordinate &depot,
                               std::vector<NonConvergenceWarning> &warnings) const;

  RouteSolution solve_route(const std::vector<Location> &locations,
                            const DistanceMatrix &m,
                            const std::vector<Zone> &zones,
                            int time_of_day) const;

  // Baselines for comparison reports.
  static Route naive_route(const std::vector<Location> &locations);
  static Route random_route(const std::vector<Location> &locations,
                            std::uint32_t seed);

  const SolverOptions &options() const noexcept { return opts_; }

private:
  SolverOptions opts_;

  std::vector<ZoneTour> solve_zones(const std::vector<Zone> &zones,
                                    const DistanceMatrix &m,
                                    int depot_id) const;
};

// Finds the single depot; zero or several depots throw ValidationError.
const Location &find_depot(const std::vector<Location> &locations);

inline void to_json(Json &j, const TwoOptStats &s) {
  j = Json{{"initial_distance_km", s.initial_distance_km},
           {"optimized_distance_km", s.optimized_distance_km},
           {"improvement_km", s.improvement_km},
           {"improvement_pct", s.improvement_pct},
           {"passes", s.passes},
           {"improvements", s.improvements},
           {"converged", s.converged}};
}

inline void to_json(Json &j, const ZoneTour &t) {
  j = Json{{"zone_id", t.zone_id},
           {"stops", t.stops},
           {"nn_distance_km", t.nn_distance_km},
           {"distance_km", t.distance_km},
           {"two_opt", t.stats}};
}

inline void to_json(Json &j, const RouteSolution &s) {
  j = Json{{"route", s.route},
           {"zone_order", s.zone_order},
           {"zone_tours", s.zone_tours},
           {"distance_km", s.distance_km},
           {"time_of_day", s.time_of_day},
           {"converged", s.converged},
           {"warnings", s.warnings}};
}
