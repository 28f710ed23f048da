// TourSolver builds and improves the visiting order within and across zones.

#include "core/TourSolver.hpp"
#include "models/Errors.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <limits>
#include <random>
#include <set>
#include <thread>
#include <unordered_map>

// moves must shorten the tour by more than this (km) to be applied
static constexpr double kImproveEps = 1e-9;

const Location &find_depot(const std::vector<Location> &locations) {
  const Location *depot = nullptr;
  for (const auto &loc : locations) {
    if (!loc.is_depot)
      continue;
    if (depot)
      throw ValidationError("more than one depot (ids " +
                            std::to_string(depot->id) + ", " +
                            std::to_string(loc.id) + ")");
    depot = &loc;
  }
  if (!depot)
    throw ValidationError("no depot among locations");
  return *depot;
}

double TourSolver::tour_length(const std::vector<index_t> &tour,
                               const DistanceMatrix &m) {
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < tour.size(); ++i)
    total += m.at(tour[i], tour[i + 1]);
  return total;
}

std::vector<TourSolver::index_t>
TourSolver::nearest_neighbor(const DistanceMatrix &m, index_t anchor,
                             std::vector<index_t> members) {
  const auto &ids = m.ids();
  std::sort(members.begin(), members.end(),
            [&](index_t a, index_t b) { return ids[a] < ids[b]; });

  std::vector<index_t> tour;
  tour.reserve(members.size() + 2);
  tour.push_back(anchor);
  std::vector<bool> visited(members.size(), false);
  index_t current = anchor;
  for (std::size_t step = 0; step < members.size(); ++step) {
    std::size_t best = members.size();
    double best_d = std::numeric_limits<double>::infinity();
    for (std::size_t k = 0; k < members.size(); ++k) {
      if (visited[k])
        continue;
      const double d = m.at(current, members[k]);
      if (d < best_d) { // strict: members are in id order
        best_d = d;
        best = k;
      }
    }
    visited[best] = true;
    current = members[best];
    tour.push_back(current);
  }
  tour.push_back(anchor);
  return tour;
}

TwoOptStats TourSolver::two_opt(std::vector<index_t> &tour,
                                const DistanceMatrix &m) const {
  TwoOptStats s;
  s.initial_distance_km = tour_length(tour, m);
  s.optimized_distance_km = s.initial_distance_km;
  const std::size_t n = tour.size();
  // anchor, a, b, anchor: the only reversal keeps the length
  if (n < 5)
    return s;

  s.converged = false;
  while (s.passes < opts_.max_2opt_passes) {
    if (opts_.deadline.expired()) {
      s.stop_reason = "time budget exhausted";
      break;
    }
    ++s.passes;
    bool improved = false;
    // edges (i-1, i) and (j, j+1); reversing [i, j] swaps them for
    // (i-1, j) and (i, j+1)
    for (std::size_t i = 1; i + 2 < n; ++i) {
      for (std::size_t j = i + 1; j + 1 < n; ++j) {
        const index_t a = tour[i - 1], b = tour[i];
        const index_t c = tour[j], e = tour[j + 1];
        const double delta =
            m.at(a, c) + m.at(b, e) - m.at(a, b) - m.at(c, e);
        if (delta < -kImproveEps) {
          std::reverse(tour.begin() + i, tour.begin() + j + 1);
          ++s.improvements;
          improved = true;
        }
      }
    }
    if (!improved) {
      s.converged = true;
      break;
    }
  }
  if (!s.converged && s.stop_reason.empty())
    s.stop_reason = "pass cap reached before convergence";

  s.optimized_distance_km = tour_length(tour, m);
  s.improvement_km = s.initial_distance_km - s.optimized_distance_km;
  if (s.initial_distance_km > 0.0)
    s.improvement_pct = s.improvement_km / s.initial_distance_km * 100.0;
  return s;
}

ZoneTour TourSolver::solve_zone(const Zone &zone, const DistanceMatrix &m,
                                int depot_id) const {
  ZoneTour out;
  out.zone_id = zone.zone_id;
  if (zone.member_ids.empty())
    return out;

  const index_t depot = m.index_of(depot_id);
  std::vector<index_t> members;
  members.reserve(zone.member_ids.size());
  for (int id : zone.member_ids)
    members.push_back(m.index_of(id));

  std::vector<index_t> tour;
  if (members.size() == 1) {
    tour = {depot, members.front(), depot};
    out.nn_distance_km = tour_length(tour, m);
    out.stats.initial_distance_km = out.nn_distance_km;
    out.stats.optimized_distance_km = out.nn_distance_km;
  } else {
    tour = nearest_neighbor(m, depot, members);
    out.nn_distance_km = tour_length(tour, m);
    if (opts_.apply_2opt) {
      out.stats = two_opt(tour, m);
    } else {
      out.stats.initial_distance_km = out.nn_distance_km;
      out.stats.optimized_distance_km = out.nn_distance_km;
    }
  }
  out.distance_km = tour_length(tour, m);
  out.stops.reserve(tour.size());
  for (index_t idx : tour)
    out.stops.push_back(m.ids()[idx]);
  return out;
}

// Fan-out/join: a bounded set of tasks pulls zone indices from a shared
// counter; each zone's tour is written only by the task that took it.
std::vector<ZoneTour> TourSolver::solve_zones(const std::vector<Zone> &zones,
                                              const DistanceMatrix &m,
                                              int depot_id) const {
  std::vector<ZoneTour> tours(zones.size());
  std::vector<std::size_t> work;
  for (std::size_t z = 0; z < zones.size(); ++z) {
    tours[z].zone_id = zones[z].zone_id;
    if (!zones[z].member_ids.empty())
      work.push_back(z);
  }
  if (work.empty())
    return tours;

  unsigned workers = opts_.max_workers;
  if (workers == 0)
    workers = std::max(1u, std::thread::hardware_concurrency());
  workers = std::min<unsigned>(workers, (unsigned)work.size());

  std::atomic<std::size_t> next{0};
  auto run = [&]() {
    for (std::size_t w = next.fetch_add(1); w < work.size();
         w = next.fetch_add(1))
      tours[work[w]] = solve_zone(zones[work[w]], m, depot_id);
  };

  if (workers == 1) {
    run();
    return tours;
  }

  std::vector<std::future<void>> futures;
  futures.reserve(workers);
  for (unsigned t = 0; t < workers; ++t)
    futures.push_back(std::async(std::launch::async, run));

  // join every task before reporting the first failure
  std::exception_ptr first_error;
  for (auto &f : futures) {
    try {
      f.get();
    } catch (...) {
      if (!first_error)
        first_error = std::current_exception();
    }
  }
  if (first_error)
    std::rethrow_exception(first_error);
  return tours;
}

std::vector<int>
TourSolver::order_zones(const std::vector<Zone> &zones, const Coordinate &depot,
                        std::vector<NonConvergenceWarning> &warnings) const {
  // nodes are keyed by position: 0 is the depot, 1..n the non-empty zones in
  // input order, so any zone id (negative included) is accepted
  std::vector<int> zone_ids{0};
  std::vector<Coordinate> coords{depot};
  for (const auto &z : zones) {
    if (z.member_ids.empty())
      continue;
    zone_ids.push_back(z.zone_id);
    coords.push_back(z.centroid);
  }
  if (zone_ids.size() == 1)
    return {};
  if (zone_ids.size() == 2)
    return {zone_ids[1]};

  std::vector<int> nodes(zone_ids.size());
  for (std::size_t i = 0; i < nodes.size(); ++i)
    nodes[i] = static_cast<int>(i);
  DistanceMatrix cm(nodes, coords);
  std::vector<index_t> members;
  for (index_t i = 1; i < nodes.size(); ++i)
    members.push_back(i);
  auto tour = nearest_neighbor(cm, 0, members);
  if (opts_.apply_2opt) {
    const auto s = two_opt(tour, cm);
    if (!s.converged)
      warnings.push_back({"zone_order", s.passes, s.stop_reason});
  }

  std::vector<int> order;
  for (std::size_t i = 1; i + 1 < tour.size(); ++i)
    order.push_back(zone_ids[tour[i]]);
  return order;
}

RouteSolution TourSolver::solve_route(const std::vector<Location> &locations,
                                      const DistanceMatrix &m,
                                      const std::vector<Zone> &zones,
                                      int time_of_day) const {
  if (time_of_day < 0 || time_of_day > 23)
    throw ValidationError("time_of_day must be an hour in 0-23, got " +
                          std::to_string(time_of_day));
  const Location &depot = find_depot(locations);

  if (m.size() != locations.size())
    throw ValidationError("distance matrix does not match the location set");
  std::set<int> stops;
  for (const auto &loc : locations) {
    if (!m.contains(loc.id))
      throw ValidationError("distance matrix has no entry for location " +
                            std::to_string(loc.id));
    if (!loc.is_depot)
      stops.insert(loc.id);
  }
  if (stops.empty())
    throw InsufficientDataError("no delivery stops to route");

  // zones must partition the stops
  std::set<int> covered;
  std::unordered_map<int, std::size_t> zone_index;
  for (std::size_t z = 0; z < zones.size(); ++z) {
    if (!zone_index.emplace(zones[z].zone_id, z).second)
      throw ValidationError("duplicate zone id " +
                            std::to_string(zones[z].zone_id));
    for (int id : zones[z].member_ids) {
      if (!stops.count(id))
        throw ValidationError("zone " + std::to_string(zones[z].zone_id) +
                              " names " + std::to_string(id) +
                              ", which is not a delivery stop");
      if (!covered.insert(id).second)
        throw ValidationError("stop " + std::to_string(id) +
                              " is in more than one zone");
    }
  }
  if (covered.size() != stops.size())
    throw ValidationError(std::to_string(stops.size() - covered.size()) +
                          " stops are not in any zone");

  RouteSolution out;
  out.time_of_day = time_of_day;
  out.zone_tours = solve_zones(zones, m, depot.id);
  for (const auto &t : out.zone_tours)
    if (!t.stats.converged)
      out.warnings.push_back({"2opt", t.stats.passes,
                              t.stats.stop_reason + " (zone " +
                                  std::to_string(t.zone_id) + ")"});

  out.zone_order = order_zones(zones, depot.coord(), out.warnings);

  // splice zone interiors in order, flipping an interior when its far end is
  // strictly closer to the previous stop
  std::vector<index_t> full{m.index_of(depot.id)};
  for (int zid : out.zone_order) {
    const auto &stops_in_zone = out.zone_tours[zone_index.at(zid)].stops;
    std::vector<index_t> interior;
    for (std::size_t i = 1; i + 1 < stops_in_zone.size(); ++i)
      interior.push_back(m.index_of(stops_in_zone[i]));
    if (interior.empty())
      continue;
    const index_t prev = full.back();
    if (m.at(prev, interior.back()) < m.at(prev, interior.front()) - kImproveEps)
      std::reverse(interior.begin(), interior.end());
    full.insert(full.end(), interior.begin(), interior.end());
  }
  full.push_back(full.front());

  if (opts_.polish_full_route && opts_.apply_2opt) {
    const auto s = two_opt(full, m);
    if (!s.converged)
      out.warnings.push_back({"polish", s.passes, s.stop_reason});
  }

  out.distance_km = tour_length(full, m);
  out.route.stops.reserve(full.size());
  for (index_t idx : full)
    out.route.stops.push_back(m.ids()[idx]);

  out.converged = out.warnings.empty();
  for (const auto &w : out.warnings)
    std::cerr << "[WARN] [tour] " << w.stage << ": " << w.reason << " after "
              << w.iterations << " passes\n";
  return out;
}

Route TourSolver::naive_route(const std::vector<Location> &locations) {
  const Location &depot = find_depot(locations);
  Route r;
  r.stops.push_back(depot.id);
  for (const auto &loc : locations)
    if (!loc.is_depot)
      r.stops.push_back(loc.id);
  r.stops.push_back(depot.id);
  return r;
}

Route TourSolver::random_route(const std::vector<Location> &locations,
                               std::uint32_t seed) {
  Route r = naive_route(locations);
  // Fisher-Yates over the interior with a fixed generator so the order is the
  // same on every platform
  std::mt19937 rng(seed);
  for (std::size_t i = r.stops.size() - 2; i > 1; --i) {
    const std::size_t j = 1 + rng() % i; // j in [1, i]
    std::swap(r.stops[i], r.stops[j]);
  }
  return r;
}
