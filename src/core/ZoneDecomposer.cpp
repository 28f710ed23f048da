// ZoneDecomposer partitions the delivery stops into k geographic zones.

#include "core/ZoneDecomposer.hpp"
#include "core/DistanceEngine.hpp"
#include "models/Errors.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <set>
#include <string>

static inline double sq_dist(const Coordinate &a, const Coordinate &b) {
  const double dlat = a.lat - b.lat;
  const double dlon = a.lon - b.lon;
  return dlat * dlat + dlon * dlon;
}

static inline bool same_point(const Coordinate &a, const Coordinate &b) {
  return a.lat == b.lat && a.lon == b.lon;
}

// k-means++: first centre uniform, the rest drawn proportional to the squared
// distance from the nearest centre already chosen.
std::vector<Coordinate>
ZoneDecomposer::seed_plus_plus(const std::vector<Coordinate> &pts, int k,
                               std::uint32_t seed) {
  const std::size_t n = pts.size();
  std::mt19937 rng(seed);
  std::vector<Coordinate> centroids;
  centroids.reserve(k);
  std::vector<bool> used(n, false);

  const std::size_t first = rng() % n;
  used[first] = true;
  centroids.push_back(pts[first]);

  std::vector<double> d2(n);
  for (std::size_t i = 0; i < n; ++i)
    d2[i] = sq_dist(pts[i], pts[first]);

  while ((int)centroids.size() < k) {
    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      total += d2[i];

    std::size_t pick = n;
    if (total > 0.0) {
      // manual draw so the sequence does not depend on the library's
      // distribution implementation
      const double r = (static_cast<double>(rng()) / 4294967296.0) * total;
      double cum = 0.0;
      for (std::size_t i = 0; i < n; ++i) {
        if (d2[i] <= 0.0)
          continue;
        cum += d2[i];
        pick = i;
        if (cum > r)
          break;
      }
    } else {
      // every remaining point coincides with a centre
      for (std::size_t i = 0; i < n; ++i)
        if (!used[i]) {
          pick = i;
          break;
        }
    }
    if (pick == n)
      pick = 0; // unreachable while k <= n
    used[pick] = true;
    centroids.push_back(pts[pick]);
    for (std::size_t i = 0; i < n; ++i)
      d2[i] = std::min(d2[i], sq_dist(pts[i], pts[pick]));
  }
  return centroids;
}

// First k distinct coordinates in id order, topped up with duplicates when
// there are fewer than k distinct points.
std::vector<Coordinate>
ZoneDecomposer::seed_first_k(const std::vector<Coordinate> &pts, int k) {
  std::vector<Coordinate> centroids;
  std::vector<bool> used(pts.size(), false);
  for (std::size_t i = 0; i < pts.size() && (int)centroids.size() < k; ++i) {
    bool dup = false;
    for (const auto &c : centroids)
      if (same_point(c, pts[i])) {
        dup = true;
        break;
      }
    if (!dup) {
      centroids.push_back(pts[i]);
      used[i] = true;
    }
  }
  for (std::size_t i = 0; i < pts.size() && (int)centroids.size() < k; ++i)
    if (!used[i])
      centroids.push_back(pts[i]);
  return centroids;
}

int ZoneDecomposer::assign(const std::vector<Coordinate> &pts,
                           const std::vector<Coordinate> &centroids,
                           std::vector<int> &assignment) {
  int changed = 0;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    int best = 0;
    double best_d = sq_dist(pts[i], centroids[0]);
    for (std::size_t c = 1; c < centroids.size(); ++c) {
      const double d = sq_dist(pts[i], centroids[c]);
      if (d < best_d) { // strict: ties stay with the lower index
        best_d = d;
        best = (int)c;
      }
    }
    if (assignment[i] != best) {
      assignment[i] = best;
      ++changed;
    }
  }
  return changed;
}

void ZoneDecomposer::update(const std::vector<Coordinate> &pts,
                            const std::vector<int> &assignment,
                            std::vector<Coordinate> &centroids,
                            bool allow_reseed) const {
  const std::size_t k = centroids.size();
  std::vector<double> sum_lat(k, 0.0), sum_lon(k, 0.0);
  std::vector<int> count(k, 0);
  for (std::size_t i = 0; i < pts.size(); ++i) {
    sum_lat[assignment[i]] += pts[i].lat;
    sum_lon[assignment[i]] += pts[i].lon;
    ++count[assignment[i]];
  }
  for (std::size_t c = 0; c < k; ++c)
    if (count[c] > 0)
      centroids[c] = {sum_lat[c] / count[c], sum_lon[c] / count[c]};

  if (!allow_reseed || !opts_.reseed_empty)
    return;

  // move each empty centre onto the member farthest from its own centre,
  // taken from a zone that can spare it; a point sitting on a centre would
  // lose the tie on the next assignment, so it is never a candidate
  std::vector<bool> taken(pts.size(), false);
  auto on_a_centre = [&](const Coordinate &p) {
    for (const auto &c : centroids)
      if (same_point(c, p))
        return true;
    return false;
  };
  for (std::size_t c = 0; c < k; ++c) {
    if (count[c] > 0)
      continue;
    std::size_t far = pts.size();
    double far_d = -1.0;
    for (std::size_t i = 0; i < pts.size(); ++i) {
      if (taken[i] || count[assignment[i]] < 2 || on_a_centre(pts[i]))
        continue;
      const double d = sq_dist(pts[i], centroids[assignment[i]]);
      if (d > far_d) {
        far_d = d;
        far = i;
      }
    }
    if (far == pts.size())
      continue;
    taken[far] = true;
    --count[assignment[far]];
    centroids[c] = pts[far];
  }
}

ZonePartition ZoneDecomposer::decompose(const std::vector<Location> &locations,
                                        int k, std::uint32_t seed) const {
  std::vector<const Location *> members;
  members.reserve(locations.size());
  std::set<int> seen;
  for (const auto &loc : locations) {
    validate_coordinate(loc.lat, loc.lon);
    if (!seen.insert(loc.id).second)
      throw ValidationError("duplicate location id " + std::to_string(loc.id));
    if (!loc.is_depot)
      members.push_back(&loc);
  }
  const int n = (int)members.size();
  if (k < 1 || k > n)
    throw ValidationError("k must satisfy 1 <= k <= " + std::to_string(n) +
                          ", got " + std::to_string(k));
  if (opts_.max_iterations < 1)
    throw ValidationError("max_kmeans_iterations must be >= 1");

  std::sort(members.begin(), members.end(),
            [](const Location *a, const Location *b) { return a->id < b->id; });
  std::vector<Coordinate> pts;
  pts.reserve(n);
  for (const auto *m : members)
    pts.push_back(m->coord());

  std::vector<Coordinate> centroids = opts_.init == KMeansInit::PlusPlus
                                          ? seed_plus_plus(pts, k, seed)
                                          : seed_first_k(pts, k);

  ZonePartition out;
  std::vector<int> assignment(n, -1);
  assign(pts, centroids, assignment);

  out.converged = false;
  while (true) {
    if (out.iterations >= opts_.max_iterations) {
      out.warnings.push_back({"kmeans", out.iterations,
                              "iteration cap reached before convergence"});
      break;
    }
    if (opts_.deadline.expired()) {
      out.warnings.push_back(
          {"kmeans", out.iterations, "time budget exhausted"});
      break;
    }
    ++out.iterations;
    update(pts, assignment, centroids, /*allow_reseed=*/true);
    if (assign(pts, centroids, assignment) == 0) {
      out.converged = true;
      break;
    }
  }
  // keep reported centroids consistent with the returned membership
  update(pts, assignment, centroids, /*allow_reseed=*/false);

  for (const auto &w : out.warnings)
    std::cerr << "[WARN] [zones] " << w.reason << " after " << w.iterations
              << " iterations (k=" << k << ", n=" << n << ")\n";

  out.zones.resize(k);
  for (int c = 0; c < k; ++c) {
    out.zones[c].zone_id = c;
    out.zones[c].centroid = centroids[c];
  }
  for (int i = 0; i < n; ++i)
    out.zones[assignment[i]].member_ids.push_back(members[i]->id);
  return out;
}
