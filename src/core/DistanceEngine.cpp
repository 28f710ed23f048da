// Distance engine: haversine and the shared pairwise matrix.

#include "core/DistanceEngine.hpp"
#include "models/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

void validate_coordinate(double lat, double lon) {
  if (!std::isfinite(lat) || lat < -90.0 || lat > 90.0)
    throw ValidationError("latitude out of range: " + std::to_string(lat));
  if (!std::isfinite(lon) || lon < -180.0 || lon > 180.0)
    throw ValidationError("longitude out of range: " + std::to_string(lon));
}

double haversine_distance(double lat1, double lon1, double lat2,
                          double lon2) {
  validate_coordinate(lat1, lon1);
  validate_coordinate(lat2, lon2);
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_lambda = (lon2 - lon1) * (M_PI / 180);
  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_lambda / 2), 2);
  // rounding can push h a hair past 1 for antipodal points
  h = std::min(1.0, std::max(0.0, h));
  return 2 * EARTH_RADIUS_KM * std::asin(std::sqrt(h));
}

double haversine_distance(const Coordinate &a, const Coordinate &b) {
  return haversine_distance(a.lat, a.lon, b.lat, b.lon);
}

DistanceMatrix::DistanceMatrix(std::vector<int> ids,
                               const std::vector<Coordinate> &coords,
                               std::optional<int> depot_id)
    : n_(ids.size()), ids_(std::move(ids)), depot_id_(depot_id) {
  if (coords.size() != n_)
    throw ValidationError("ids/coordinates size mismatch");
  for (std::size_t i = 0; i < n_; ++i) {
    if (!index_.emplace(ids_[i], i).second)
      throw ValidationError("duplicate location id " +
                            std::to_string(ids_[i]));
    validate_coordinate(coords[i].lat, coords[i].lon);
  }
  if (depot_id_ && !index_.count(*depot_id_))
    throw ValidationError("depot id not among locations");

  d_.assign(n_ * n_, 0.0);
  // compute the upper triangle once and mirror it so symmetry is exact
  for (std::size_t i = 0; i < n_; ++i) {
    for (std::size_t j = i + 1; j < n_; ++j) {
      const double km = haversine_distance(coords[i], coords[j]);
      d_[i * n_ + j] = km;
      d_[j * n_ + i] = km;
    }
  }
}

std::size_t DistanceMatrix::index_of(int id) const {
  auto it = index_.find(id);
  if (it == index_.end())
    throw ValidationError("unknown location id " + std::to_string(id));
  return it->second;
}

std::vector<std::vector<double>> DistanceMatrix::rows() const {
  std::vector<std::vector<double>> out(n_);
  for (std::size_t i = 0; i < n_; ++i)
    out[i].assign(d_.begin() + i * n_, d_.begin() + (i + 1) * n_);
  return out;
}

DistanceMatrix build_distance_matrix(const std::vector<Location> &locations) {
  if (locations.size() < 2)
    throw InsufficientDataError("need at least 2 locations, got " +
                                std::to_string(locations.size()));
  std::vector<int> ids;
  std::vector<Coordinate> coords;
  ids.reserve(locations.size());
  coords.reserve(locations.size());
  std::optional<int> depot;
  for (const auto &loc : locations) {
    if (loc.is_depot) {
      if (depot)
        throw ValidationError("more than one depot (ids " +
                              std::to_string(*depot) + ", " +
                              std::to_string(loc.id) + ")");
      depot = loc.id;
    }
    ids.push_back(loc.id);
    coords.push_back(loc.coord());
  }
  return DistanceMatrix(std::move(ids), coords, depot);
}
