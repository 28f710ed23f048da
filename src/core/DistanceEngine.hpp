#pragma once
#include "models/CoreTypes.hpp"
#include <optional>
#include <unordered_map>
#include <vector>

constexpr double EARTH_RADIUS_KM = 6371.0;

// Great-circle distance in km. Throws ValidationError on out-of-range input.
double haversine_distance(double lat1, double lon1, double lat2, double lon2);
double haversine_distance(const Coordinate &a, const Coordinate &b);

// Throws ValidationError unless lat in [-90,90] and lon in [-180,180].
void validate_coordinate(double lat, double lon);

// Symmetric, zero-diagonal pairwise distance table. Built once per location
// set and shared read-only afterwards.
class DistanceMatrix {
public:
  DistanceMatrix() = default;

  // Positions follow `ids`; ids must be unique.
  DistanceMatrix(std::vector<int> ids, const std::vector<Coordinate> &coords,
                 std::optional<int> depot_id = std::nullopt);

  std::size_t size() const noexcept { return ids_.size(); }
  const std::vector<int> &ids() const noexcept { return ids_; }
  std::optional<int> depot_id() const noexcept { return depot_id_; }

  // By position.
  double at(std::size_t i, std::size_t j) const { return d_[i * n_ + j]; }
  // By location id; unknown ids throw ValidationError.
  double between(int id_a, int id_b) const {
    return at(index_of(id_a), index_of(id_b));
  }

  std::size_t index_of(int id) const;
  bool contains(int id) const { return index_.count(id) != 0; }

  // Rows in position order, for serialisation.
  std::vector<std::vector<double>> rows() const;

private:
  std::size_t n_ = 0;
  std::vector<int> ids_;
  std::unordered_map<int, std::size_t> index_;
  std::vector<double> d_; // row-major n_*n_
  std::optional<int> depot_id_;
};

// All pairwise haversine distances for `locations`. Fewer than two locations
// throws InsufficientDataError; duplicate ids throw ValidationError.
DistanceMatrix build_distance_matrix(const std::vector<Location> &locations);
