#pragma once
#include "core/Deadline.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <cstdint>
#include <utility>
#include <vector>

struct ZoneOptions {
  int max_iterations = 100;
  KMeansInit init = KMeansInit::PlusPlus;
  bool reseed_empty = false;
  Deadline deadline;
};

struct ZonePartition {
  std::vector<Zone> zones; // exactly k, zone_id == index
  int iterations = 0;
  bool converged = true;
  std::vector<NonConvergenceWarning> warnings;
};

inline void to_json(Json &j, const ZonePartition &p) {
  j = Json{{"zones", p.zones},
           {"iterations", p.iterations},
           {"converged", p.converged},
           {"warnings", p.warnings}};
}

//------------------------------------------------------------------------------
// ZoneDecomposer: Lloyd's k-means over (lat, lon) of the non-depot stops.
//------------------------------------------------------------------------------
// Seeding is driven by an explicit seed so identical (locations, k, seed)
// always give the identical partition. Members are handled in ascending id;
// assignment ties go to the lowest centroid index.
class ZoneDecomposer {
public:
  explicit ZoneDecomposer(ZoneOptions opts = ZoneOptions{})
      : opts_(std::move(opts)) {}

  // Throws ValidationError unless 1 <= k <= number of non-depot locations.
  ZonePartition decompose(const std::vector<Location> &locations, int k,
                          std::uint32_t seed) const;

  const ZoneOptions &options() const noexcept { return opts_; }

private:
  ZoneOptions opts_;

  static std::vector<Coordinate>
  seed_plus_plus(const std::vector<Coordinate> &pts, int k,
                 std::uint32_t seed);
  static std::vector<Coordinate> seed_first_k(const std::vector<Coordinate> &pts,
                                              int k);
  // Returns how many members changed zone.
  static int assign(const std::vector<Coordinate> &pts,
                    const std::vector<Coordinate> &centroids,
                    std::vector<int> &assignment);
  void update(const std::vector<Coordinate> &pts,
              const std::vector<int> &assignment,
              std::vector<Coordinate> &centroids, bool allow_reseed) const;
};
