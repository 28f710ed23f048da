#pragma once
#include "core/MatrixCache.hpp"
#include "core/RouteMetrics.hpp"
#include "core/TourSolver.hpp"
#include "core/ZoneDecomposer.hpp"
#include "models/params.hpp"
#include <memory>
#include <optional>
#include <string>

enum class Method { Naive, Random, NearestNeighbor, NearestNeighbor2Opt };

// "naive", "random", "nn", "nn_2opt"; anything else throws ValidationError.
Method method_from_string(const std::string &s);
const char *method_name(Method m);
const char *method_label(Method m); // human readable

struct OptimizationResult {
  Method method = Method::NearestNeighbor2Opt;
  Route route;
  RouteMetrics metrics;
  std::optional<ZonePartition> partition; // zoned methods only
  std::optional<RouteSolution> solution;  // zoned methods only
  std::string matrix_fingerprint;
  int time_of_day = 0;
  bool converged = true;
  std::vector<NonConvergenceWarning> warnings;
  double elapsed_ms = 0.0;
};

struct Improvement {
  double km_saved = 0.0;
  double percent = 0.0;
};

struct RouteComparison {
  OptimizationResult naive;
  OptimizationResult nearest_neighbor;
  OptimizationResult optimized;
  Improvement nn_vs_naive;
  Improvement opt_vs_naive;
  Improvement opt_vs_nn;
};

//------------------------------------------------------------------------------
// RouteOptimizer: cache lookup -> zones -> tours -> metrics
//------------------------------------------------------------------------------
class RouteOptimizer {
public:
  explicit RouteOptimizer(EngineConfig cfg = EngineConfig{},
                          std::shared_ptr<MatrixCache> cache = nullptr);

  OptimizationResult optimize(const std::vector<Location> &locations,
                              Method method, int time_of_day) const;

  // Naive vs nearest neighbour vs nearest neighbour + 2-opt.
  RouteComparison compare(const std::vector<Location> &locations,
                          int time_of_day) const;

  std::shared_ptr<const DistanceMatrix>
  matrix_for(const std::vector<Location> &locations) const;

  // k_zones clamped to the number of stops.
  ZonePartition zones_for(const std::vector<Location> &locations,
                          Deadline deadline = Deadline{}) const;

  const EngineConfig &config() const noexcept { return cfg_; }
  const std::shared_ptr<MatrixCache> &cache() const noexcept { return cache_; }

private:
  EngineConfig cfg_;
  std::shared_ptr<MatrixCache> cache_;
};

Improvement improvement(double baseline_km, double candidate_km);

void to_json(Json &j, const OptimizationResult &r);
void to_json(Json &j, const RouteComparison &c);
