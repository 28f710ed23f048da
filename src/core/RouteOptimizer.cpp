// RouteOptimizer ties the engine stages together for one location set.

#include "core/RouteOptimizer.hpp"
#include "core/TravelModel.hpp"
#include "models/Errors.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>

Method method_from_string(const std::string &s) {
  if (s == "naive")
    return Method::Naive;
  if (s == "random")
    return Method::Random;
  if (s == "nn")
    return Method::NearestNeighbor;
  if (s == "nn_2opt")
    return Method::NearestNeighbor2Opt;
  throw ValidationError("unknown method: " + s);
}

const char *method_name(Method m) {
  switch (m) {
  case Method::Naive:
    return "naive";
  case Method::Random:
    return "random";
  case Method::NearestNeighbor:
    return "nn";
  case Method::NearestNeighbor2Opt:
    return "nn_2opt";
  }
  return "unknown";
}

const char *method_label(Method m) {
  switch (m) {
  case Method::Naive:
    return "Sequential (Naive)";
  case Method::Random:
    return "Random";
  case Method::NearestNeighbor:
    return "Nearest Neighbor";
  case Method::NearestNeighbor2Opt:
    return "Nearest Neighbor + 2-Opt";
  }
  return "unknown";
}

Improvement improvement(double baseline_km, double candidate_km) {
  Improvement out;
  out.km_saved = baseline_km - candidate_km;
  if (baseline_km > 0.0)
    out.percent = out.km_saved / baseline_km * 100.0;
  return out;
}

RouteOptimizer::RouteOptimizer(EngineConfig cfg,
                               std::shared_ptr<MatrixCache> cache)
    : cfg_(std::move(cfg)), cache_(std::move(cache)) {
  cfg_.validate();
  if (!cache_)
    cache_ = std::make_shared<MatrixCache>();
}

std::shared_ptr<const DistanceMatrix>
RouteOptimizer::matrix_for(const std::vector<Location> &locations) const {
  return cache_->get_or_build(locations);
}

ZonePartition RouteOptimizer::zones_for(const std::vector<Location> &locations,
                                        Deadline deadline) const {
  int stops = 0;
  for (const auto &loc : locations)
    if (!loc.is_depot)
      ++stops;
  int k = cfg_.k_zones;
  if (stops > 0 && k > stops) {
    std::cout << "[optimizer] k_zones=" << k << " exceeds " << stops
              << " stops, using k=" << stops << std::endl;
    k = stops;
  }

  ZoneOptions zo;
  zo.max_iterations = cfg_.max_kmeans_iterations;
  zo.init = cfg_.kmeans_init;
  zo.reseed_empty = cfg_.reseed_empty_zones;
  zo.deadline = deadline;
  return ZoneDecomposer(zo).decompose(locations, k, cfg_.seed);
}

OptimizationResult
RouteOptimizer::optimize(const std::vector<Location> &locations, Method method,
                         int time_of_day) const {
  const auto t0 = std::chrono::steady_clock::now();
  const Deadline deadline = Deadline::after_ms(cfg_.time_budget_ms);

  OptimizationResult out;
  out.method = method;
  out.time_of_day = time_of_day;
  out.matrix_fingerprint = MatrixCache::fingerprint(locations);
  auto matrix = matrix_for(locations);

  switch (method) {
  case Method::Naive:
    out.route = TourSolver::naive_route(locations);
    break;
  case Method::Random:
    out.route = TourSolver::random_route(locations, cfg_.seed);
    break;
  case Method::NearestNeighbor:
  case Method::NearestNeighbor2Opt: {
    out.partition = zones_for(locations, deadline);
    SolverOptions so = SolverOptions::from_config(cfg_, deadline);
    so.apply_2opt = (method == Method::NearestNeighbor2Opt);
    out.solution = TourSolver(so).solve_route(
        locations, *matrix, out.partition->zones, time_of_day);
    out.route = out.solution->route;
    out.warnings = out.partition->warnings;
    out.warnings.insert(out.warnings.end(), out.solution->warnings.begin(),
                        out.solution->warnings.end());
    break;
  }
  }

  out.metrics = compute_metrics(out.route, *matrix, time_of_day, cfg_.traffic,
                                cfg_.cost, &locations);
  out.converged = out.warnings.empty();
  out.elapsed_ms = std::chrono::duration<double, std::milli>(
                       std::chrono::steady_clock::now() - t0)
                       .count();

  std::cout << "[optimizer] " << method_name(method) << " stops="
            << out.metrics.num_stops << " distance=" << std::fixed
            << std::setprecision(2) << out.metrics.total_distance_km
            << "km time=" << TravelModel::format_duration(
                                 out.metrics.total_time_minutes)
            << " in " << out.elapsed_ms << "ms"
            << (out.converged ? "" : " (not converged)") << std::endl;
  return out;
}

RouteComparison RouteOptimizer::compare(const std::vector<Location> &locations,
                                        int time_of_day) const {
  RouteComparison c;
  c.naive = optimize(locations, Method::Naive, time_of_day);
  c.nearest_neighbor =
      optimize(locations, Method::NearestNeighbor, time_of_day);
  c.optimized = optimize(locations, Method::NearestNeighbor2Opt, time_of_day);

  const double naive_km = c.naive.metrics.total_distance_km;
  const double nn_km = c.nearest_neighbor.metrics.total_distance_km;
  const double opt_km = c.optimized.metrics.total_distance_km;
  c.nn_vs_naive = improvement(naive_km, nn_km);
  c.opt_vs_naive = improvement(naive_km, opt_km);
  c.opt_vs_nn = improvement(nn_km, opt_km);
  return c;
}

void to_json(Json &j, const OptimizationResult &r) {
  j = Json{{"method", method_name(r.method)},
           {"algorithm", method_label(r.method)},
           {"route", r.route},
           {"metrics", r.metrics},
           {"total_time_formatted",
            TravelModel::format_duration(r.metrics.total_time_minutes)},
           {"matrix_fingerprint", r.matrix_fingerprint},
           {"time_of_day", r.time_of_day},
           {"converged", r.converged},
           {"warnings", r.warnings},
           {"elapsed_ms", r.elapsed_ms}};
  if (r.partition)
    j["zones"] = *r.partition;
  if (r.solution) {
    j["zone_order"] = r.solution->zone_order;
    j["zone_tours"] = r.solution->zone_tours;
  }
}

static Json improvement_json(const Improvement &i) {
  return Json{{"km_saved", i.km_saved}, {"percent", i.percent}};
}

void to_json(Json &j, const RouteComparison &c) {
  j = Json{{"routes",
            {{"naive", c.naive},
             {"nn", c.nearest_neighbor},
             {"optimized", c.optimized}}},
           {"distances",
            {{"naive", c.naive.metrics.total_distance_km},
             {"nearest_neighbor", c.nearest_neighbor.metrics.total_distance_km},
             {"optimized", c.optimized.metrics.total_distance_km}}},
           {"improvements",
            {{"nn_vs_naive", improvement_json(c.nn_vs_naive)},
             {"opt_vs_naive", improvement_json(c.opt_vs_naive)},
             {"opt_vs_nn", improvement_json(c.opt_vs_nn)}}}};
}
