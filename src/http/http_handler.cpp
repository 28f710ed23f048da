#include "http_handler.hpp"
#include "core/RouteMetrics.hpp"
#include "core/TravelModel.hpp"
#include "core/ZoneDecomposer.hpp"
#include "debug/json_debug.hpp"
#include "httplib.h"
#include "models/CoreTypes.hpp"
#include "models/Errors.hpp"
#include "nlohmann/json.hpp"

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

// hour used when a request leaves time_of_day out (09:00 departure)
static constexpr int kDefaultHour = 9;

static void send_error(httplib::Response &res, int status,
                       const std::string &kind, const std::string &what) {
  json err = {{"ok", false}, {"kind", kind}, {"what", what}};
  res.status = status;
  res.set_content(err.dump(), "application/json");
}

static int status_for(const RouteEngineError &e) {
  if (dynamic_cast<const ValidationError *>(&e))
    return 400;
  return 422; // insufficient data, invalid route
}

static std::vector<Location> locations_from(const json &body) {
  if (!body.contains("locations") || !body["locations"].is_array())
    throw ValidationError("body must contain a \"locations\" array");
  return body["locations"].get<std::vector<Location>>();
}

// integer request field with a default; 9.7 or "nine" is rejected rather
// than truncated
static long long int_field(const json &body, const char *key,
                           long long fallback) {
  if (!body.contains(key))
    return fallback;
  const json &v = body[key];
  if (!v.is_number_integer())
    throw ValidationError(std::string("\"") + key + "\" must be an integer");
  return v.get<long long>();
}

static int hour_from(const json &body) {
  const long long h = int_field(body, "time_of_day", kDefaultHour);
  if (h < 0 || h > 23)
    throw ValidationError("time_of_day must be an hour in 0-23, got " +
                          std::to_string(h));
  return (int)h;
}

HttpHandler::HttpHandler(EngineConfig defaults,
                         std::shared_ptr<MatrixCache> cache)
    : defaults_(std::move(defaults)), cache_(std::move(cache)) {
  defaults_.validate();
  if (!cache_)
    cache_ = std::make_shared<MatrixCache>();
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  using Fn = void (HttpHandler::*)(const json &, httplib::Response &);
  Fn fn = nullptr;
  if (action == "optimize") {
    fn = &HttpHandler::handleOptimize;
  } else if (action == "compare") {
    fn = &HttpHandler::handleCompare;
  } else if (action == "matrix") {
    fn = &HttpHandler::handleMatrix;
  } else if (action == "zones") {
    fn = &HttpHandler::handleZones;
  } else if (action == "metrics") {
    fn = &HttpHandler::handleMetrics;
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
    return;
  }
  withJsonBody(req, res, [this, fn](const json &body, httplib::Response &r) {
    (this->*fn)(body, r);
  });
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::withJsonBody(
    const httplib::Request &req, httplib::Response &res,
    const std::function<void(const json &, httplib::Response &)> &fn) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_json(req.body, e).dump(2), "application/json");
    return;
  }
  if (!body.is_object()) {
    send_error(res, 400, "bad_request", "request body must be a JSON object");
    return;
  }

  try {
    fn(body, res);
  } catch (const RouteEngineError &e) {
    std::cerr << "[http] " << req.path << " " << e.kind() << ": " << e.what()
              << "\n";
    send_error(res, status_for(e), e.kind(), e.what());
  } catch (const json::exception &e) {
    // wrong field types, missing required keys
    send_error(res, 400, "bad_request", e.what());
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << req.path << ": " << e.what() << "\n";
    send_error(res, 500, "internal_error", e.what());
  }
}

EngineConfig HttpHandler::configFor(const json &body) const {
  if (body.contains("config"))
    return EngineConfig::from_json(body.at("config"), defaults_);
  return defaults_;
}

// ===== POST: /optimize =====

void HttpHandler::handleOptimize(const json &body, httplib::Response &res) {
  const auto locations = locations_from(body);
  const Method method = method_from_string(body.value("method", "nn_2opt"));
  const int hour = hour_from(body);

  RouteOptimizer optimizer(configFor(body), cache_);
  json out = optimizer.optimize(locations, method, hour);
  out["ok"] = true;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /compare =====

void HttpHandler::handleCompare(const json &body, httplib::Response &res) {
  const auto locations = locations_from(body);
  const int hour = hour_from(body);

  RouteOptimizer optimizer(configFor(body), cache_);
  json out = optimizer.compare(locations, hour);
  out["ok"] = true;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /matrix =====

void HttpHandler::handleMatrix(const json &body, httplib::Response &res) {
  const auto locations = locations_from(body);
  RouteOptimizer optimizer(configFor(body), cache_);
  const auto m = optimizer.matrix_for(locations);

  json out = {{"ok", true},
              {"ids", m->ids()},
              {"matrix", m->rows()},
              {"fingerprint", MatrixCache::fingerprint(locations)}};
  if (m->depot_id())
    out["depot_id"] = *m->depot_id();
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /zones =====

void HttpHandler::handleZones(const json &body, httplib::Response &res) {
  const auto locations = locations_from(body);
  const EngineConfig cfg = configFor(body);
  const long long k_in = int_field(body, "k", cfg.k_zones);
  if (k_in < 1 || k_in > std::numeric_limits<int>::max())
    throw ValidationError("k must be >= 1, got " + std::to_string(k_in));
  const int k = (int)k_in;
  const long long seed_in = int_field(body, "seed", cfg.seed);
  if (seed_in < 0 ||
      seed_in > (long long)std::numeric_limits<std::uint32_t>::max())
    throw ValidationError("seed must be in 0-4294967295, got " +
                          std::to_string(seed_in));
  const auto seed = (std::uint32_t)seed_in;

  ZoneOptions zo;
  zo.max_iterations = cfg.max_kmeans_iterations;
  zo.init = cfg.kmeans_init;
  zo.reseed_empty = cfg.reseed_empty_zones;
  zo.deadline = Deadline::after_ms(cfg.time_budget_ms);
  json out = ZoneDecomposer(zo).decompose(locations, k, seed);
  out["ok"] = true;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /metrics =====

void HttpHandler::handleMetrics(const json &body, httplib::Response &res) {
  const auto locations = locations_from(body);
  if (!body.contains("route"))
    throw ValidationError("body must contain a \"route\"");
  const Route route = body.at("route").get<Route>();
  const int hour = hour_from(body);
  const EngineConfig cfg = configFor(body);

  RouteOptimizer optimizer(cfg, cache_);
  const auto m = optimizer.matrix_for(locations);
  const RouteMetrics metrics =
      compute_metrics(route, *m, hour, cfg.traffic, cfg.cost, &locations);

  json out = {{"ok", true},
              {"metrics", metrics},
              {"total_time_formatted",
               TravelModel::format_duration(metrics.total_time_minutes)}};
  res.set_content(out.dump(), "application/json");
}

// ===== GET: /health =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  json out = {{"ok", true},
              {"cache",
               {{"entries", cache_->size()},
                {"hits", cache_->hits()},
                {"misses", cache_->misses()}}},
              {"defaults", defaults_.to_json()}};
  res.set_content(out.dump(), "application/json");
}
