#pragma once

#include "core/MatrixCache.hpp"   // MatrixCache
#include "core/RouteOptimizer.hpp" // RouteOptimizer, Method
#include "httplib.h"
#include "models/params.hpp" // EngineConfig
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(EngineConfig defaults,
                       std::shared_ptr<MatrixCache> cache = nullptr);

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

  const EngineConfig &defaults() const noexcept { return defaults_; }

private:
  EngineConfig defaults_;
  std::shared_ptr<MatrixCache> cache_;

  // Individual request handlers
  void handleOptimize(const nlohmann::json &body, httplib::Response &res);
  void handleCompare(const nlohmann::json &body, httplib::Response &res);
  void handleMatrix(const nlohmann::json &body, httplib::Response &res);
  void handleZones(const nlohmann::json &body, httplib::Response &res);
  void handleMetrics(const nlohmann::json &body, httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);

  // Parses the body and runs `fn`, translating engine errors into JSON
  // error responses.
  void withJsonBody(
      const httplib::Request &req, httplib::Response &res,
      const std::function<void(const nlohmann::json &, httplib::Response &)>
          &fn);
  EngineConfig configFor(const nlohmann::json &body) const;
};
