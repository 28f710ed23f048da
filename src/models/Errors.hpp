#pragma once

#include <stdexcept>
#include <string>

// Base of every error the engine raises on purpose.
class RouteEngineError : public std::runtime_error {
public:
  explicit RouteEngineError(const std::string &what)
      : std::runtime_error(what) {}
  virtual const char *kind() const noexcept = 0;
};

// Malformed input: coordinates out of range, bad k, bad hour, bad config.
class ValidationError : public RouteEngineError {
public:
  using RouteEngineError::RouteEngineError;
  const char *kind() const noexcept override { return "validation_error"; }
};

// Not enough locations to build a matrix or a tour.
class InsufficientDataError : public RouteEngineError {
public:
  using RouteEngineError::RouteEngineError;
  const char *kind() const noexcept override {
    return "insufficient_data_error";
  }
};

// Metrics requested on a route that is not a depot-anchored Hamiltonian cycle.
class InvalidRouteError : public RouteEngineError {
public:
  using RouteEngineError::RouteEngineError;
  const char *kind() const noexcept override { return "invalid_route_error"; }
};
