#pragma once
#include "core/DistanceEngine.hpp"
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// Keeps recently built matrices keyed by a SHA-256 fingerprint of the ordered
// (id, lat, lon, is_depot) list. Any change in ids, order, coordinates or
// depot is a miss.
class MatrixCache {
public:
  explicit MatrixCache(std::size_t capacity = 16) : capacity_(capacity) {}

  static std::string fingerprint(const std::vector<Location> &locations);

  std::shared_ptr<const DistanceMatrix>
  get_or_build(const std::vector<Location> &locations);

  std::size_t size() const;
  std::size_t hits() const;
  std::size_t misses() const;
  void clear();

private:
  std::size_t capacity_;
  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<const DistanceMatrix>> entries_;
  std::deque<std::string> order_; // insertion order, oldest first
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};
