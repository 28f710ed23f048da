#include "core/MatrixCache.hpp"
#include <array>
#include <cstdint>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

std::string MatrixCache::fingerprint(const std::vector<Location> &locations) {
  // material: "v2|id,lat,lon,depot;..." at full double precision. The depot
  // flag is part of the key since the matrix records the depot id.
  std::ostringstream material;
  material << "v2|" << std::setprecision(17);
  for (size_t i = 0; i < locations.size(); ++i) {
    if (i)
      material << ';';
    material << locations[i].id << ',' << locations[i].lat << ','
             << locations[i].lon << ',' << (locations[i].is_depot ? 1 : 0);
  }
  const std::string s = material.str();

  std::array<uint8_t, SHA256_DIGEST_LENGTH> uid{};
  SHA256(reinterpret_cast<const unsigned char *>(s.data()), s.size(),
         uid.data());
  return to_hex(uid.data(), uid.size());
}

std::shared_ptr<const DistanceMatrix>
MatrixCache::get_or_build(const std::vector<Location> &locations) {
  const std::string key = fingerprint(locations);
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      ++hits_;
      return it->second;
    }
    ++misses_;
  }

  // build outside the lock; two racing misses just build twice
  std::shared_ptr<const DistanceMatrix> built =
      std::make_shared<DistanceMatrix>(build_distance_matrix(locations));

  std::lock_guard<std::mutex> lock(mu_);
  auto [it, inserted] = entries_.emplace(key, built);
  if (!inserted)
    return it->second;
  order_.push_back(key);
  while (capacity_ > 0 && entries_.size() > capacity_) {
    entries_.erase(order_.front());
    order_.pop_front();
  }
  return built;
}

std::size_t MatrixCache::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

std::size_t MatrixCache::hits() const {
  std::lock_guard<std::mutex> lock(mu_);
  return hits_;
}

std::size_t MatrixCache::misses() const {
  std::lock_guard<std::mutex> lock(mu_);
  return misses_;
}

void MatrixCache::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  order_.clear();
}
