#include "core/MatrixCache.hpp"
#include "fixtures.hpp"
#include "models/Errors.hpp"
#include <future>
#include <gtest/gtest.h>

TEST(MatrixCache, FingerprintIsStableHex) {
  const auto locs = hyderabad_locations();
  const auto a = MatrixCache::fingerprint(locs);
  EXPECT_EQ(a.size(), 64u);
  EXPECT_EQ(a, MatrixCache::fingerprint(locs));
  EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(MatrixCache, FingerprintChangesWithIdsOrderCoordinatesOrDepot) {
  const auto base = hyderabad_locations();
  const auto key = MatrixCache::fingerprint(base);

  auto moved = base;
  moved[2].lat += 1e-9;
  EXPECT_NE(MatrixCache::fingerprint(moved), key);

  auto renumbered = base;
  renumbered[3].id = 42;
  EXPECT_NE(MatrixCache::fingerprint(renumbered), key);

  auto reordered = base;
  std::swap(reordered[1], reordered[2]);
  EXPECT_NE(MatrixCache::fingerprint(reordered), key);

  auto new_depot = base;
  new_depot[0].is_depot = false;
  new_depot[3].is_depot = true;
  EXPECT_NE(MatrixCache::fingerprint(new_depot), key);

  // names and package counts are not part of the key
  auto renamed = base;
  renamed[1].name = "Someone else";
  renamed[1].package_count = 9;
  EXPECT_EQ(MatrixCache::fingerprint(renamed), key);
}

TEST(MatrixCache, ReusesMatrixForSameLocations) {
  MatrixCache cache;
  const auto locs = hyderabad_locations();
  auto first = cache.get_or_build(locs);
  auto second = cache.get_or_build(locs);
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);

  auto moved = locs;
  moved[4].lon += 0.001;
  auto third = cache.get_or_build(moved);
  EXPECT_NE(third.get(), first.get());
  EXPECT_EQ(cache.size(), 2u);
}

TEST(MatrixCache, EvictsOldestBeyondCapacity) {
  MatrixCache cache(2);
  auto a = line_locations(3);
  auto b = line_locations(4);
  auto c = line_locations(5);
  auto ma = cache.get_or_build(a);
  cache.get_or_build(b);
  cache.get_or_build(c);
  EXPECT_EQ(cache.size(), 2u);
  // `a` was evicted; the old handle stays valid
  auto ma2 = cache.get_or_build(a);
  EXPECT_NE(ma.get(), ma2.get());
  EXPECT_EQ(ma->size(), 4u);
  EXPECT_EQ(cache.misses(), 4u);
}

TEST(MatrixCache, BuildErrorsPropagateAndAreNotCached) {
  MatrixCache cache;
  std::vector<Location> one{make_location(0, 17.0, 78.0, true)};
  EXPECT_THROW(cache.get_or_build(one), InsufficientDataError);
  EXPECT_EQ(cache.size(), 0u);
}

TEST(MatrixCache, ConcurrentReadersShareOneEntry) {
  MatrixCache cache;
  const auto locs = scattered_locations(30, 7);
  std::vector<std::future<std::shared_ptr<const DistanceMatrix>>> fs;
  for (int i = 0; i < 8; ++i)
    fs.push_back(std::async(std::launch::async,
                            [&] { return cache.get_or_build(locs); }));
  for (auto &f : fs)
    EXPECT_EQ(f.get()->size(), locs.size());
  EXPECT_EQ(cache.size(), 1u);
}

TEST(MatrixCache, MovingTheDepotBuildsAFreshMatrix) {
  MatrixCache cache;
  auto locs = hyderabad_locations();
  auto first = cache.get_or_build(locs);
  ASSERT_TRUE(first->depot_id().has_value());
  EXPECT_EQ(*first->depot_id(), 0);

  locs[0].is_depot = false;
  locs[3].is_depot = true;
  auto second = cache.get_or_build(locs);
  EXPECT_NE(first.get(), second.get());
  ASSERT_TRUE(second->depot_id().has_value());
  EXPECT_EQ(*second->depot_id(), 3);
  EXPECT_EQ(cache.misses(), 2u);
}
