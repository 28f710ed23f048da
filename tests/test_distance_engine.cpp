#include "core/DistanceEngine.hpp"
#include "fixtures.hpp"
#include "models/Errors.hpp"
#include <cmath>
#include <gtest/gtest.h>

TEST(Haversine, KnownPairIsAboutOnePointFourKm) {
  // warehouse -> Madhapur
  const double d = haversine_distance(17.4485, 78.3908, 17.4400, 78.3811);
  EXPECT_NEAR(d, 1.39, 0.05);
}

TEST(Haversine, OneDegreeOfLatitude) {
  EXPECT_NEAR(haversine_distance(0.0, 0.0, 1.0, 0.0), 111.19, 0.01);
}

TEST(Haversine, SymmetricAndZeroOnSelf) {
  const double ab = haversine_distance(17.4239, 78.3460, 17.4950, 78.3595);
  const double ba = haversine_distance(17.4950, 78.3595, 17.4239, 78.3460);
  EXPECT_DOUBLE_EQ(ab, ba);
  EXPECT_DOUBLE_EQ(haversine_distance(17.4239, 78.3460, 17.4239, 78.3460),
                   0.0);
}

TEST(Haversine, AntipodalPointsStayFinite) {
  const double d = haversine_distance(0.0, 0.0, 0.0, 180.0);
  EXPECT_NEAR(d, M_PI * EARTH_RADIUS_KM, 1e-6);
}

TEST(Haversine, RejectsOutOfRangeCoordinates) {
  EXPECT_THROW(haversine_distance(91.0, 0.0, 0.0, 0.0), ValidationError);
  EXPECT_THROW(haversine_distance(0.0, -180.5, 0.0, 0.0), ValidationError);
  EXPECT_THROW(haversine_distance(0.0, 0.0, -90.01, 0.0), ValidationError);
  EXPECT_THROW(haversine_distance(0.0, 0.0, 0.0, std::nan("")),
               ValidationError);
  EXPECT_NO_THROW(haversine_distance(-90.0, -180.0, 90.0, 180.0));
}

TEST(DistanceMatrix, ShapeSymmetryAndDiagonal) {
  const auto locs = hyderabad_locations();
  const DistanceMatrix m = build_distance_matrix(locs);
  ASSERT_EQ(m.size(), locs.size());
  for (std::size_t i = 0; i < m.size(); ++i) {
    EXPECT_EQ(m.at(i, i), 0.0);
    for (std::size_t j = 0; j < m.size(); ++j) {
      EXPECT_EQ(m.at(i, j), m.at(j, i));
      if (i != j)
        EXPECT_GT(m.at(i, j), 0.0);
    }
  }
  const auto rows = m.rows();
  ASSERT_EQ(rows.size(), locs.size());
  for (const auto &r : rows)
    EXPECT_EQ(r.size(), locs.size());
}

TEST(DistanceMatrix, LooksUpById) {
  auto locs = hyderabad_locations();
  // ids need not match positions
  for (auto &l : locs)
    l.id += 100;
  const DistanceMatrix m = build_distance_matrix(locs);
  EXPECT_EQ(m.index_of(102), 2u);
  EXPECT_DOUBLE_EQ(m.between(101, 104), m.at(1, 4));
  EXPECT_DOUBLE_EQ(m.between(101, 104),
                   haversine_distance(locs[1].coord(), locs[4].coord()));
  ASSERT_TRUE(m.depot_id().has_value());
  EXPECT_EQ(*m.depot_id(), 100);
  EXPECT_FALSE(m.contains(5));
  EXPECT_THROW(m.between(101, 5), ValidationError);
}

TEST(DistanceMatrix, CoincidentPointsHaveZeroDistance) {
  std::vector<Location> locs{make_location(0, 17.0, 78.0, true),
                             make_location(1, 17.1, 78.1),
                             make_location(2, 17.1, 78.1)};
  const DistanceMatrix m = build_distance_matrix(locs);
  EXPECT_EQ(m.between(1, 2), 0.0);
  EXPECT_GT(m.between(0, 1), 0.0);
}

TEST(DistanceMatrix, NeedsTwoLocations) {
  EXPECT_THROW(build_distance_matrix({}), InsufficientDataError);
  EXPECT_THROW(build_distance_matrix({make_location(0, 17.0, 78.0, true)}),
               InsufficientDataError);
}

TEST(DistanceMatrix, RejectsDuplicateIdsAndSecondDepot) {
  std::vector<Location> dup{make_location(0, 17.0, 78.0, true),
                            make_location(1, 17.1, 78.1),
                            make_location(1, 17.2, 78.2)};
  EXPECT_THROW(build_distance_matrix(dup), ValidationError);

  std::vector<Location> two_depots{make_location(0, 17.0, 78.0, true),
                                   make_location(1, 17.1, 78.1, true)};
  EXPECT_THROW(build_distance_matrix(two_depots), ValidationError);
}

TEST(DistanceMatrix, RejectsBadCoordinates) {
  std::vector<Location> locs{make_location(0, 17.0, 78.0, true),
                             make_location(1, 95.0, 78.1)};
  EXPECT_THROW(build_distance_matrix(locs), ValidationError);
}
