#include "Geometry.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace {
const double kPi = 3.14159265358979323846;
}

TEST(Geometry, NormalizeRejectsTinyVectors) {
  Eigen::Vector3d out(9.0, 9.0, 9.0);
  EXPECT_FALSE(normalize(Eigen::Vector3d(1e-6, 0.0, 0.0), out));
  EXPECT_DOUBLE_EQ(out.x(), 9.0);

  ASSERT_TRUE(normalize(Eigen::Vector3d(3.0, 0.0, 4.0), out));
  EXPECT_NEAR(out.norm(), 1.0, 1e-12);
  EXPECT_NEAR(out.x(), 0.6, 1e-12);
}

TEST(Geometry, NormalizeRejectsNonFinite) {
  Eigen::Vector3d out;
  double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(normalize(Eigen::Vector3d(nan, 1.0, 0.0), out));
}

TEST(Geometry, WrapAngleStaysInHalfOpenRange) {
  EXPECT_NEAR(wrap_angle(3.0 * kPi / 2.0), -kPi / 2.0, 1e-12);
  EXPECT_NEAR(wrap_angle(-3.0 * kPi / 2.0), kPi / 2.0, 1e-12);
  EXPECT_NEAR(wrap_angle(kPi), kPi, 1e-12);
  EXPECT_NEAR(wrap_angle(-kPi), kPi, 1e-12);
  EXPECT_DOUBLE_EQ(wrap_angle(std::numeric_limits<double>::infinity()), 0.0);
}

TEST(Geometry, AngleDeltaTakesShortWayAcrossSeam) {
  EXPECT_NEAR(angle_delta(kPi - 0.1, -kPi + 0.1), 0.2, 1e-12);
  EXPECT_NEAR(angle_delta(-kPi + 0.1, kPi - 0.1), -0.2, 1e-12);
}

TEST(Geometry, AxisVarianceIsPopulationVariance) {
  std::vector<Eigen::Vector3d> pts = {
    Eigen::Vector3d(0.0, 1.0, 0.0),
    Eigen::Vector3d(2.0, 1.0, 0.0),
  };
  Eigen::Vector3d v = axis_variance(pts);
  EXPECT_DOUBLE_EQ(v.x(), 1.0);
  EXPECT_DOUBLE_EQ(v.y(), 0.0);
  EXPECT_DOUBLE_EQ(v.z(), 0.0);
}

TEST(Geometry, PlaneFollowsHighestVarianceAxes) {
  std::vector<Eigen::Vector3d> xz, yz;
  for (int i = 0; i < 20; ++i) {
    double a = 2.0 * kPi * i / 20.0;
    xz.emplace_back(0.2 * std::cos(a), 0.001 * (i % 2), 0.2 * std::sin(a));
    yz.emplace_back(0.0, 0.2 * std::cos(a), 0.2 * std::sin(a));
  }
  EXPECT_EQ(select_projection_plane(xz), ProjectionPlane::XZ);
  EXPECT_EQ(select_projection_plane(yz), ProjectionPlane::YZ);
}

TEST(Geometry, PlaneTiesKeepAxisPrecedence) {
  std::vector<Eigen::Vector3d> still(5, Eigen::Vector3d(1.0, 2.0, 3.0));
  EXPECT_EQ(select_projection_plane(still), ProjectionPlane::XY);

  std::vector<Eigen::Vector3d> only_z = {Eigen::Vector3d(0, 0, 0), Eigen::Vector3d(0, 0, 1)};
  EXPECT_EQ(select_projection_plane(only_z), ProjectionPlane::XZ);

  EXPECT_EQ(select_projection_plane({}), ProjectionPlane::XY);
}

TEST(Geometry, ProjectedLengthMatchesRawInItsOwnPlane) {
  std::vector<Eigen::Vector3d> xy;
  for (int i = 0; i <= 40; ++i) {
    double a = kPi * i / 40.0;
    xy.emplace_back(0.3 * std::cos(a), 0.3 * std::sin(a), 0.0);
  }
  double raw = path_length(xy, 0.0008);
  ASSERT_EQ(select_projection_plane(xy), ProjectionPlane::XY);
  EXPECT_NEAR(projected_path_length(xy, ProjectionPlane::XY, 0.0008), raw, 1e-12);
}

TEST(Geometry, WrongPlaneUnderestimates) {
  std::vector<Eigen::Vector3d> xz;
  for (int i = 0; i <= 40; ++i) {
    double a = kPi * i / 40.0;
    xz.emplace_back(0.3 * std::cos(a), 0.0, 0.3 * std::sin(a));
  }
  double raw = path_length(xz, 0.0008);
  ASSERT_EQ(select_projection_plane(xz), ProjectionPlane::XZ);
  EXPECT_NEAR(projected_path_length(xz, ProjectionPlane::XZ, 0.0008), raw, 1e-12);
  EXPECT_LT(projected_path_length(xz, ProjectionPlane::XY, 0.0008), 0.8 * raw);
}

TEST(Geometry, NoiseFloorDropsJitter) {
  std::vector<Eigen::Vector3d> pts;
  for (int i = 0; i < 10; ++i) pts.emplace_back(0.0001 * (i % 2), 0.0, 0.0);
  EXPECT_DOUBLE_EQ(path_length(pts, 0.0008), 0.0);
}
