#include "PatternConnection.hpp"
#include <gtest/gtest.h>

namespace {

PatternConnectionValidator validator(PatternShape first = PatternShape::Triangle) {
  return PatternConnectionValidator(first, Eigen::Vector2d(0.5, 0.5), 0.2, 0.06, 0.4);
}

}  // namespace

TEST(PatternLayout, ShapesHaveExpectedPointCounts) {
  Eigen::Vector2d c(0.5, 0.5);
  EXPECT_EQ(make_pattern(PatternShape::Triangle, c, 0.2).size(), 3u);
  EXPECT_EQ(make_pattern(PatternShape::Square, c, 0.2).size(), 4u);
  EXPECT_EQ(make_pattern(PatternShape::Circle, c, 0.2).size(), 8u);

  auto tri = make_pattern(PatternShape::Triangle, c, 0.2);
  // first point is at the top (screen y down)
  EXPECT_NEAR(tri[0].x(), 0.5, 1e-12);
  EXPECT_NEAR(tri[0].y(), 0.3, 1e-12);
}

TEST(PatternLayout, NearestPointRespectsTolerance) {
  auto pts = make_pattern(PatternShape::Square, Eigen::Vector2d(0.5, 0.5), 0.2);
  size_t idx = 99;
  ASSERT_TRUE(nearest_point(pts, Eigen::Vector2d(0.72, 0.31), 0.06, idx));
  EXPECT_EQ(idx, 1u);
  EXPECT_FALSE(nearest_point(pts, Eigen::Vector2d(0.5, 0.5), 0.06, idx));
}

TEST(PatternConnection, TriangleInAnyOrder) {
  auto v = validator();
  EXPECT_EQ(v.connect(0), PatternEvent::Started);
  EXPECT_EQ(v.connect(2), PatternEvent::Connected);
  EXPECT_EQ(v.connect(1), PatternEvent::Connected);
  EXPECT_EQ(v.connect(0), PatternEvent::Completed);
  EXPECT_EQ(v.completed(), 1);
  EXPECT_EQ(v.shape(), PatternShape::Square);
  EXPECT_TRUE(v.path().empty());
}

TEST(PatternConnection, SquareRejectsDiagonal) {
  auto v = validator(PatternShape::Square);
  EXPECT_EQ(v.connect(0), PatternEvent::Started);
  EXPECT_EQ(v.connect(2), PatternEvent::Incorrect);
  EXPECT_TRUE(v.path().empty());
  EXPECT_EQ(v.incorrect(), 1);
  EXPECT_EQ(v.shape(), PatternShape::Square);

  EXPECT_EQ(v.connect(1), PatternEvent::Started);
  EXPECT_EQ(v.connect(0), PatternEvent::Connected);
  EXPECT_EQ(v.connect(3), PatternEvent::Connected);
  EXPECT_EQ(v.connect(2), PatternEvent::Connected);
  EXPECT_EQ(v.connect(1), PatternEvent::Completed);
  EXPECT_EQ(v.shape(), PatternShape::Circle);
}

TEST(PatternConnection, ClosingEarlyIsIncorrect) {
  auto v = validator(PatternShape::Circle);
  v.connect(0);
  v.connect(1);
  v.connect(2);
  EXPECT_EQ(v.connect(0), PatternEvent::Incorrect);

  EXPECT_EQ(v.connect(0), PatternEvent::Started);
  EXPECT_EQ(v.connect(7), PatternEvent::Connected);
  EXPECT_EQ(v.connect(1), PatternEvent::Incorrect);
  EXPECT_EQ(v.incorrect(), 2);
}

TEST(PatternConnection, RevisitIsIncorrect) {
  auto v = validator(PatternShape::Circle);
  v.connect(3);
  v.connect(4);
  v.connect(5);
  EXPECT_EQ(v.connect(4), PatternEvent::Incorrect);
  EXPECT_TRUE(v.path().empty());
}

TEST(PatternConnection, RevisitingResetsOnlyThisPattern) {
  auto v = validator();
  v.connect(0);
  v.connect(1);
  v.connect(2);
  ASSERT_EQ(v.connect(0), PatternEvent::Completed);

  // square now
  v.connect(0);
  v.connect(1);
  EXPECT_EQ(v.connect(0), PatternEvent::Incorrect);
  EXPECT_EQ(v.completed(), 1);
  EXPECT_EQ(v.shape(), PatternShape::Square);
}

TEST(PatternConnection, SameOrUnknownPointIsIgnored) {
  auto v = validator();
  v.connect(1);
  EXPECT_EQ(v.connect(1), PatternEvent::Ignored);
  EXPECT_EQ(v.connect(7), PatternEvent::Ignored);
  EXPECT_EQ(v.path().size(), 1u);
  EXPECT_EQ(v.incorrect(), 0);
}

TEST(PatternConnection, SequenceCycles) {
  auto v = validator();
  for (int round = 0; round < 3; ++round) {
    size_t n = v.points().size();
    for (size_t i = 0; i < n; ++i) v.connect(i);
    ASSERT_EQ(v.connect(0), PatternEvent::Completed);
  }
  EXPECT_EQ(v.completed(), 3);
  EXPECT_EQ(v.shape(), PatternShape::Triangle);
}

TEST(PatternConnection, HandDebounce) {
  auto v = validator(PatternShape::Square);
  auto pts = v.points();

  EXPECT_EQ(v.track_hand(pts[0], 0.0), PatternEvent::Started);
  EXPECT_EQ(v.track_hand(pts[0], 0.1), PatternEvent::Ignored);
  EXPECT_EQ(v.track_hand(pts[2], 0.2), PatternEvent::Incorrect);

  // resting on the point that broke the pattern does not restart it
  EXPECT_EQ(v.track_hand(pts[2], 0.3), PatternEvent::Ignored);
  EXPECT_EQ(v.track_hand(pts[2], 0.6), PatternEvent::Ignored);
  EXPECT_TRUE(v.path().empty());

  // leave, come back later
  EXPECT_EQ(v.track_hand(Eigen::Vector2d(0.5, 0.5), 0.7), PatternEvent::Ignored);
  EXPECT_EQ(v.track_hand(pts[2], 1.2), PatternEvent::Started);
  EXPECT_EQ(v.track_hand(pts[3] + Eigen::Vector2d(0.03, 0.0), 1.4), PatternEvent::Connected);
}

TEST(PatternConnection, ResetReturnsToFirstPattern) {
  auto v = validator();
  v.connect(0);
  v.connect(1);
  v.connect(2);
  v.connect(0);
  v.connect(0);
  v.reset();
  EXPECT_EQ(v.shape(), PatternShape::Triangle);
  EXPECT_EQ(v.completed(), 0);
  EXPECT_TRUE(v.path().empty());
}
