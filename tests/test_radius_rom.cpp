#include "RadiusRomCalculator.hpp"
#include "TestFrames.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace test_frames;

TEST(RadiusRom, OneLapMeasuresItsRadius) {
  RadiusRomCalculator calc;
  calc.start(0.7);
  for (const auto& f : circle_xz(90)) calc.add(f.position, f.t);

  double rom = 0.0;
  ASSERT_TRUE(calc.complete_rep(rom));
  EXPECT_NEAR(calc.last_rep_radius(), 0.15, 1e-9);
  EXPECT_NEAR(rom, std::asin(0.15 / 0.7) * 180.0 / kPi, 1e-6);
  EXPECT_EQ(calc.buffered(), 0u);
  EXPECT_DOUBLE_EQ(calc.rep_max_radius(), 0.0);
}

TEST(RadiusRom, RunningMaxDrivesLiveValue) {
  RadiusRomCalculator calc;
  calc.start(0.7);
  calc.add(Eigen::Vector3d(0.0, 0.0, 0.0), 0.0);
  calc.add(Eigen::Vector3d(0.2, 0.0, 0.0), 0.1);
  EXPECT_NEAR(calc.current_radius(), 0.1, 1e-12);
  EXPECT_NEAR(calc.live_rom(), std::asin(0.1 / 0.7) * 180.0 / kPi, 1e-9);
  calc.add(Eigen::Vector3d(0.1, 0.0, 0.0), 0.2);
  EXPECT_NEAR(calc.rep_max_radius(), 0.1, 1e-12);
}

TEST(RadiusRom, RepPeakDoesNotCarryOver) {
  RadiusRomCalculator calc;
  calc.start(0.7);
  for (const auto& f : circle_xz(90, 0.3)) calc.add(f.position, f.t);
  double big = 0.0;
  ASSERT_TRUE(calc.complete_rep(big));

  for (const auto& f : circle_xz(90, 0.1)) calc.add(f.position, f.t + 2.0);
  double small = 0.0;
  ASSERT_TRUE(calc.complete_rep(small));
  EXPECT_LT(small, big);
  EXPECT_EQ(calc.trajectories().size(), 2u);
}

TEST(RadiusRom, EmptyRepIsNotAccepted) {
  RadiusRomCalculator calc;
  calc.start(0.7);
  double rom = 1.0;
  EXPECT_FALSE(calc.complete_rep(rom));
  EXPECT_DOUBLE_EQ(rom, 0.0);
}

TEST(RadiusRom, ClampsToQuarterTurn) {
  EXPECT_DOUBLE_EQ(RadiusRomCalculator::rom_from_radius(2.0, 0.7), 90.0);
  EXPECT_DOUBLE_EQ(RadiusRomCalculator::rom_from_radius(0.0, 0.7), 0.0);
  EXPECT_DOUBLE_EQ(RadiusRomCalculator::rom_from_radius(0.3, 0.0), 0.0);
  for (double r = 0.0; r < 3.0; r += 0.13) {
    double rom = RadiusRomCalculator::rom_from_radius(r, 0.7);
    EXPECT_GE(rom, 0.0);
    EXPECT_LE(rom, 90.0);
  }
}
