#include "Calibration.hpp"
#include "MotionProfile.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

using nlohmann::json;

TEST(MotionProfile, BuiltinsAreFindable) {
  auto names = profile_names();
  ASSERT_GE(names.size(), 9u);
  for (const auto& name : names) {
    MotionProfile p;
    ASSERT_TRUE(find_profile(name, p)) << name;
    EXPECT_EQ(p.name, name);
  }
  MotionProfile p;
  EXPECT_FALSE(find_profile("jumping_jacks", p));
}

TEST(MotionProfile, BuiltinsPickTheirAlgorithms) {
  MotionProfile p;
  ASSERT_TRUE(find_profile("forward_swing", p));
  EXPECT_EQ(p.detector, DetectorKind::DirectionChange);
  EXPECT_EQ(p.rom_model, RomModel::ArcLength);
  EXPECT_EQ(p.reversals_per_rep, 2);
  EXPECT_FALSE(is_camera_profile(p));

  ASSERT_TRUE(find_profile("stir", p));
  EXPECT_EQ(p.detector, DetectorKind::CircularCompletion);
  EXPECT_EQ(p.rom_model, RomModel::Radius);

  ASSERT_TRUE(find_profile("elbow_extension", p));
  EXPECT_EQ(p.tracked_angle, TrackedAngle::Elbow);
  EXPECT_TRUE(is_camera_profile(p));

  ASSERT_TRUE(find_profile("constellation", p));
  EXPECT_EQ(p.detector, DetectorKind::PatternConnection);
  EXPECT_EQ(p.rom_model, RomModel::None);
}

TEST(MotionProfile, OverridesFromJson) {
  MotionProfile p;
  ASSERT_TRUE(find_profile("custom", p));
  apply_profile_overrides(p, json::parse(R"({
    "base": "stir",
    "name": "slow_stir",
    "cooldown_s": 0.8,
    "lap_window_s": 6,
    "side": "left",
    "some_future_key": true
  })"));
  EXPECT_EQ(p.name, "slow_stir");
  EXPECT_EQ(p.detector, DetectorKind::CircularCompletion);
  EXPECT_DOUBLE_EQ(p.cooldown_s, 0.8);
  EXPECT_DOUBLE_EQ(p.lap_window_s, 6.0);
  EXPECT_EQ(p.side, BodySide::Left);
  EXPECT_DOUBLE_EQ(p.min_radius_m, 0.025);
}

TEST(MotionProfile, BadOverridesThrow) {
  auto apply = [](const char* text) {
    MotionProfile p;
    find_profile("custom", p);
    apply_profile_overrides(p, json::parse(text));
  };
  EXPECT_THROW(apply(R"({"cooldown_s": "fast"})"), std::runtime_error);
  EXPECT_THROW(apply(R"({"detector": "magic"})"), std::runtime_error);
  EXPECT_THROW(apply(R"({"base": "nope"})"), std::runtime_error);
  EXPECT_THROW(apply(R"({"reversals_per_rep": 0})"), std::runtime_error);
  EXPECT_THROW(apply(R"({"reversals_per_rep": 1.5})"), std::runtime_error);
  EXPECT_THROW(apply(R"({"flex_threshold_deg": 150})"), std::runtime_error);
  EXPECT_THROW(apply("[1, 2]"), std::runtime_error);
  EXPECT_NO_THROW(apply(R"({"base": "arm_raise", "min_rom_delta_deg": 20})"));
}

TEST(MotionProfile, EnumNames) {
  EXPECT_STREQ(detector_name(DetectorKind::VerticalTravel), "vertical_travel");
  EXPECT_STREQ(rom_model_name(RomModel::Radius), "radius");
  EXPECT_STREQ(pattern_name(PatternShape::Square), "square");
}

TEST(Calibration, ResolveSubstitutesDefault) {
  EXPECT_DOUBLE_EQ(resolve_arm_length(0.62), 0.62);
  EXPECT_DOUBLE_EQ(resolve_arm_length(0.0), kDefaultArmLength);
  EXPECT_DOUBLE_EQ(resolve_arm_length(-0.5), kDefaultArmLength);
  EXPECT_DOUBLE_EQ(resolve_arm_length(std::numeric_limits<double>::quiet_NaN()), kDefaultArmLength);
  EXPECT_DOUBLE_EQ(resolve_arm_length(std::numeric_limits<double>::infinity()), kDefaultArmLength);
}

TEST(Calibration, LoadsArmLengthFile) {
  std::string path = ::testing::TempDir() + "motion_reps_calibration.json";
  {
    std::ofstream out(path);
    out << R"({"arm_length_m": 0.66})";
  }
  double arm = 0.0;
  ASSERT_TRUE(load_arm_length(path, arm));
  EXPECT_DOUBLE_EQ(arm, 0.66);

  {
    std::ofstream out(path);
    out << R"({"height_m": 1.8})";
  }
  EXPECT_FALSE(load_arm_length(path, arm));

  {
    std::ofstream out(path);
    out << "{not json";
  }
  EXPECT_THROW(load_arm_length(path, arm), std::runtime_error);
  std::remove(path.c_str());

  EXPECT_FALSE(load_arm_length(path + ".missing", arm));
}
