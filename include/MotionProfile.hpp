#pragma once
#include "SensorFrame.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

enum class DetectorKind {
  DirectionChange,
  CircularCompletion,
  VerticalTravel,
  ExtensionFlexion,
  PatternConnection
};

enum class RomModel { ArcLength, Radius, JointAngle, None };

// Landmark triple (or pair) behind a camera profile's tracked angle.
enum class TrackedAngle {
  Elbow,            // shoulder-elbow-wrist, at the elbow
  Armpit,           // hip-shoulder-elbow, at the shoulder
  ArmFromVertical   // shoulder->elbow against screen down
};

enum class PatternShape { Triangle, Square, Circle };

struct MotionProfile {
  std::string name;
  DetectorKind detector = DetectorKind::DirectionChange;
  RomModel rom_model = RomModel::ArcLength;
  double cooldown_s = 0.3;

  // direction change
  double min_displacement_m = 0.05;
  int reversals_per_rep = 2;
  double history_window_s = 2.0;

  // arc-length ROM
  double segment_noise_floor_m = 0.0008;
  double min_arc_length_m = 0.05;

  // circular completion
  double center_blend = 0.05;
  double min_radius_m = 0.02;
  double axis_blend = 0.12;
  double max_angle_step_rad = 1.0471975511965976;  // pi / 3
  double lap_window_s = 4.0;

  // camera
  BodySide side = BodySide::Right;
  TrackedAngle tracked_angle = TrackedAngle::Armpit;
  double min_confidence = 0.5;
  double step_threshold = 0.01;   // normalized screen units per frame
  int sustain_frames = 2;
  double min_travel = 0.05;       // normalized screen units
  double rest_threshold = 0.002;
  double extend_threshold_deg = 140.0;
  double flex_threshold_deg = 90.0;
  double min_rom_delta_deg = 30.0;

  // pattern connection
  PatternShape first_pattern = PatternShape::Triangle;
  double hit_tolerance = 0.06;
  double repeat_hit_s = 0.4;
  double pattern_size = 0.2;
};

bool find_profile(const std::string& name, MotionProfile& out);
std::vector<std::string> profile_names();

// Overrides fields named in j. A "base" key selects the built-in profile to
// start from. Throws std::runtime_error on unknown enum names, wrong value
// types or an unknown base.
void apply_profile_overrides(MotionProfile& profile, const nlohmann::json& j);

bool is_camera_profile(const MotionProfile& profile);

const char* detector_name(DetectorKind kind);
const char* rom_model_name(RomModel model);
const char* pattern_name(PatternShape shape);
