#include "MotionProfile.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace {

MotionProfile pendulum(const std::string& name) {
  MotionProfile p;
  p.name = name;
  p.detector = DetectorKind::DirectionChange;
  p.rom_model = RomModel::ArcLength;
  return p;
}

MotionProfile circular(const std::string& name, double cooldown, double min_radius,
                       double axis_blend) {
  MotionProfile p;
  p.name = name;
  p.detector = DetectorKind::CircularCompletion;
  p.rom_model = RomModel::Radius;
  p.cooldown_s = cooldown;
  p.min_radius_m = min_radius;
  p.axis_blend = axis_blend;
  return p;
}

MotionProfile camera(const std::string& name, DetectorKind kind, TrackedAngle angle) {
  MotionProfile p;
  p.name = name;
  p.detector = kind;
  p.rom_model = RomModel::JointAngle;
  p.tracked_angle = angle;
  return p;
}

std::vector<MotionProfile> builtin_profiles() {
  std::vector<MotionProfile> v;
  v.push_back(pendulum("forward_swing"));
  v.push_back(pendulum("side_sweep"));
  v.push_back(circular("follow_circle", 0.4, 0.02, 0.12));
  v.push_back(circular("stir", 0.38, 0.025, 0.15));
  v.push_back(camera("wall_climb", DetectorKind::VerticalTravel, TrackedAngle::Armpit));

  MotionProfile elbow = camera("elbow_extension", DetectorKind::ExtensionFlexion, TrackedAngle::Elbow);
  v.push_back(elbow);

  MotionProfile raise = camera("arm_raise", DetectorKind::ExtensionFlexion, TrackedAngle::Armpit);
  raise.extend_threshold_deg = 100.0;
  raise.flex_threshold_deg = 40.0;
  raise.min_rom_delta_deg = 45.0;
  v.push_back(raise);

  MotionProfile pattern = camera("constellation", DetectorKind::PatternConnection, TrackedAngle::Armpit);
  pattern.rom_model = RomModel::None;
  v.push_back(pattern);

  v.push_back(pendulum("custom"));
  return v;
}

template <typename Enum>
struct EnumName {
  Enum value;
  const char* name;
};

const EnumName<DetectorKind> kDetectors[] = {
  {DetectorKind::DirectionChange,    "direction_change"},
  {DetectorKind::CircularCompletion, "circular_completion"},
  {DetectorKind::VerticalTravel,     "vertical_travel"},
  {DetectorKind::ExtensionFlexion,   "extension_flexion"},
  {DetectorKind::PatternConnection,  "pattern_connection"},
};

const EnumName<RomModel> kRomModels[] = {
  {RomModel::ArcLength,  "arc_length"},
  {RomModel::Radius,     "radius"},
  {RomModel::JointAngle, "joint_angle"},
  {RomModel::None,       "none"},
};

const EnumName<TrackedAngle> kAngles[] = {
  {TrackedAngle::Elbow,           "elbow"},
  {TrackedAngle::Armpit,          "armpit"},
  {TrackedAngle::ArmFromVertical, "arm_from_vertical"},
};

const EnumName<PatternShape> kShapes[] = {
  {PatternShape::Triangle, "triangle"},
  {PatternShape::Square,   "square"},
  {PatternShape::Circle,   "circle"},
};

const EnumName<BodySide> kSides[] = {
  {BodySide::Left,  "left"},
  {BodySide::Right, "right"},
};

template <typename Enum, size_t N>
const char* name_of(const EnumName<Enum> (&table)[N], Enum value) {
  for (const auto& e : table) {
    if (e.value == value) return e.name;
  }
  return "unknown";
}

template <typename Enum, size_t N>
void read_enum(const json& j, const char* key, const EnumName<Enum> (&table)[N], Enum& out) {
  if (!j.contains(key)) return;
  const auto& v = j[key];
  if (!v.is_string()) throw std::runtime_error(std::string("profile key '") + key + "' must be a string");
  std::string s = v.get<std::string>();
  for (const auto& e : table) {
    if (s == e.name) {
      out = e.value;
      return;
    }
  }
  throw std::runtime_error(std::string("unknown value '") + s + "' for profile key '" + key + "'");
}

void read_number(const json& j, const char* key, double& out) {
  if (!j.contains(key)) return;
  const auto& v = j[key];
  if (!v.is_number()) throw std::runtime_error(std::string("profile key '") + key + "' must be a number");
  out = v.get<double>();
}

void read_int(const json& j, const char* key, int& out) {
  if (!j.contains(key)) return;
  const auto& v = j[key];
  if (!v.is_number_integer()) throw std::runtime_error(std::string("profile key '") + key + "' must be an integer");
  out = v.get<int>();
}

}  // namespace

bool find_profile(const std::string& name, MotionProfile& out) {
  for (const auto& p : builtin_profiles()) {
    if (p.name == name) {
      out = p;
      return true;
    }
  }
  return false;
}

std::vector<std::string> profile_names() {
  std::vector<std::string> names;
  for (const auto& p : builtin_profiles()) names.push_back(p.name);
  return names;
}

void apply_profile_overrides(MotionProfile& p, const json& j) {
  if (!j.is_object()) throw std::runtime_error("profile overrides must be a JSON object");

  if (j.contains("base")) {
    if (!j["base"].is_string()) throw std::runtime_error("profile key 'base' must be a string");
    std::string base = j["base"].get<std::string>();
    if (!find_profile(base, p)) throw std::runtime_error("unknown base profile '" + base + "'");
  }
  if (j.contains("name")) {
    if (!j["name"].is_string()) throw std::runtime_error("profile key 'name' must be a string");
    p.name = j["name"].get<std::string>();
  }

  read_enum(j, "detector", kDetectors, p.detector);
  read_enum(j, "rom_model", kRomModels, p.rom_model);
  read_enum(j, "tracked_angle", kAngles, p.tracked_angle);
  read_enum(j, "first_pattern", kShapes, p.first_pattern);
  read_enum(j, "side", kSides, p.side);

  read_number(j, "cooldown_s", p.cooldown_s);
  read_number(j, "min_displacement_m", p.min_displacement_m);
  read_int(j, "reversals_per_rep", p.reversals_per_rep);
  read_number(j, "history_window_s", p.history_window_s);
  read_number(j, "segment_noise_floor_m", p.segment_noise_floor_m);
  read_number(j, "min_arc_length_m", p.min_arc_length_m);
  read_number(j, "center_blend", p.center_blend);
  read_number(j, "min_radius_m", p.min_radius_m);
  read_number(j, "axis_blend", p.axis_blend);
  read_number(j, "max_angle_step_rad", p.max_angle_step_rad);
  read_number(j, "lap_window_s", p.lap_window_s);
  read_number(j, "min_confidence", p.min_confidence);
  read_number(j, "step_threshold", p.step_threshold);
  read_int(j, "sustain_frames", p.sustain_frames);
  read_number(j, "min_travel", p.min_travel);
  read_number(j, "rest_threshold", p.rest_threshold);
  read_number(j, "extend_threshold_deg", p.extend_threshold_deg);
  read_number(j, "flex_threshold_deg", p.flex_threshold_deg);
  read_number(j, "min_rom_delta_deg", p.min_rom_delta_deg);
  read_number(j, "hit_tolerance", p.hit_tolerance);
  read_number(j, "repeat_hit_s", p.repeat_hit_s);
  read_number(j, "pattern_size", p.pattern_size);

  if (p.reversals_per_rep < 1) throw std::runtime_error("reversals_per_rep must be at least 1");
  if (p.sustain_frames < 1) throw std::runtime_error("sustain_frames must be at least 1");
  if (p.flex_threshold_deg >= p.extend_threshold_deg) {
    throw std::runtime_error("flex_threshold_deg must be below extend_threshold_deg");
  }
}

bool is_camera_profile(const MotionProfile& profile) {
  switch (profile.detector) {
    case DetectorKind::VerticalTravel:
    case DetectorKind::ExtensionFlexion:
    case DetectorKind::PatternConnection:
      return true;
    default:
      return false;
  }
}

const char* detector_name(DetectorKind kind) { return name_of(kDetectors, kind); }
const char* rom_model_name(RomModel model) { return name_of(kRomModels, model); }
const char* pattern_name(PatternShape shape) { return name_of(kShapes, shape); }
