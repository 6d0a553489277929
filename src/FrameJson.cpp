#include "FrameJson.hpp"

using nlohmann::json;

namespace {

bool read_number(const json& j, const char* key, double& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) return false;
  out = it->get<double>();
  return true;
}

}  // namespace

bool frame_from_json(const json& j, SensorFrame& out) {
  if (!j.is_object()) return false;

  SensorFrame f;
  if (!read_number(j, "t", f.t)) return false;

  auto pos = j.find("position");
  if (pos != j.end() && pos->is_object()) {
    double x = 0.0, y = 0.0, z = 0.0;
    if (!read_number(*pos, "x", x) || !read_number(*pos, "y", y) || !read_number(*pos, "z", z)) {
      return false;
    }
    f.kind = FrameKind::Position;
    f.position = Eigen::Vector3d(x, y, z);
    out = f;
    return true;
  }

  auto lms = j.find("landmarks");
  if (lms != j.end() && lms->is_object()) {
    f.kind = FrameKind::Landmarks;
    for (auto it = lms->begin(); it != lms->end(); ++it) {
      Joint joint;
      if (!joint_from_name(it.key(), joint) || !it.value().is_object()) continue;

      Landmark lm;
      double x = 0.0, y = 0.0;
      if (!read_number(it.value(), "x", x) || !read_number(it.value(), "y", y)) continue;
      lm.point = Eigen::Vector2d(x, y);
      read_number(it.value(), "c", lm.confidence);
      f.landmarks[joint] = lm;
    }
    out = f;
    return true;
  }

  return false;
}

json frame_to_json(const SensorFrame& f) {
  json j;
  j["t"] = f.t;
  if (f.kind == FrameKind::Position) {
    j["position"] = {{"x", f.position.x()}, {"y", f.position.y()}, {"z", f.position.z()}};
  } else {
    json lms = json::object();
    for (const auto& kv : f.landmarks) {
      lms[joint_name(kv.first)] = {
        {"x", kv.second.point.x()}, {"y", kv.second.point.y()}, {"c", kv.second.confidence}};
    }
    j["landmarks"] = lms;
  }
  return j;
}

json rep_event_json(int rep_index, double rom_deg) {
  return {{"event", "rep"}, {"rep", rep_index}, {"rom", rom_deg}};
}

json live_rom_json(double rom_deg) {
  return {{"event", "live"}, {"rom", rom_deg}};
}

json pattern_event_json(PatternEvent ev, int patterns_completed) {
  return {{"event", "pattern"}, {"result", pattern_event_name(ev)}, {"completed", patterns_completed}};
}

json summary_json(const std::string& profile, const SessionSummary& s) {
  return {
    {"event", "summary"},
    {"profile", profile},
    {"reps", s.reps},
    {"rom_per_rep", s.rom_per_rep},
    {"max_rom", s.max_rom},
    {"avg_rom", s.avg_rom},
    {"patterns_completed", s.patterns_completed},
    {"incorrect_connections", s.incorrect_connections},
  };
}
