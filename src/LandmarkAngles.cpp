#include "LandmarkAngles.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace {

const double kMinSegment = 1e-6;

bool unsigned_angle(const Eigen::Vector2d& u, const Eigen::Vector2d& v, double& out_deg) {
  double lu = u.norm();
  double lv = v.norm();
  if (!std::isfinite(lu) || !std::isfinite(lv) || lu < kMinSegment || lv < kMinSegment) return false;
  double c = std::min(1.0, std::max(-1.0, u.dot(v) / (lu * lv)));
  out_deg = std::min(180.0, std::max(0.0, to_degrees(std::acos(c))));
  return true;
}

bool side_rom(const LandmarkSet& set, BodySide side, JointPreference preference,
              double min_confidence, double& out_deg) {
  Eigen::Vector2d shoulder, elbow, wrist, hip;
  bool has_shoulder = usable_point(set, shoulder_of(side), min_confidence, shoulder);
  bool has_elbow = usable_point(set, elbow_of(side), min_confidence, elbow);
  if (!has_shoulder || !has_elbow) return false;

  if (preference == JointPreference::Elbow &&
      usable_point(set, wrist_of(side), min_confidence, wrist) &&
      three_point_angle(shoulder, elbow, wrist, out_deg)) {
    return true;
  }
  if (usable_point(set, hip_of(side), min_confidence, hip) &&
      three_point_angle(hip, shoulder, elbow, out_deg)) {
    return true;
  }
  return angle_from_vertical(shoulder, elbow, out_deg);
}

}  // namespace

bool usable_point(const LandmarkSet& set, Joint j, double min_confidence, Eigen::Vector2d& out) {
  auto it = set.find(j);
  if (it == set.end()) return false;
  const Landmark& lm = it->second;
  if (!std::isfinite(lm.confidence) || lm.confidence < min_confidence) return false;
  if (!is_finite(lm.point)) return false;
  out = lm.point;
  return true;
}

bool three_point_angle(const Eigen::Vector2d& a, const Eigen::Vector2d& vertex,
                       const Eigen::Vector2d& c, double& out_deg) {
  return unsigned_angle(a - vertex, c - vertex, out_deg);
}

bool angle_from_vertical(const Eigen::Vector2d& from, const Eigen::Vector2d& to, double& out_deg) {
  return unsigned_angle(to - from, Eigen::Vector2d(0.0, 1.0), out_deg);
}

bool tracked_angle(const LandmarkSet& set, TrackedAngle angle, BodySide side,
                   double min_confidence, double& out_deg) {
  Eigen::Vector2d shoulder, elbow;
  if (!usable_point(set, shoulder_of(side), min_confidence, shoulder)) return false;
  if (!usable_point(set, elbow_of(side), min_confidence, elbow)) return false;

  switch (angle) {
    case TrackedAngle::Elbow: {
      Eigen::Vector2d wrist;
      if (!usable_point(set, wrist_of(side), min_confidence, wrist)) return false;
      return three_point_angle(shoulder, elbow, wrist, out_deg);
    }
    case TrackedAngle::Armpit: {
      Eigen::Vector2d hip;
      if (!usable_point(set, hip_of(side), min_confidence, hip)) return false;
      return three_point_angle(hip, shoulder, elbow, out_deg);
    }
    case TrackedAngle::ArmFromVertical:
      return angle_from_vertical(shoulder, elbow, out_deg);
  }
  return false;
}

bool camera_rom(const LandmarkSet& set, BodySide side, JointPreference preference,
                double min_confidence, double& out_deg) {
  if (side_rom(set, side, preference, min_confidence, out_deg)) return true;
  BodySide other = (side == BodySide::Left) ? BodySide::Right : BodySide::Left;
  return side_rom(set, other, preference, min_confidence, out_deg);
}
