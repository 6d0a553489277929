#include "SensorFrame.hpp"

namespace {

struct JointEntry {
  Joint joint;
  const char* name;
};

const JointEntry kJoints[] = {
  {Joint::Nose,          "nose"},
  {Joint::LeftShoulder,  "left_shoulder"},
  {Joint::RightShoulder, "right_shoulder"},
  {Joint::LeftElbow,     "left_elbow"},
  {Joint::RightElbow,    "right_elbow"},
  {Joint::LeftWrist,     "left_wrist"},
  {Joint::RightWrist,    "right_wrist"},
  {Joint::LeftHip,       "left_hip"},
  {Joint::RightHip,      "right_hip"},
};

}  // namespace

const char* joint_name(Joint j) {
  for (const auto& e : kJoints) {
    if (e.joint == j) return e.name;
  }
  return "unknown";
}

bool joint_from_name(const std::string& name, Joint& out) {
  for (const auto& e : kJoints) {
    if (name == e.name) {
      out = e.joint;
      return true;
    }
  }
  return false;
}

Joint shoulder_of(BodySide side) {
  return side == BodySide::Left ? Joint::LeftShoulder : Joint::RightShoulder;
}

Joint elbow_of(BodySide side) {
  return side == BodySide::Left ? Joint::LeftElbow : Joint::RightElbow;
}

Joint wrist_of(BodySide side) {
  return side == BodySide::Left ? Joint::LeftWrist : Joint::RightWrist;
}

Joint hip_of(BodySide side) {
  return side == BodySide::Left ? Joint::LeftHip : Joint::RightHip;
}
