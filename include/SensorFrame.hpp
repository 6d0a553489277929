#pragma once
#include <Eigen/Core>
#include <map>
#include <string>

enum class Joint {
  Nose,
  LeftShoulder,
  RightShoulder,
  LeftElbow,
  RightElbow,
  LeftWrist,
  RightWrist,
  LeftHip,
  RightHip
};

enum class BodySide { Left, Right };

// Normalized screen space: x right, y down, both in [0, 1].
struct Landmark {
  Eigen::Vector2d point = Eigen::Vector2d::Zero();
  double confidence = 1.0;
};

using LandmarkSet = std::map<Joint, Landmark>;

enum class FrameKind { Position, Landmarks };

struct SensorFrame {
  double t = 0.0;                      // monotonic seconds
  FrameKind kind = FrameKind::Position;
  Eigen::Vector3d position = Eigen::Vector3d::Zero();  // meters
  LandmarkSet landmarks;
};

const char* joint_name(Joint j);
bool joint_from_name(const std::string& name, Joint& out);

// Joint on the given side of the body for a side-less role.
Joint shoulder_of(BodySide side);
Joint elbow_of(BodySide side);
Joint wrist_of(BodySide side);
Joint hip_of(BodySide side);
