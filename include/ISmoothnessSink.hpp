#pragma once
#include <Eigen/Core>

// Receives the motion stream for an external smoothness (SPARC) scorer.
class ISmoothnessSink {
public:
  virtual ~ISmoothnessSink() = default;
  virtual void add_position(const Eigen::Vector3d& p, double t) = 0;
  // 2D cursor (tracked wrist) for camera profiles
  virtual void add_cursor(const Eigen::Vector2d& p, double t) = 0;
  virtual void reset() = 0;
};
