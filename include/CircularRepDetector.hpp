#pragma once
#include "IRepDetector.hpp"
#include <Eigen/Core>
#include <deque>

// Counts full laps around a slowly drifting center, in either direction.
//
// The angle of the open lap is walked again around the current center on
// every sample, so the error of an early center estimate does not stay in the
// total. Samples older than the lap window are folded into a committed sum
// with the center of the moment they leave.
class CircularRepDetector : public IRepDetector {
public:
  CircularRepDetector(double center_blend, double min_radius_m, double axis_blend,
                      double max_angle_step_rad, double cooldown_s, double lap_window_s);

  RepEvent update(const SensorFrame& f) override;
  void reset() override;
  int total() const override { return total_; }

  // Signed angle since the last lap (radians), overshoot included.
  double accumulated_angle() const { return accumulated_; }
  double last_angle() const { return last_angle_; }
  bool has_basis() const { return has_basis_; }
  size_t lap_size() const { return lap_.size(); }
  const Eigen::Vector3d& center() const { return center_; }
  const Eigen::Vector3d& normal() const { return normal_; }

private:
  struct Sample {
    double t;
    Eigen::Vector3d p;
  };

  double center_blend_;
  double min_radius_;
  double axis_blend_;
  double max_step_;
  double cooldown_s_;
  double lap_window_s_;

  int total_ = 0;
  double last_rep_t_ = 0.0;
  bool has_rep_ = false;

  bool has_center_ = false;
  Eigen::Vector3d center_ = Eigen::Vector3d::Zero();

  bool has_basis_ = false;
  Eigen::Vector3d primary_ = Eigen::Vector3d::UnitX();
  Eigen::Vector3d secondary_ = Eigen::Vector3d::UnitZ();
  Eigen::Vector3d normal_ = Eigen::Vector3d::UnitY();

  std::deque<Sample> lap_;
  double committed_ = 0.0;
  double carry_ = 0.0;
  double accumulated_ = 0.0;
  double last_angle_ = 0.0;

  void update_basis(const Eigen::Vector3d& rel);
  bool angle_of(const Eigen::Vector3d& p, double& out) const;
  double step_between(double a, double b) const;
  double walk_lap() const;
};
