#pragma once
#include "Calibration.hpp"
#include "IRomCalculator.hpp"

// ROM of circular motion: the hand's radius about the session center read as
// the chord of a swing of the calibrated arm.
class RadiusRomCalculator : public IRomCalculator {
public:
  RadiusRomCalculator() = default;

  void start(double arm_length) override;
  void add(const Eigen::Vector3d& p, double t) override;
  double live_rom() const override;
  bool complete_rep(double& rom_deg) override;
  void discard_rep() override;
  void reset() override;
  const std::vector<RepTrajectory>& trajectories() const override { return trajectories_; }

  const Eigen::Vector3d& center() const { return center_; }
  double current_radius() const { return current_radius_; }
  double rep_max_radius() const { return rep_max_radius_; }
  double last_rep_radius() const { return last_rep_radius_; }
  size_t buffered() const { return positions_.size(); }

  // asin(radius / arm) in degrees, clamped to [0, 90]; 0 for an unusable arm.
  static double rom_from_radius(double radius_m, double arm_length_m);

private:
  double arm_length_ = kDefaultArmLength;

  // incremental mean of every position this session
  Eigen::Vector3d center_ = Eigen::Vector3d::Zero();
  long count_ = 0;

  double current_radius_ = 0.0;
  double rep_max_radius_ = 0.0;
  double last_rep_radius_ = 0.0;

  std::vector<Eigen::Vector3d> positions_;
  std::vector<double> timestamps_;
  std::vector<RepTrajectory> trajectories_;

  void clear_rep();
};
