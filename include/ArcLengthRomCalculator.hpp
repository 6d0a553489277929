#pragma once
#include "Calibration.hpp"
#include "Geometry.hpp"
#include "IRomCalculator.hpp"

// ROM from the arc swept by the hand, projected onto the plane the rep
// actually moved in.
class ArcLengthRomCalculator : public IRomCalculator {
public:
  // noise_floor_m: segments shorter than this are jitter
  // min_arc_m: reps whose projected arc is shorter are discarded
  ArcLengthRomCalculator(double noise_floor_m, double min_arc_m);

  void start(double arm_length) override;
  void add(const Eigen::Vector3d& p, double t) override;
  double live_rom() const override;
  bool complete_rep(double& rom_deg) override;
  void discard_rep() override;
  void reset() override;
  const std::vector<RepTrajectory>& trajectories() const override { return trajectories_; }

  // Raw, unprojected arc of the rep in progress.
  double running_arc_length() const { return running_arc_; }
  size_t buffered() const { return positions_.size(); }
  // First position of the rep in progress; false before any sample.
  bool baseline(Eigen::Vector3d& out) const {
    if (!has_baseline_) return false;
    out = baseline_;
    return true;
  }
  ProjectionPlane last_plane() const { return last_plane_; }
  double last_arc_length() const { return last_arc_; }

  // (arc / arm) in degrees, clamped to [0, 360]; 0 for an unusable arm.
  static double rom_from_arc(double arc_m, double arm_length_m);

private:
  double noise_floor_;
  double min_arc_;
  double arm_length_ = kDefaultArmLength;

  std::vector<Eigen::Vector3d> positions_;
  std::vector<double> timestamps_;
  Eigen::Vector3d baseline_ = Eigen::Vector3d::Zero();
  bool has_baseline_ = false;
  double running_arc_ = 0.0;

  ProjectionPlane last_plane_ = ProjectionPlane::XY;
  double last_arc_ = 0.0;
  std::vector<RepTrajectory> trajectories_;

  void clear_rep();
};
