#include "ArcLengthRomCalculator.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

ArcLengthRomCalculator::ArcLengthRomCalculator(double noise_floor_m, double min_arc_m)
  : noise_floor_(noise_floor_m), min_arc_(min_arc_m) {}

double ArcLengthRomCalculator::rom_from_arc(double arc_m, double arm_length_m) {
  if (!std::isfinite(arm_length_m) || arm_length_m <= 0.0) return 0.0;
  if (std::isnan(arc_m) || arc_m <= 0.0) return 0.0;
  double deg = to_degrees(arc_m / arm_length_m);
  return std::min(std::max(deg, 0.0), 360.0);
}

void ArcLengthRomCalculator::start(double arm_length) {
  reset();
  arm_length_ = resolve_arm_length(arm_length);
}

void ArcLengthRomCalculator::add(const Eigen::Vector3d& p, double t) {
  if (!is_finite(p) || !std::isfinite(t)) return;

  if (!has_baseline_) {
    baseline_ = p;
    has_baseline_ = true;
  }

  if (!positions_.empty()) {
    double seg = (p - positions_.back()).norm();
    if (seg >= noise_floor_) running_arc_ += seg;
  }
  positions_.push_back(p);
  timestamps_.push_back(t);
}

double ArcLengthRomCalculator::live_rom() const {
  return rom_from_arc(running_arc_, arm_length_);
}

bool ArcLengthRomCalculator::complete_rep(double& rom_deg) {
  // re-walk the rep on its own best-fit plane
  last_plane_ = select_projection_plane(positions_);
  last_arc_ = projected_path_length(positions_, last_plane_, noise_floor_);
  rom_deg = rom_from_arc(last_arc_, arm_length_);

  bool accepted = last_arc_ >= min_arc_;
  if (accepted) {
    RepTrajectory tr;
    tr.positions = positions_;
    tr.timestamps = timestamps_;
    trajectories_.push_back(std::move(tr));
  }

  clear_rep();
  return accepted;
}

void ArcLengthRomCalculator::discard_rep() {
  clear_rep();
}

void ArcLengthRomCalculator::reset() {
  clear_rep();
  trajectories_.clear();
  last_plane_ = ProjectionPlane::XY;
  last_arc_ = 0.0;
  arm_length_ = kDefaultArmLength;
}

void ArcLengthRomCalculator::clear_rep() {
  positions_.clear();
  timestamps_.clear();
  has_baseline_ = false;
  baseline_ = Eigen::Vector3d::Zero();
  running_arc_ = 0.0;
}
