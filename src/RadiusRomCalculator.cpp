#include "RadiusRomCalculator.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

double RadiusRomCalculator::rom_from_radius(double radius_m, double arm_length_m) {
  if (!std::isfinite(arm_length_m) || arm_length_m <= 0.0) return 0.0;
  if (std::isnan(radius_m) || radius_m <= 0.0) return 0.0;
  double ratio = std::min(std::max(radius_m / arm_length_m, 0.0), 1.0);
  double deg = to_degrees(std::asin(ratio));
  return std::min(std::max(deg, 0.0), 90.0);
}

void RadiusRomCalculator::start(double arm_length) {
  reset();
  arm_length_ = resolve_arm_length(arm_length);
}

void RadiusRomCalculator::add(const Eigen::Vector3d& p, double t) {
  if (!is_finite(p) || !std::isfinite(t)) return;

  if (count_ == 0) {
    center_ = p;
    count_ = 1;
  } else {
    double n = static_cast<double>(count_);
    center_ = (center_ * n + p) / (n + 1.0);
    ++count_;
  }

  current_radius_ = (p - center_).norm();
  rep_max_radius_ = std::max(rep_max_radius_, current_radius_);

  positions_.push_back(p);
  timestamps_.push_back(t);
}

double RadiusRomCalculator::live_rom() const {
  return rom_from_radius(current_radius_, arm_length_);
}

bool RadiusRomCalculator::complete_rep(double& rom_deg) {
  if (positions_.empty()) {
    rom_deg = 0.0;
    clear_rep();
    return false;
  }

  // The running maximum is inflated while the mean is still settling, so the
  // rep's own samples are measured again against the current center.
  double peak = 0.0;
  for (const auto& p : positions_) peak = std::max(peak, (p - center_).norm());
  last_rep_radius_ = peak;
  rom_deg = rom_from_radius(peak, arm_length_);

  RepTrajectory tr;
  tr.positions = positions_;
  tr.timestamps = timestamps_;
  trajectories_.push_back(std::move(tr));

  clear_rep();
  return true;
}

void RadiusRomCalculator::discard_rep() {
  clear_rep();
}

void RadiusRomCalculator::reset() {
  clear_rep();
  trajectories_.clear();
  center_ = Eigen::Vector3d::Zero();
  count_ = 0;
  current_radius_ = 0.0;
  last_rep_radius_ = 0.0;
  arm_length_ = kDefaultArmLength;
}

void RadiusRomCalculator::clear_rep() {
  positions_.clear();
  timestamps_.clear();
  rep_max_radius_ = 0.0;
}
