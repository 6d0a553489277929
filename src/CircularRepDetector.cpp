#include "CircularRepDetector.hpp"
#include "Geometry.hpp"
#include <Eigen/Geometry>
#include <algorithm>
#include <cmath>

namespace {
const double kFullTurn = 2.0 * 3.14159265358979323846;
// absorbs rounding when a lap closes exactly on a sample
const double kLapTolerance = 1e-6;
}

CircularRepDetector::CircularRepDetector(double center_blend, double min_radius_m, double axis_blend,
                                         double max_angle_step_rad, double cooldown_s,
                                         double lap_window_s)
  : center_blend_(center_blend),
    min_radius_(min_radius_m),
    axis_blend_(axis_blend),
    max_step_(max_angle_step_rad),
    cooldown_s_(cooldown_s),
    lap_window_s_(lap_window_s) {}

RepEvent CircularRepDetector::update(const SensorFrame& f) {
  RepEvent ev{};
  ev.total_reps = total_;

  if (f.kind != FrameKind::Position) return ev;
  const Eigen::Vector3d& p = f.position;
  if (!is_finite(p) || !std::isfinite(f.t)) return ev;

  if (!has_center_) {
    has_center_ = true;
    center_ = p;
    lap_.push_back(Sample{f.t, p});
    return ev;
  }

  center_ = center_ * (1.0 - center_blend_) + p * center_blend_;
  lap_.push_back(Sample{f.t, p});

  Eigen::Vector3d rel = p - center_;
  if (rel.norm() >= min_radius_) update_basis(rel);

  // trim to the lap window whether or not a basis exists
  while (lap_.size() > 2 && f.t - lap_.front().t > lap_window_s_) {
    double a0 = 0.0, a1 = 0.0;
    if (has_basis_ && angle_of(lap_[0].p, a0) && angle_of(lap_[1].p, a1)) {
      committed_ += step_between(a0, a1);
    }
    lap_.pop_front();
  }
  if (!has_basis_) return ev;

  double angle = 0.0;
  if (angle_of(p, angle)) last_angle_ = angle;

  accumulated_ = carry_ + committed_ + walk_lap();

  bool cooldown_met = !has_rep_ || (f.t - last_rep_t_) >= cooldown_s_;
  if (cooldown_met && std::fabs(accumulated_) >= kFullTurn - kLapTolerance) {
    total_++;
    last_rep_t_ = f.t;
    has_rep_ = true;
    ev.completed = true;
    ev.total_reps = total_;

    // keep the overshoot; the next lap starts here
    carry_ = accumulated_ - kFullTurn * (accumulated_ >= 0.0 ? 1.0 : -1.0);
    accumulated_ = carry_;
    committed_ = 0.0;
    lap_.clear();
    lap_.push_back(Sample{f.t, p});
  }

  return ev;
}

void CircularRepDetector::reset() {
  total_ = 0;
  last_rep_t_ = 0.0;
  has_rep_ = false;
  has_center_ = false;
  center_ = Eigen::Vector3d::Zero();
  has_basis_ = false;
  primary_ = Eigen::Vector3d::UnitX();
  secondary_ = Eigen::Vector3d::UnitZ();
  normal_ = Eigen::Vector3d::UnitY();
  lap_.clear();
  committed_ = 0.0;
  carry_ = 0.0;
  accumulated_ = 0.0;
  last_angle_ = 0.0;
}

void CircularRepDetector::update_basis(const Eigen::Vector3d& rel) {
  Eigen::Vector3d radial;
  if (!normalize(rel, radial)) return;

  if (!has_basis_) {
    primary_ = radial;
    if (!normalize(radial.cross(Eigen::Vector3d::UnitY()), normal_)) {
      normal_ = Eigen::Vector3d::UnitY();
    }
    if (!normalize(normal_.cross(radial), secondary_)) {
      secondary_ = Eigen::Vector3d::UnitZ();
    }
    has_basis_ = true;
    return;
  }

  Eigen::Vector3d blended;
  if (normalize(primary_ * (1.0 - axis_blend_) + radial * axis_blend_, blended)) {
    primary_ = blended;
  }

  Eigen::Vector3d across;
  if (normalize(rel - primary_ * rel.dot(primary_), across)) {
    if (normalize(secondary_ * (1.0 - axis_blend_) + across * axis_blend_, blended)) {
      secondary_ = blended;
    }
  }

  // re-orthogonalize
  Eigen::Vector3d n;
  if (normalize(primary_.cross(secondary_), n)) {
    normal_ = n;
    Eigen::Vector3d corrected;
    if (normalize(normal_.cross(primary_), corrected)) secondary_ = corrected;
  }
}

bool CircularRepDetector::angle_of(const Eigen::Vector3d& p, double& out) const {
  Eigen::Vector3d rel = p - center_;
  if (rel.norm() < min_radius_) return false;
  out = std::atan2(rel.dot(secondary_), rel.dot(primary_));
  return true;
}

double CircularRepDetector::step_between(double a, double b) const {
  double d = angle_delta(a, b);
  return std::min(std::max(d, -max_step_), max_step_);
}

double CircularRepDetector::walk_lap() const {
  double total = 0.0;
  double prev = 0.0;
  bool has_prev = false;
  for (const auto& s : lap_) {
    double a = 0.0;
    if (!angle_of(s.p, a)) continue;
    if (has_prev) total += step_between(prev, a);
    prev = a;
    has_prev = true;
  }
  return total;
}
