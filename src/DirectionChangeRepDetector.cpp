#include "DirectionChangeRepDetector.hpp"
#include "Geometry.hpp"
#include <cmath>

namespace {
// Steps smaller than this carry no direction.
const double kFlatStep = 1e-9;
}

DirectionChangeRepDetector::DirectionChangeRepDetector(double min_displacement_m, double cooldown_s,
                                                       int reversals_per_rep, double window_s)
  : min_disp_(min_displacement_m),
    cooldown_s_(cooldown_s),
    reversals_per_rep_(reversals_per_rep < 1 ? 1 : reversals_per_rep),
    window_s_(window_s) {}

RepEvent DirectionChangeRepDetector::update(const SensorFrame& f) {
  RepEvent ev{};
  ev.total_reps = total_;

  if (f.kind != FrameKind::Position) return ev;
  const Eigen::Vector3d& p = f.position;
  if (!is_finite(p) || !std::isfinite(f.t)) return ev;

  history_.push_back(Sample{f.t, p});
  while (!history_.empty() && f.t - history_.front().t > window_s_) {
    history_.pop_front();
  }

  if (!has_prev_) {
    has_prev_ = true;
    prev_ = p;
    prev_t_ = f.t;
    begin_half(p);
    return ev;
  }

  // 1) Direction of this step on whichever axis moved most
  Eigen::Vector3d d = p - prev_;
  double step = d[dominant_axis(d)];

  if (std::fabs(step) < kFlatStep) {
    // flat sample: neither a direction nor a reset
    prev_ = p;
    prev_t_ = f.t;
    return ev;
  }

  int dir = (step > 0.0) ? +1 : -1;

  // 2) First direction ever seen has nothing to reverse from
  if (last_dir_ == 0) {
    last_dir_ = dir;
    track_peak(p);
    prev_ = p;
    prev_t_ = f.t;
    return ev;
  }

  if (dir == last_dir_) {
    track_peak(p);
    prev_ = p;
    prev_t_ = f.t;
    return ev;
  }

  // 3) Reversal at prev_: judge the half-cycle that just ended
  ev.has_turn = true;
  ev.turn = prev_;
  ev.turn_t = prev_t_;
  if (peak_dist_ >= min_disp_) {
    flips_++;
    if (flips_ >= reversals_per_rep_) {
      flips_ = 0;
      if (!has_rep_ || (f.t - last_rep_t_) >= cooldown_s_) {
        total_++;
        last_rep_t_ = f.t;
        has_rep_ = true;
        ev.completed = true;
        ev.total_reps = total_;
      } else {
        ev.rejected = true;
      }
    }
  } else if (flips_ == 0) {
    ev.rebased = true;
  }

  // counted or not, the next half-cycle starts at the turning point
  begin_half(prev_);
  track_peak(p);
  last_dir_ = dir;
  prev_ = p;
  prev_t_ = f.t;
  return ev;
}

void DirectionChangeRepDetector::reset() {
  total_ = 0;
  flips_ = 0;
  last_dir_ = 0;
  last_rep_t_ = 0.0;
  has_rep_ = false;
  history_.clear();
  has_prev_ = false;
  prev_ = Eigen::Vector3d::Zero();
  prev_t_ = 0.0;
  begin_half(Eigen::Vector3d::Zero());
}

void DirectionChangeRepDetector::begin_half(const Eigen::Vector3d& at) {
  half_start_ = at;
  peak_ = at;
  peak_dist_ = 0.0;
}

void DirectionChangeRepDetector::track_peak(const Eigen::Vector3d& p) {
  double dist = (p - half_start_).norm();
  if (dist > peak_dist_) {
    peak_dist_ = dist;
    peak_ = p;
  }
}
