#pragma once
#include "IRepDetector.hpp"
#include <Eigen/Core>
#include <deque>

// Counts pendulum reps from sign reversals on the axis carrying the motion.
class DirectionChangeRepDetector : public IRepDetector {
public:
  // min_displacement_m: start-to-peak distance a half-cycle needs to count
  // cooldown_s: minimum time between counted reps
  // reversals_per_rep: valid reversals making up one rep (2 = out and back)
  // window_s: how much position history is kept
  DirectionChangeRepDetector(double min_displacement_m, double cooldown_s,
                             int reversals_per_rep, double window_s);

  RepEvent update(const SensorFrame& f) override;
  void reset() override;
  int total() const override { return total_; }

  int direction() const { return last_dir_; }
  size_t history_size() const { return history_.size(); }

private:
  struct Sample {
    double t;
    Eigen::Vector3d p;
  };

  double min_disp_;
  double cooldown_s_;
  int reversals_per_rep_;
  double window_s_;

  int total_ = 0;
  int flips_ = 0;          // valid reversals in the current rep
  int last_dir_ = 0;       // +1 or -1 once motion is seen
  double last_rep_t_ = 0.0;
  bool has_rep_ = false;

  // bounded recent positions; only read through history_size()
  std::deque<Sample> history_;
  bool has_prev_ = false;
  Eigen::Vector3d prev_ = Eigen::Vector3d::Zero();
  double prev_t_ = 0.0;

  // current half-cycle: where it began and the furthest point from there
  Eigen::Vector3d half_start_ = Eigen::Vector3d::Zero();
  Eigen::Vector3d peak_ = Eigen::Vector3d::Zero();
  double peak_dist_ = 0.0;

  void begin_half(const Eigen::Vector3d& at);

  void track_peak(const Eigen::Vector3d& p);
};
