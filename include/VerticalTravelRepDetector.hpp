#pragma once
#include "IRepDetector.hpp"
#include "MotionProfile.hpp"

// Upward reaches tracked by wrist height in screen space (y grows downward).
//
// Resting -> Rising when the wrist moves up by more than step_threshold in one
// frame. While rising the highest point and the tracked angle there are kept.
// sustain_frames consecutive downward steps end the reach; it counts when
// start - peak >= min_travel, with the angle at the peak as its ROM.
class VerticalTravelRepDetector : public IRepDetector {
public:
  enum class Phase { Resting, Rising, Falling };

  VerticalTravelRepDetector(TrackedAngle angle, BodySide side, double min_confidence,
                            double step_threshold, int sustain_frames, double min_travel,
                            double rest_threshold, double cooldown_s);

  RepEvent update(const SensorFrame& f) override;
  void reset() override;
  int total() const override { return total_; }

  Phase phase() const { return phase_; }
  double start_y() const { return start_y_; }
  double peak_y() const { return peak_y_; }
  double last_travel() const { return last_travel_; }

  // Mean height of the wrists that pass the confidence gate.
  static bool wrist_height(const LandmarkSet& set, double min_confidence, double& out_y);

private:
  TrackedAngle angle_;
  BodySide side_;
  double min_confidence_;
  double step_;
  int sustain_;
  double min_travel_;
  double rest_;
  double cooldown_s_;

  Phase phase_ = Phase::Resting;
  bool has_last_ = false;
  double last_y_ = 0.0;
  double start_y_ = 0.0;
  double peak_y_ = 0.0;
  bool has_peak_angle_ = false;
  double peak_angle_ = 0.0;
  int down_frames_ = 0;
  double last_travel_ = 0.0;

  int total_ = 0;
  double last_rep_t_ = 0.0;
  bool has_rep_ = false;

  void begin_rise(double from_y, double y, bool has_angle, double angle);
};
