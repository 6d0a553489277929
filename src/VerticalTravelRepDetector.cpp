#include "VerticalTravelRepDetector.hpp"
#include "LandmarkAngles.hpp"
#include <cmath>

VerticalTravelRepDetector::VerticalTravelRepDetector(TrackedAngle angle, BodySide side,
                                                     double min_confidence, double step_threshold,
                                                     int sustain_frames, double min_travel,
                                                     double rest_threshold, double cooldown_s)
  : angle_(angle),
    side_(side),
    min_confidence_(min_confidence),
    step_(step_threshold),
    sustain_(sustain_frames < 1 ? 1 : sustain_frames),
    min_travel_(min_travel),
    rest_(rest_threshold),
    cooldown_s_(cooldown_s) {}

bool VerticalTravelRepDetector::wrist_height(const LandmarkSet& set, double min_confidence,
                                             double& out_y) {
  double sum = 0.0;
  int n = 0;
  Eigen::Vector2d p;
  if (usable_point(set, Joint::LeftWrist, min_confidence, p)) {
    sum += p.y();
    n++;
  }
  if (usable_point(set, Joint::RightWrist, min_confidence, p)) {
    sum += p.y();
    n++;
  }
  if (n == 0) return false;
  out_y = sum / n;
  return true;
}

void VerticalTravelRepDetector::begin_rise(double from_y, double y, bool has_angle, double angle) {
  phase_ = Phase::Rising;
  start_y_ = from_y;
  peak_y_ = y;
  has_peak_angle_ = has_angle;
  peak_angle_ = has_angle ? angle : 0.0;
  down_frames_ = 0;
}

RepEvent VerticalTravelRepDetector::update(const SensorFrame& f) {
  RepEvent ev{};
  ev.total_reps = total_;

  if (f.kind != FrameKind::Landmarks || !std::isfinite(f.t)) return ev;

  double y = 0.0;
  if (!wrist_height(f.landmarks, min_confidence_, y)) return ev;

  double angle = 0.0;
  bool has_angle = tracked_angle(f.landmarks, angle_, side_, min_confidence_, angle);

  if (!has_last_) {
    has_last_ = true;
    last_y_ = y;
    return ev;
  }

  double dy = last_y_ - y;  // positive = up on screen

  switch (phase_) {
    case Phase::Resting:
      if (dy > step_) begin_rise(last_y_, y, has_angle, angle);
      break;

    case Phase::Rising:
      if (y <= peak_y_) {
        peak_y_ = y;
        if (has_angle) {
          peak_angle_ = angle;
          has_peak_angle_ = true;
        }
      }

      if (dy < -step_) {
        down_frames_++;
      } else {
        down_frames_ = 0;
      }

      if (down_frames_ >= sustain_) {
        phase_ = Phase::Falling;
        last_travel_ = start_y_ - peak_y_;
        if (last_travel_ >= min_travel_) {
          if (!has_rep_ || (f.t - last_rep_t_) >= cooldown_s_) {
            total_++;
            last_rep_t_ = f.t;
            has_rep_ = true;
            ev.completed = true;
            ev.total_reps = total_;
            ev.has_rom = has_peak_angle_;
            ev.rom_deg = peak_angle_;
          } else {
            ev.rejected = true;
          }
        }
      }
      break;

    case Phase::Falling:
      if (dy > step_) {
        begin_rise(last_y_, y, has_angle, angle);
      } else if (std::fabs(dy) < rest_) {
        phase_ = Phase::Resting;
      }
      break;
  }

  last_y_ = y;
  return ev;
}

void VerticalTravelRepDetector::reset() {
  phase_ = Phase::Resting;
  has_last_ = false;
  last_y_ = 0.0;
  start_y_ = 0.0;
  peak_y_ = 0.0;
  has_peak_angle_ = false;
  peak_angle_ = 0.0;
  down_frames_ = 0;
  last_travel_ = 0.0;
  total_ = 0;
  last_rep_t_ = 0.0;
  has_rep_ = false;
}
