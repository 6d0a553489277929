#include "ExtensionFlexionRepDetector.hpp"
#include "LandmarkAngles.hpp"
#include <cmath>

ExtensionFlexionRepDetector::ExtensionFlexionRepDetector(TrackedAngle angle, BodySide side,
                                                         double min_confidence,
                                                         double extend_threshold_deg,
                                                         double flex_threshold_deg,
                                                         double min_rom_delta_deg,
                                                         double cooldown_s)
  : angle_(angle),
    side_(side),
    min_confidence_(min_confidence),
    high_(extend_threshold_deg),
    low_(flex_threshold_deg),
    min_delta_(min_rom_delta_deg),
    cooldown_s_(cooldown_s) {}

RepEvent ExtensionFlexionRepDetector::update(const SensorFrame& f) {
  RepEvent ev{};
  ev.total_reps = total_;

  if (f.kind != FrameKind::Landmarks || !std::isfinite(f.t)) return ev;

  double a = 0.0;
  if (!tracked_angle(f.landmarks, angle_, side_, min_confidence_, a)) return ev;

  if (phase_ == Phase::Flexed) {
    // the most flexed point before extending is the start angle
    if (!has_start_ || a < start_) {
      start_ = a;
      has_start_ = true;
    }
    if (a > high_) {
      phase_ = Phase::Extending;
      peak_ = a;
    }
    return ev;
  }

  if (a > peak_) peak_ = a;

  if (a < low_) {
    double delta = peak_ - start_;
    if (delta >= min_delta_) {
      if (!has_rep_ || (f.t - last_rep_t_) >= cooldown_s_) {
        total_++;
        last_rep_t_ = f.t;
        has_rep_ = true;
        ev.completed = true;
        ev.total_reps = total_;
        ev.has_rom = true;
        ev.rom_deg = delta;
      } else {
        ev.rejected = true;
      }
    }
    phase_ = Phase::Flexed;
    start_ = a;
    peak_ = a;
  }

  return ev;
}

void ExtensionFlexionRepDetector::reset() {
  phase_ = Phase::Flexed;
  has_start_ = false;
  start_ = 0.0;
  peak_ = 0.0;
  total_ = 0;
  last_rep_t_ = 0.0;
  has_rep_ = false;
}
