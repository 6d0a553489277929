#pragma once
#include "IRepDetector.hpp"
#include "MotionProfile.hpp"

// Extension/flexion cycles of one tracked joint angle. A rep is an excursion
// above extend_threshold followed by a drop below flex_threshold, with
// ROM = peak - start angle.
class ExtensionFlexionRepDetector : public IRepDetector {
public:
  enum class Phase { Flexed, Extending };

  ExtensionFlexionRepDetector(TrackedAngle angle, BodySide side, double min_confidence,
                              double extend_threshold_deg, double flex_threshold_deg,
                              double min_rom_delta_deg, double cooldown_s);

  RepEvent update(const SensorFrame& f) override;
  void reset() override;
  int total() const override { return total_; }

  Phase phase() const { return phase_; }
  double start_angle() const { return start_; }
  double peak_angle() const { return peak_; }

private:
  TrackedAngle angle_;
  BodySide side_;
  double min_confidence_;
  double high_;
  double low_;
  double min_delta_;
  double cooldown_s_;

  Phase phase_ = Phase::Flexed;
  bool has_start_ = false;
  double start_ = 0.0;
  double peak_ = 0.0;

  int total_ = 0;
  double last_rep_t_ = 0.0;
  bool has_rep_ = false;
};
