#pragma once
#include "SensorFrame.hpp"

struct RepEvent {
  bool completed = false;
  bool rejected = false;   // candidate dropped by cooldown; its ROM is discarded
  int total_reps = 0;
  bool has_rom = false;    // detector measured the rep's ROM itself
  double rom_deg = 0.0;

  // Too small a swing before any valid reversal: the rep restarts at the turn.
  bool rebased = false;
  // Turning point the next half-cycle starts from, when this sample revealed one.
  bool has_turn = false;
  Eigen::Vector3d turn = Eigen::Vector3d::Zero();
  double turn_t = 0.0;
};

class IRepDetector {
public:
  virtual ~IRepDetector() = default;
  virtual RepEvent update(const SensorFrame& f) = 0;
  virtual void reset() = 0;
  virtual int total() const = 0;
};
