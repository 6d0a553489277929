#pragma once
#include <Eigen/Core>
#include <vector>

struct RepTrajectory {
  std::vector<Eigen::Vector3d> positions;
  std::vector<double> timestamps;
};

class IRomCalculator {
public:
  virtual ~IRomCalculator() = default;

  virtual void start(double arm_length) = 0;
  virtual void add(const Eigen::Vector3d& p, double t) = 0;
  virtual double live_rom() const = 0;

  // Finalizes the in-progress rep into rom_deg. The rep buffer is cleared
  // whether or not the rep is accepted.
  virtual bool complete_rep(double& rom_deg) = 0;
  virtual void discard_rep() = 0;
  virtual void reset() = 0;

  // Trajectories of accepted reps, oldest first.
  virtual const std::vector<RepTrajectory>& trajectories() const = 0;
};
