#pragma once
#include "IRepDetector.hpp"
#include "IRomCalculator.hpp"
#include "ISmoothnessSink.hpp"
#include "MotionProfile.hpp"
#include "PatternConnection.hpp"
#include "SensorFrame.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <vector>

struct SessionSummary {
  int reps = 0;
  std::vector<double> rom_per_rep;
  double max_rom = 0.0;
  double avg_rom = 0.0;
  int patterns_completed = 0;
  int incorrect_connections = 0;
};

std::unique_ptr<IRepDetector> make_detector(const MotionProfile& profile);
// nullptr for profiles whose ROM comes from the detector or that have none
std::unique_ptr<IRomCalculator> make_rom_calculator(const MotionProfile& profile);

// One exercise attempt: a profile bound to its detector and ROM calculator.
//
// All mutation is serialized by one mutex, so samples and session controls
// may come from different threads. rep_count() and live_rom() are readable
// from anywhere without locking. Callbacks run on the calling thread after
// the lock is released, so they may call back into the session.
class RepSession {
public:
  using RepCallback = std::function<void(int rep_index, double rom_deg)>;
  using LiveRomCallback = std::function<void(double rom_deg)>;
  using PatternCallback = std::function<void(PatternEvent ev, int patterns_completed)>;

  RepSession() = default;
  RepSession(const RepSession&) = delete;
  RepSession& operator=(const RepSession&) = delete;

  // Replaces any running session.
  void start(const MotionProfile& profile, double arm_length_m);

  void process(const SensorFrame& f);
  void process_position(const Eigen::Vector3d& p, double t);
  void process_landmarks(const LandmarkSet& landmarks, double t);
  // Pattern profiles: hand position in normalized screen space.
  void connect_hand(const Eigen::Vector2d& pos, double t);

  // Final accepted rep count. The summary stays readable until reset/start.
  int end();
  void reset();

  void on_rep(RepCallback cb);
  void on_live_rom(LiveRomCallback cb);
  void on_pattern(PatternCallback cb);
  void set_smoothness_sink(ISmoothnessSink* sink);
  // Audit lines (session start/end, reps accepted or discarded). nullptr = off.
  void set_trace(std::ostream* out);

  bool active() const { return active_.load(); }
  int rep_count() const { return rep_count_.load(); }
  double live_rom() const { return live_rom_.load(); }

  SessionSummary summary() const;
  MotionProfile profile() const;
  double arm_length() const;
  std::vector<RepTrajectory> trajectories() const;

private:
  struct Pending {
    std::vector<std::pair<int, double>> reps;
    bool has_live = false;
    double live = 0.0;
    bool has_pattern = false;
    PatternEvent pattern = PatternEvent::Ignored;
    int patterns_completed = 0;
    bool has_position = false;
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    bool has_cursor = false;
    Eigen::Vector2d cursor = Eigen::Vector2d::Zero();
    double t = 0.0;

    RepCallback rep_cb;
    LiveRomCallback live_cb;
    PatternCallback pattern_cb;
    ISmoothnessSink* sink = nullptr;
  };

  mutable std::mutex mu_;
  MotionProfile profile_;
  double arm_length_ = 0.0;
  std::unique_ptr<IRepDetector> detector_;
  std::unique_ptr<IRomCalculator> rom_;
  std::unique_ptr<PatternConnectionValidator> patterns_;

  int reps_ = 0;
  std::vector<double> rom_per_rep_;
  double max_rom_ = 0.0;
  std::vector<RepTrajectory> ended_trajectories_;

  RepCallback rep_cb_;
  LiveRomCallback live_cb_;
  PatternCallback pattern_cb_;
  ISmoothnessSink* sink_ = nullptr;
  std::ostream* trace_ = nullptr;

  std::atomic<bool> active_{false};
  std::atomic<int> rep_count_{0};
  std::atomic<double> live_rom_{0.0};

  void handle_position(const SensorFrame& f, Pending& out);
  void handle_landmarks(const SensorFrame& f, Pending& out);
  void handle_hand(const Eigen::Vector2d& pos, double t, Pending& out);
  void record_rep(double rom_deg, Pending& out);
  void clear_locked();
  void dispatch(const Pending& p);
};
