#include "RepSession.hpp"
#include "ArcLengthRomCalculator.hpp"
#include "Calibration.hpp"
#include "CircularRepDetector.hpp"
#include "DirectionChangeRepDetector.hpp"
#include "ExtensionFlexionRepDetector.hpp"
#include "Geometry.hpp"
#include "LandmarkAngles.hpp"
#include "RadiusRomCalculator.hpp"
#include "VerticalTravelRepDetector.hpp"

#include <algorithm>
#include <cmath>

std::unique_ptr<IRepDetector> make_detector(const MotionProfile& p) {
  switch (p.detector) {
    case DetectorKind::DirectionChange:
      return std::make_unique<DirectionChangeRepDetector>(
        p.min_displacement_m, p.cooldown_s, p.reversals_per_rep, p.history_window_s);
    case DetectorKind::CircularCompletion:
      return std::make_unique<CircularRepDetector>(
        p.center_blend, p.min_radius_m, p.axis_blend, p.max_angle_step_rad, p.cooldown_s,
        p.lap_window_s);
    case DetectorKind::VerticalTravel:
      return std::make_unique<VerticalTravelRepDetector>(
        p.tracked_angle, p.side, p.min_confidence, p.step_threshold, p.sustain_frames,
        p.min_travel, p.rest_threshold, p.cooldown_s);
    case DetectorKind::ExtensionFlexion:
      return std::make_unique<ExtensionFlexionRepDetector>(
        p.tracked_angle, p.side, p.min_confidence, p.extend_threshold_deg,
        p.flex_threshold_deg, p.min_rom_delta_deg, p.cooldown_s);
    case DetectorKind::PatternConnection:
      return nullptr;
  }
  return nullptr;
}

std::unique_ptr<IRomCalculator> make_rom_calculator(const MotionProfile& p) {
  switch (p.rom_model) {
    case RomModel::ArcLength:
      return std::make_unique<ArcLengthRomCalculator>(p.segment_noise_floor_m, p.min_arc_length_m);
    case RomModel::Radius:
      return std::make_unique<RadiusRomCalculator>();
    case RomModel::JointAngle:
    case RomModel::None:
      return nullptr;
  }
  return nullptr;
}

void RepSession::start(const MotionProfile& profile, double arm_length_m) {
  ISmoothnessSink* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    clear_locked();

    profile_ = profile;
    arm_length_ = resolve_arm_length(arm_length_m);
    if (profile_.detector == DetectorKind::PatternConnection) {
      patterns_ = std::make_unique<PatternConnectionValidator>(
        profile_.first_pattern, Eigen::Vector2d(0.5, 0.5), profile_.pattern_size,
        profile_.hit_tolerance, profile_.repeat_hit_s);
    } else {
      detector_ = make_detector(profile_);
      if (!is_camera_profile(profile_)) {
        rom_ = make_rom_calculator(profile_);
        if (rom_) rom_->start(arm_length_);
      }
    }
    active_ = true;
    sink = sink_;

    if (trace_) {
      *trace_ << "session start profile=" << profile_.name
              << " detector=" << detector_name(profile_.detector)
              << " rom=" << rom_model_name(profile_.rom_model)
              << " arm_length_m=" << arm_length_ << "\n";
    }
  }
  if (sink) sink->reset();
}

void RepSession::process(const SensorFrame& f) {
  Pending p;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_ || !std::isfinite(f.t)) return;

    if (is_camera_profile(profile_)) {
      if (f.kind != FrameKind::Landmarks) return;
      handle_landmarks(f, p);
    } else {
      if (f.kind != FrameKind::Position || !is_finite(f.position)) return;
      handle_position(f, p);
    }

    p.rep_cb = rep_cb_;
    p.live_cb = live_cb_;
    p.pattern_cb = pattern_cb_;
    p.sink = sink_;
  }
  dispatch(p);
}

void RepSession::process_position(const Eigen::Vector3d& pos, double t) {
  SensorFrame f;
  f.t = t;
  f.kind = FrameKind::Position;
  f.position = pos;
  process(f);
}

void RepSession::process_landmarks(const LandmarkSet& landmarks, double t) {
  SensorFrame f;
  f.t = t;
  f.kind = FrameKind::Landmarks;
  f.landmarks = landmarks;
  process(f);
}

void RepSession::connect_hand(const Eigen::Vector2d& pos, double t) {
  Pending p;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!active_ || !patterns_ || !std::isfinite(t) || !is_finite(pos)) return;
    handle_hand(pos, t, p);
    p.pattern_cb = pattern_cb_;
    p.sink = sink_;
  }
  dispatch(p);
}

void RepSession::handle_position(const SensorFrame& f, Pending& out) {
  RepEvent ev;
  bool restart = false;
  if (detector_) {
    ev = detector_->update(f);
    if (ev.completed) {
      restart = true;
      double rom = 0.0;
      if (!rom_) {
        record_rep(ev.has_rom ? ev.rom_deg : 0.0, out);
      } else if (rom_->complete_rep(rom)) {
        record_rep(rom, out);
      } else if (trace_) {
        *trace_ << "rep discarded t=" << f.t << " reason=short_arc\n";
      }
    } else if (ev.rejected) {
      restart = true;
      if (rom_) rom_->discard_rep();
      if (trace_) *trace_ << "rep discarded t=" << f.t << " reason=cooldown\n";
    } else if (ev.rebased) {
      // nothing counted yet; what came before the turn was noise
      restart = true;
      if (rom_) rom_->discard_rep();
    }
  }

  if (rom_) {
    // a new rep starts at the turning point, not at the sample that revealed it
    if (restart && ev.has_turn) rom_->add(ev.turn, ev.turn_t);
    rom_->add(f.position, f.t);
    double live = rom_->live_rom();
    live_rom_ = live;
    out.has_live = true;
    out.live = live;
  }

  out.has_position = true;
  out.position = f.position;
  out.t = f.t;
}

void RepSession::handle_landmarks(const SensorFrame& f, Pending& out) {
  Eigen::Vector2d wrist;
  bool has_wrist = usable_point(f.landmarks, wrist_of(profile_.side), profile_.min_confidence, wrist);

  if (patterns_) {
    if (has_wrist) handle_hand(wrist, f.t, out);
    return;
  }

  if (detector_) {
    RepEvent ev = detector_->update(f);

    JointPreference pref = (profile_.tracked_angle == TrackedAngle::Elbow)
                             ? JointPreference::Elbow
                             : JointPreference::Armpit;
    double live = 0.0;
    if (camera_rom(f.landmarks, profile_.side, pref, profile_.min_confidence, live)) {
      live_rom_ = live;
      out.has_live = true;
      out.live = live;
    }

    if (ev.completed) {
      record_rep(ev.has_rom ? ev.rom_deg : live_rom_.load(), out);
    } else if (ev.rejected && trace_) {
      *trace_ << "rep discarded t=" << f.t << " reason=cooldown\n";
    }
  }

  if (has_wrist) {
    out.has_cursor = true;
    out.cursor = wrist;
    out.t = f.t;
  }
}

void RepSession::handle_hand(const Eigen::Vector2d& pos, double t, Pending& out) {
  PatternEvent ev = patterns_->track_hand(pos, t);
  if (ev != PatternEvent::Ignored) {
    out.has_pattern = true;
    out.pattern = ev;
    out.patterns_completed = patterns_->completed();
    if (trace_) {
      *trace_ << "pattern " << pattern_event_name(ev) << " t=" << t
              << " completed=" << patterns_->completed() << "\n";
    }
  }
  out.has_cursor = true;
  out.cursor = pos;
  out.t = t;
}

void RepSession::record_rep(double rom_deg, Pending& out) {
  if (!std::isfinite(rom_deg)) rom_deg = 0.0;
  reps_++;
  rom_per_rep_.push_back(rom_deg);
  max_rom_ = std::max(max_rom_, rom_deg);
  rep_count_ = reps_;
  out.reps.emplace_back(reps_, rom_deg);
  if (trace_) *trace_ << "rep " << reps_ << " accepted rom_deg=" << rom_deg << "\n";
}

void RepSession::dispatch(const Pending& p) {
  if (p.rep_cb) {
    for (const auto& r : p.reps) p.rep_cb(r.first, r.second);
  }
  if (p.has_live && p.live_cb) p.live_cb(p.live);
  if (p.has_pattern && p.pattern_cb) p.pattern_cb(p.pattern, p.patterns_completed);
  if (p.sink) {
    if (p.has_position) p.sink->add_position(p.position, p.t);
    if (p.has_cursor) p.sink->add_cursor(p.cursor, p.t);
  }
}

int RepSession::end() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!active_) return reps_;

  if (rom_) ended_trajectories_ = rom_->trajectories();
  detector_.reset();
  rom_.reset();
  active_ = false;
  live_rom_ = 0.0;

  if (trace_) *trace_ << "session end profile=" << profile_.name << " reps=" << reps_ << "\n";
  return reps_;
}

void RepSession::reset() {
  ISmoothnessSink* sink = nullptr;
  {
    std::lock_guard<std::mutex> lock(mu_);
    clear_locked();
    sink = sink_;
  }
  if (sink) sink->reset();
}

void RepSession::clear_locked() {
  detector_.reset();
  rom_.reset();
  patterns_.reset();
  reps_ = 0;
  rom_per_rep_.clear();
  max_rom_ = 0.0;
  ended_trajectories_.clear();
  active_ = false;
  rep_count_ = 0;
  live_rom_ = 0.0;
}

void RepSession::on_rep(RepCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  rep_cb_ = std::move(cb);
}

void RepSession::on_live_rom(LiveRomCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  live_cb_ = std::move(cb);
}

void RepSession::on_pattern(PatternCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  pattern_cb_ = std::move(cb);
}

void RepSession::set_smoothness_sink(ISmoothnessSink* sink) {
  std::lock_guard<std::mutex> lock(mu_);
  sink_ = sink;
}

void RepSession::set_trace(std::ostream* out) {
  std::lock_guard<std::mutex> lock(mu_);
  trace_ = out;
}

SessionSummary RepSession::summary() const {
  std::lock_guard<std::mutex> lock(mu_);
  SessionSummary s;
  s.reps = reps_;
  s.rom_per_rep = rom_per_rep_;
  s.max_rom = max_rom_;
  if (!rom_per_rep_.empty()) {
    double sum = 0.0;
    for (double r : rom_per_rep_) sum += r;
    s.avg_rom = sum / rom_per_rep_.size();
  }
  if (patterns_) {
    s.patterns_completed = patterns_->completed();
    s.incorrect_connections = patterns_->incorrect();
  }
  return s;
}

MotionProfile RepSession::profile() const {
  std::lock_guard<std::mutex> lock(mu_);
  return profile_;
}

double RepSession::arm_length() const {
  std::lock_guard<std::mutex> lock(mu_);
  return arm_length_;
}

std::vector<RepTrajectory> RepSession::trajectories() const {
  std::lock_guard<std::mutex> lock(mu_);
  if (rom_) return rom_->trajectories();
  return ended_trajectories_;
}
