#pragma once
#include "MotionProfile.hpp"
#include <Eigen/Core>
#include <cstddef>
#include <vector>

enum class PatternEvent { Started, Connected, Ignored, Incorrect, Completed };

const char* pattern_event_name(PatternEvent ev);

// Target points of a shape around center, in drawing order. Neighbours in the
// list are the connections the shape allows (the list wraps around).
std::vector<Eigen::Vector2d> make_pattern(PatternShape shape, const Eigen::Vector2d& center,
                                          double size);

// Closest point within tolerance of pos.
bool nearest_point(const std::vector<Eigen::Vector2d>& points, const Eigen::Vector2d& pos,
                   double tolerance, size_t& index);

PatternShape next_pattern(PatternShape shape);

// Connect-the-dots rules for one pattern at a time. Every point is visited
// once along allowed connections, then the path closes on the first point.
// A wrong move clears the current pattern's progress only.
class PatternConnectionValidator {
public:
  PatternConnectionValidator(PatternShape first, const Eigen::Vector2d& center, double size,
                             double hit_tolerance, double repeat_hit_s);

  PatternEvent connect(size_t index);

  // Hit-tests the hand against the current pattern; a hand resting on the
  // point it just hit does not hit it again within repeat_hit_s.
  PatternEvent track_hand(const Eigen::Vector2d& pos, double t);

  void reset();

  PatternShape shape() const { return shape_; }
  const std::vector<Eigen::Vector2d>& points() const { return points_; }
  const std::vector<size_t>& path() const { return path_; }
  int completed() const { return completed_; }
  int incorrect() const { return incorrect_; }

private:
  PatternShape first_;
  Eigen::Vector2d center_;
  double size_;
  double tolerance_;
  double repeat_hit_s_;

  PatternShape shape_;
  std::vector<Eigen::Vector2d> points_;
  std::vector<size_t> path_;
  int completed_ = 0;
  int incorrect_ = 0;

  bool has_hit_ = false;
  size_t last_hit_ = 0;
  double last_hit_t_ = 0.0;

  bool adjacent(size_t a, size_t b) const;
  bool visited(size_t index) const;
  PatternEvent fail();
};
