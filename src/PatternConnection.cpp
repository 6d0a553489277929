#include "PatternConnection.hpp"
#include "Geometry.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
const double kPi = 3.14159265358979323846;

// n points on a circle of the given radius, first one straight up (screen y down)
std::vector<Eigen::Vector2d> ring(const Eigen::Vector2d& center, double radius, int n,
                                  double start_rad) {
  std::vector<Eigen::Vector2d> pts;
  pts.reserve(n);
  for (int i = 0; i < n; ++i) {
    double a = start_rad + 2.0 * kPi * i / n;
    pts.emplace_back(center.x() + radius * std::cos(a), center.y() + radius * std::sin(a));
  }
  return pts;
}
}  // namespace

const char* pattern_event_name(PatternEvent ev) {
  switch (ev) {
    case PatternEvent::Started:   return "started";
    case PatternEvent::Connected: return "connected";
    case PatternEvent::Ignored:   return "ignored";
    case PatternEvent::Incorrect: return "incorrect";
    case PatternEvent::Completed: return "completed";
  }
  return "unknown";
}

std::vector<Eigen::Vector2d> make_pattern(PatternShape shape, const Eigen::Vector2d& center,
                                          double size) {
  switch (shape) {
    case PatternShape::Triangle:
      return ring(center, size, 3, -kPi / 2.0);
    case PatternShape::Square:
      return {
        Eigen::Vector2d(center.x() - size, center.y() - size),
        Eigen::Vector2d(center.x() + size, center.y() - size),
        Eigen::Vector2d(center.x() + size, center.y() + size),
        Eigen::Vector2d(center.x() - size, center.y() + size),
      };
    case PatternShape::Circle:
      return ring(center, size, 8, -kPi / 2.0);
  }
  return {};
}

bool nearest_point(const std::vector<Eigen::Vector2d>& points, const Eigen::Vector2d& pos,
                   double tolerance, size_t& index) {
  if (!is_finite(pos)) return false;

  double best = std::numeric_limits<double>::infinity();
  bool found = false;
  for (size_t i = 0; i < points.size(); ++i) {
    double d = (points[i] - pos).norm();
    if (d <= tolerance && d < best) {
      best = d;
      index = i;
      found = true;
    }
  }
  return found;
}

PatternShape next_pattern(PatternShape shape) {
  switch (shape) {
    case PatternShape::Triangle: return PatternShape::Square;
    case PatternShape::Square:   return PatternShape::Circle;
    case PatternShape::Circle:   return PatternShape::Triangle;
  }
  return PatternShape::Triangle;
}

PatternConnectionValidator::PatternConnectionValidator(PatternShape first,
                                                       const Eigen::Vector2d& center, double size,
                                                       double hit_tolerance, double repeat_hit_s)
  : first_(first),
    center_(center),
    size_(size),
    tolerance_(hit_tolerance),
    repeat_hit_s_(repeat_hit_s),
    shape_(first),
    points_(make_pattern(first, center, size)) {}

// Ring neighbours. With three points every pair is a neighbour, so the
// triangle can be drawn in any order.
bool PatternConnectionValidator::adjacent(size_t a, size_t b) const {
  size_t n = points_.size();
  size_t d = (a > b) ? a - b : b - a;
  return d == 1 || d == n - 1;
}

bool PatternConnectionValidator::visited(size_t index) const {
  return std::find(path_.begin(), path_.end(), index) != path_.end();
}

PatternEvent PatternConnectionValidator::fail() {
  incorrect_++;
  path_.clear();
  return PatternEvent::Incorrect;
}

PatternEvent PatternConnectionValidator::connect(size_t index) {
  if (index >= points_.size()) return PatternEvent::Ignored;

  if (path_.empty()) {
    path_.push_back(index);
    return PatternEvent::Started;
  }

  size_t last = path_.back();
  if (index == last) return PatternEvent::Ignored;

  if (index == path_.front()) {
    if (path_.size() < points_.size() || !adjacent(last, index)) return fail();

    completed_++;
    shape_ = next_pattern(shape_);
    points_ = make_pattern(shape_, center_, size_);
    path_.clear();
    has_hit_ = false;
    return PatternEvent::Completed;
  }

  if (visited(index) || !adjacent(last, index)) return fail();

  path_.push_back(index);
  return PatternEvent::Connected;
}

PatternEvent PatternConnectionValidator::track_hand(const Eigen::Vector2d& pos, double t) {
  size_t index = 0;
  if (!std::isfinite(t) || !nearest_point(points_, pos, tolerance_, index)) {
    return PatternEvent::Ignored;
  }

  if (has_hit_ && index == last_hit_ && (t - last_hit_t_) < repeat_hit_s_) {
    last_hit_t_ = t;
    return PatternEvent::Ignored;
  }

  has_hit_ = true;
  last_hit_ = index;
  last_hit_t_ = t;
  return connect(index);
}

void PatternConnectionValidator::reset() {
  shape_ = first_;
  points_ = make_pattern(first_, center_, size_);
  path_.clear();
  completed_ = 0;
  incorrect_ = 0;
  has_hit_ = false;
  last_hit_ = 0;
  last_hit_t_ = 0.0;
}
