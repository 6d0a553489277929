#include "Geometry.hpp"
#include <algorithm>
#include <cmath>

namespace {
const double kPi = 3.14159265358979323846;
}

bool is_finite(const Eigen::Vector3d& v) {
  return std::isfinite(v.x()) && std::isfinite(v.y()) && std::isfinite(v.z());
}

bool is_finite(const Eigen::Vector2d& v) {
  return std::isfinite(v.x()) && std::isfinite(v.y());
}

bool normalize(const Eigen::Vector3d& v, Eigen::Vector3d& out) {
  double mag = v.norm();
  if (!std::isfinite(mag) || mag < kDirectionEpsilon) return false;
  out = v / mag;
  return true;
}

int dominant_axis(const Eigen::Vector3d& v) {
  int axis = 0;
  for (int i = 1; i < 3; ++i) {
    if (std::fabs(v[i]) > std::fabs(v[axis])) axis = i;
  }
  return axis;
}

Eigen::Vector3d axis_variance(const std::vector<Eigen::Vector3d>& positions) {
  if (positions.empty()) return Eigen::Vector3d::Zero();

  Eigen::Vector3d mean = Eigen::Vector3d::Zero();
  for (const auto& p : positions) mean += p;
  mean /= static_cast<double>(positions.size());

  Eigen::Vector3d var = Eigen::Vector3d::Zero();
  for (const auto& p : positions) {
    Eigen::Vector3d d = p - mean;
    var += d.cwiseProduct(d);
  }
  return var / static_cast<double>(positions.size());
}

ProjectionPlane select_projection_plane(const std::vector<Eigen::Vector3d>& positions) {
  if (positions.size() < 2) return ProjectionPlane::XY;

  Eigen::Vector3d var = axis_variance(positions);
  int order[3] = {0, 1, 2};
  // stable: equal variances keep X before Y before Z
  std::stable_sort(order, order + 3, [&var](int a, int b) { return var[a] > var[b]; });

  int a = std::min(order[0], order[1]);
  int b = std::max(order[0], order[1]);
  if (a == 0 && b == 1) return ProjectionPlane::XY;
  if (a == 0 && b == 2) return ProjectionPlane::XZ;
  return ProjectionPlane::YZ;
}

Eigen::Vector2d project(const Eigen::Vector3d& p, ProjectionPlane plane) {
  switch (plane) {
    case ProjectionPlane::XY: return Eigen::Vector2d(p.x(), p.y());
    case ProjectionPlane::XZ: return Eigen::Vector2d(p.x(), p.z());
    case ProjectionPlane::YZ: return Eigen::Vector2d(p.y(), p.z());
  }
  return Eigen::Vector2d(p.x(), p.y());
}

double path_length(const std::vector<Eigen::Vector3d>& positions, double noise_floor) {
  double total = 0.0;
  for (size_t i = 1; i < positions.size(); ++i) {
    double seg = (positions[i] - positions[i - 1]).norm();
    if (seg >= noise_floor) total += seg;
  }
  return total;
}

double projected_path_length(const std::vector<Eigen::Vector3d>& positions,
                             ProjectionPlane plane, double noise_floor) {
  double total = 0.0;
  for (size_t i = 1; i < positions.size(); ++i) {
    double seg = (project(positions[i], plane) - project(positions[i - 1], plane)).norm();
    if (seg >= noise_floor) total += seg;
  }
  return total;
}

double wrap_angle(double radians) {
  if (!std::isfinite(radians)) return 0.0;
  double r = std::fmod(radians, 2.0 * kPi);
  if (r > kPi) r -= 2.0 * kPi;
  else if (r <= -kPi) r += 2.0 * kPi;
  return r;
}

double angle_delta(double a, double b) {
  return wrap_angle(b - a);
}

double to_degrees(double radians) {
  return radians * 180.0 / kPi;
}

const char* plane_name(ProjectionPlane plane) {
  switch (plane) {
    case ProjectionPlane::XY: return "XY";
    case ProjectionPlane::XZ: return "XZ";
    case ProjectionPlane::YZ: return "YZ";
  }
  return "XY";
}
