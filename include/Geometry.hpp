#pragma once
#include <Eigen/Core>
#include <vector>

// Vectors shorter than this have no usable direction.
constexpr double kDirectionEpsilon = 1e-4;

enum class ProjectionPlane { XY, XZ, YZ };

bool is_finite(const Eigen::Vector3d& v);
bool is_finite(const Eigen::Vector2d& v);

// Writes v / |v| to out; false (out untouched) when |v| < kDirectionEpsilon.
bool normalize(const Eigen::Vector3d& v, Eigen::Vector3d& out);

// Index (0=X, 1=Y, 2=Z) of the largest absolute component. Ties go to the
// lower index.
int dominant_axis(const Eigen::Vector3d& v);

// Population variance per axis.
Eigen::Vector3d axis_variance(const std::vector<Eigen::Vector3d>& positions);

// Plane spanned by the two highest-variance axes, precedence X > Y > Z on
// ties. Fewer than two positions give XY.
ProjectionPlane select_projection_plane(const std::vector<Eigen::Vector3d>& positions);

Eigen::Vector2d project(const Eigen::Vector3d& p, ProjectionPlane plane);

// Sum of consecutive segment lengths, ignoring segments below noise_floor.
double path_length(const std::vector<Eigen::Vector3d>& positions, double noise_floor);
double projected_path_length(const std::vector<Eigen::Vector3d>& positions,
                             ProjectionPlane plane, double noise_floor);

// Wraps into (-pi, pi].
double wrap_angle(double radians);

// Shortest signed rotation from angle a to angle b, in (-pi, pi].
double angle_delta(double a, double b);

double to_degrees(double radians);

const char* plane_name(ProjectionPlane plane);
