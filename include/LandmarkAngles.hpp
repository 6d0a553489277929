#pragma once
#include "MotionProfile.hpp"
#include "SensorFrame.hpp"

constexpr double kMinLandmarkConfidence = 0.5;

enum class JointPreference { Elbow, Armpit };

// Landmark position if present, finite and at least min_confidence.
bool usable_point(const LandmarkSet& set, Joint j, double min_confidence, Eigen::Vector2d& out);

// Angle at vertex between (a - vertex) and (c - vertex), degrees in [0, 180].
// False when either segment has no length.
bool three_point_angle(const Eigen::Vector2d& a, const Eigen::Vector2d& vertex,
                       const Eigen::Vector2d& c, double& out_deg);

// Angle of from->to against screen down (+y), degrees in [0, 180].
bool angle_from_vertical(const Eigen::Vector2d& from, const Eigen::Vector2d& to, double& out_deg);

// The profile's tracked angle on one side; false if a landmark is missing.
bool tracked_angle(const LandmarkSet& set, TrackedAngle angle, BodySide side,
                   double min_confidence, double& out_deg);

// Live camera ROM with fallbacks: preferred joint, then armpit, then arm from
// vertical, then the same on the other side.
bool camera_rom(const LandmarkSet& set, BodySide side, JointPreference preference,
                double min_confidence, double& out_deg);
