/**
 * @file MathTypes.hpp
 * @brief Math types and utilities for Cartesian path geometry
 */

#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <limits>

namespace motion_planner {
namespace geometry {

// ============================================================================
// Type Definitions
// ============================================================================

using Vector3d = Eigen::Vector3d;

// Cartesian axes driven by the planner (X, Y, Z)
constexpr int NUM_AXES = 3;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double EPSILON = 1e-10;

// Positional tolerance for geometric validation (mm)
constexpr double GEOMETRY_TOLERANCE = 1e-6;

// Direction components below this magnitude do not constrain an axis
constexpr double AXIS_EPSILON = 1e-9;

constexpr double UNLIMITED = std::numeric_limits<double>::infinity();

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * Angle between two unit vectors in radians (0 = same direction, π = reversal)
 */
inline double angleBetween(const Vector3d& a, const Vector3d& b) {
    double dot = a.dot(b);
    dot = std::clamp(dot, -1.0, 1.0);
    return std::acos(dot);
}

/**
 * Wrap an angle into [0, 2π)
 */
inline double wrapPositive(double angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle < 0) angle += TWO_PI;
    return angle;
}

} // namespace geometry
} // namespace motion_planner
