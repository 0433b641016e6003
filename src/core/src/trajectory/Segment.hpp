/**
 * @file Segment.hpp
 * @brief Geometric path segment: straight line or circular arc
 *
 * A Segment is a closed tagged variant {Line, Arc}. All operations the
 * planner needs (arc length, curvature, point/tangent at arc-length
 * progress) are handled exhaustively for both alternatives.
 *
 * Arc convention: the arc rotates about the unit plane normal n,
 * counter-clockwise when viewed from the tip of n (right-hand rule),
 * or clockwise for ArcDirection::CLOCKWISE. Sweep angle is in (0, 2π).
 */

#pragma once

#include "../geometry/MathTypes.hpp"
#include <string>
#include <variant>

namespace motion_planner {
namespace trajectory {

using namespace geometry;

enum class ArcDirection {
    CLOCKWISE,
    COUNTER_CLOCKWISE
};

struct LineGeometry {
    Vector3d start = Vector3d::Zero();
    Vector3d end = Vector3d::Zero();
};

struct ArcGeometry {
    Vector3d start = Vector3d::Zero();
    Vector3d end = Vector3d::Zero();
    Vector3d center = Vector3d::Zero();
    double radius = 0;
    Vector3d normal = Vector3d::UnitZ();
    ArcDirection direction = ArcDirection::COUNTER_CLOCKWISE;
};

class Segment {
public:
    using Geometry = std::variant<LineGeometry, ArcGeometry>;

    static Segment line(const Vector3d& start, const Vector3d& end);

    static Segment arc(const Vector3d& start, const Vector3d& end,
                       const Vector3d& center, double radius,
                       const Vector3d& normal, ArcDirection direction);

    /**
     * Arc with radius taken from |start - center|
     */
    static Segment arcFromCenter(const Vector3d& start, const Vector3d& end,
                                 const Vector3d& center, const Vector3d& normal,
                                 ArcDirection direction);

    /**
     * Check geometric validity.
     *
     * Rejects zero-length segments, non-positive radius, a degenerate
     * plane normal, and arcs whose endpoints are off the circle.
     *
     * @param error Filled with a description when invalid
     */
    bool validate(std::string& error) const;

    bool isLine() const { return std::holds_alternative<LineGeometry>(geometry_); }
    bool isArc() const { return std::holds_alternative<ArcGeometry>(geometry_); }
    const Geometry& geometry() const { return geometry_; }

    double length() const { return length_; }

    /**
     * Curvature 1/r (0 for lines)
     */
    double curvature() const;

    /**
     * Swept angle in radians (0 for lines)
     */
    double sweepAngle() const { return sweep_; }

    Vector3d startPoint() const;
    Vector3d endPoint() const;

    /**
     * Position at arc-length progress s (clamped to [0, length])
     */
    Vector3d pointAt(double s) const;

    /**
     * Unit tangent (direction of travel) at arc-length progress s
     */
    Vector3d tangentAt(double s) const;

    /**
     * Unit vector towards the center of curvature at progress s.
     * Zero for lines.
     */
    Vector3d normalAt(double s) const;

    Vector3d startTangent() const { return tangentAt(0); }
    Vector3d endTangent() const { return tangentAt(length_); }

    /**
     * Largest |tangent component| along an axis over the whole segment
     */
    double maxTangentComponent(int axis) const;

    /**
     * Bound on |c_t * t_a + c_n * n_a| / |(c_t, c_n)| along an axis, valid
     * at every point of the segment. Equal to |t_a| for lines; for arcs the
     * projection amplitude of the rotation plane onto the axis.
     */
    double axisExtent(int axis) const;

private:
    explicit Segment(Geometry geometry);

    void computeDerived();

    Geometry geometry_;

    // Derived, computed once at construction
    double length_ = 0;
    double sweep_ = 0;
    Vector3d direction_ = Vector3d::Zero();   // line direction
    Vector3d radial_ = Vector3d::Zero();      // arc: center -> start, unit
    Vector3d binormal_ = Vector3d::Zero();    // arc: axis x radial_, unit
};

} // namespace trajectory
} // namespace motion_planner
