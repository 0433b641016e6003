/**
 * @file Segment.cpp
 * @brief Line and arc geometry
 */

#include "Segment.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace motion_planner {
namespace trajectory {

namespace {

// Radial tolerance scales with the arc size
double radialTolerance(double radius) {
    return GEOMETRY_TOLERANCE * std::max(1.0, radius);
}

bool isFinite(const Vector3d& v) {
    return v.allFinite();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Segment::Segment(Geometry geometry)
    : geometry_(std::move(geometry)) {
    computeDerived();
}

Segment Segment::line(const Vector3d& start, const Vector3d& end) {
    return Segment(LineGeometry{start, end});
}

Segment Segment::arc(const Vector3d& start, const Vector3d& end,
                     const Vector3d& center, double radius,
                     const Vector3d& normal, ArcDirection direction) {
    ArcGeometry g;
    g.start = start;
    g.end = end;
    g.center = center;
    g.radius = radius;
    g.normal = normal;
    g.direction = direction;
    return Segment(g);
}

Segment Segment::arcFromCenter(const Vector3d& start, const Vector3d& end,
                               const Vector3d& center, const Vector3d& normal,
                               ArcDirection direction) {
    return arc(start, end, center, (start - center).norm(), normal, direction);
}

void Segment::computeDerived() {
    std::visit([this](auto&& g) {
        using T = std::decay_t<decltype(g)>;

        if constexpr (std::is_same_v<T, LineGeometry>) {
            Vector3d delta = g.end - g.start;
            length_ = delta.norm();
            sweep_ = 0;
            direction_ = (length_ > EPSILON) ? Vector3d(delta / length_) : Vector3d::Zero();
        }
        else if constexpr (std::is_same_v<T, ArcGeometry>) {
            double normalNorm = g.normal.norm();
            Vector3d toStart = g.start - g.center;
            Vector3d toEnd = g.end - g.center;

            if (!(g.radius > EPSILON) || normalNorm < EPSILON ||
                toStart.norm() < EPSILON || toEnd.norm() < EPSILON) {
                length_ = 0;
                sweep_ = 0;
                return;
            }

            Vector3d axis = g.normal / normalNorm;
            if (g.direction == ArcDirection::CLOCKWISE) {
                axis = -axis;
            }

            radial_ = toStart.normalized();
            binormal_ = axis.cross(radial_);

            Vector3d endRadial = toEnd.normalized();
            double sinTerm = axis.dot(radial_.cross(endRadial));
            double cosTerm = radial_.dot(endRadial);
            sweep_ = wrapPositive(std::atan2(sinTerm, cosTerm));
            length_ = g.radius * sweep_;
        }
    }, geometry_);
}

// ============================================================================
// Validation
// ============================================================================

bool Segment::validate(std::string& error) const {
    return std::visit([&error, this](auto&& g) -> bool {
        using T = std::decay_t<decltype(g)>;

        if constexpr (std::is_same_v<T, LineGeometry>) {
            if (!isFinite(g.start) || !isFinite(g.end)) {
                error = "line endpoints must be finite";
                return false;
            }
            if (length_ <= GEOMETRY_TOLERANCE) {
                error = "zero-length line segment";
                return false;
            }
            return true;
        }
        else if constexpr (std::is_same_v<T, ArcGeometry>) {
            if (!isFinite(g.start) || !isFinite(g.end) ||
                !isFinite(g.center) || !isFinite(g.normal) || !std::isfinite(g.radius)) {
                error = "arc parameters must be finite";
                return false;
            }
            if (!(g.radius > GEOMETRY_TOLERANCE)) {
                error = "arc radius must be positive";
                return false;
            }
            double normalNorm = g.normal.norm();
            if (normalNorm < EPSILON) {
                error = "arc plane normal is degenerate";
                return false;
            }
            if ((g.end - g.start).norm() <= GEOMETRY_TOLERANCE) {
                error = "arc start and end coincide";
                return false;
            }

            double tol = radialTolerance(g.radius);
            Vector3d n = g.normal / normalNorm;
            Vector3d toStart = g.start - g.center;
            Vector3d toEnd = g.end - g.center;

            if (std::abs(toStart.norm() - g.radius) > tol ||
                std::abs(toEnd.norm() - g.radius) > tol) {
                error = "arc endpoints are not on the circle of the given radius";
                return false;
            }
            if (std::abs(toStart.dot(n)) > tol || std::abs(toEnd.dot(n)) > tol) {
                error = "arc endpoints are not in the plane of the normal";
                return false;
            }
            if (length_ <= GEOMETRY_TOLERANCE) {
                error = "zero-length arc segment";
                return false;
            }
            return true;
        }
    }, geometry_);
}

// ============================================================================
// Queries
// ============================================================================

double Segment::curvature() const {
    if (const auto* arc = std::get_if<ArcGeometry>(&geometry_)) {
        return (arc->radius > EPSILON) ? 1.0 / arc->radius : 0.0;
    }
    return 0.0;
}

Vector3d Segment::startPoint() const {
    return std::visit([](auto&& g) -> Vector3d { return g.start; }, geometry_);
}

Vector3d Segment::endPoint() const {
    return std::visit([](auto&& g) -> Vector3d { return g.end; }, geometry_);
}

Vector3d Segment::pointAt(double s) const {
    s = std::clamp(s, 0.0, length_);

    return std::visit([this, s](auto&& g) -> Vector3d {
        using T = std::decay_t<decltype(g)>;

        if constexpr (std::is_same_v<T, LineGeometry>) {
            return g.start + direction_ * s;
        }
        else {
            if (length_ <= 0) return g.start;
            double phi = s / g.radius;
            return g.center + g.radius * (radial_ * std::cos(phi) + binormal_ * std::sin(phi));
        }
    }, geometry_);
}

Vector3d Segment::tangentAt(double s) const {
    s = std::clamp(s, 0.0, length_);

    return std::visit([this, s](auto&& g) -> Vector3d {
        using T = std::decay_t<decltype(g)>;

        if constexpr (std::is_same_v<T, LineGeometry>) {
            return direction_;
        }
        else {
            if (length_ <= 0) return Vector3d::Zero();
            double phi = s / g.radius;
            return -radial_ * std::sin(phi) + binormal_ * std::cos(phi);
        }
    }, geometry_);
}

Vector3d Segment::normalAt(double s) const {
    const auto* arc = std::get_if<ArcGeometry>(&geometry_);
    if (!arc || length_ <= 0) {
        return Vector3d::Zero();
    }

    s = std::clamp(s, 0.0, length_);
    double phi = s / arc->radius;
    return -(radial_ * std::cos(phi) + binormal_ * std::sin(phi));
}

double Segment::maxTangentComponent(int axis) const {
    if (isLine()) {
        return std::abs(direction_[axis]);
    }
    if (length_ <= 0) return 0;

    // t_a(φ) = A·cos(φ + δ) with A = |(u_a, w_a)|, δ = atan2(u_a, w_a)
    double u = radial_[axis];
    double w = binormal_[axis];
    double amplitude = std::hypot(u, w);
    if (amplitude < AXIS_EPSILON) return 0;

    double delta = std::atan2(u, w);
    double firstPeak = std::ceil(delta / PI) * PI;
    if (firstPeak <= delta + sweep_) {
        return amplitude;
    }
    return amplitude * std::max(std::abs(std::cos(delta)),
                                std::abs(std::cos(delta + sweep_)));
}

double Segment::axisExtent(int axis) const {
    if (isLine()) {
        return std::abs(direction_[axis]);
    }
    if (length_ <= 0) return 0;
    return std::hypot(radial_[axis], binormal_[axis]);
}

} // namespace trajectory
} // namespace motion_planner
