/**
 * @file CornerBlender.cpp
 * @brief Implementation of junction velocity computation
 */

#include "CornerBlender.hpp"
#include <algorithm>
#include <cmath>

namespace motion_planner {
namespace trajectory {

CornerBlender::CornerBlender(const ToleranceMode& mode, double colinearTolerance)
    : mode_(mode),
      colinearTolerance_(std::max(colinearTolerance, 0.0)) {
}

// ============================================================================
// Corner Angle
// ============================================================================

double CornerBlender::cornerAngle(const Vector3d& incoming, const Vector3d& outgoing) {
    return angleBetween(incoming, outgoing);
}

// ============================================================================
// Blend Geometry
// ============================================================================

double CornerBlender::tangentLength(double angle, double deviation,
                                    double incomingLength, double outgoingLength) {
    double halfAngle = angle / 2.0;

    // 1 - cos(x) = 2·sin²(x/2), accurate for small turning angles
    double s = std::sin(halfAngle / 2.0);
    double oneMinusCos = 2.0 * s * s;

    double deviationLimit = UNLIMITED;
    if (oneMinusCos > EPSILON * EPSILON) {
        deviationLimit = deviation * std::sin(halfAngle) / oneMinusCos;
    }

    // The arc may use at most half of each adjacent segment
    return std::min({deviationLimit, incomingLength / 2.0, outgoingLength / 2.0});
}

double CornerBlender::blendRadius(double angle, double deviation,
                                  double incomingLength, double outgoingLength) {
    if (deviation <= 0) {
        return 0;
    }
    if (angle < EPSILON) {
        return UNLIMITED;
    }
    // Reversal: no arc fits
    if (angle > PI - EPSILON) {
        return 0;
    }

    double length = tangentLength(angle, deviation, incomingLength, outgoingLength);
    double tanHalf = std::tan(angle / 2.0);
    return length / tanHalf;
}

double CornerBlender::blendVelocity(double angle, double acceleration, double deviation,
                                    double incomingLength, double outgoingLength) {
    double radius = blendRadius(angle, deviation, incomingLength, outgoingLength);
    if (!std::isfinite(radius)) {
        return UNLIMITED;
    }
    return std::sqrt(std::max(acceleration, 0.0) * radius);
}

// ============================================================================
// Junction Velocity
// ============================================================================

double CornerBlender::junctionVelocity(
    const Segment& incoming, const SegmentLimits& incomingLimits,
    const Segment& outgoing, const SegmentLimits& outgoingLimits) const
{
    if (mode_.type == ToleranceType::EXACT_STOP) {
        return 0;
    }

    double angle = cornerAngle(incoming.endTangent(), outgoing.startTangent());
    double v = 0;

    if (isColinear(angle)) {
        // Tangent-continuous: deferred to the axis limits below
        v = UNLIMITED;
    }
    else if (mode_.type == ToleranceType::BLEND && mode_.maxDeviation > 0 &&
             incoming.isLine() && outgoing.isLine()) {
        // Conservative: the smaller acceleration bound of the two segments
        double acceleration = std::min(incomingLimits.aMax, outgoingLimits.aMax);
        v = blendVelocity(angle, acceleration, mode_.maxDeviation,
                          incoming.length(), outgoing.length());
    }

    return std::min({v, incomingLimits.vMax, outgoingLimits.vMax});
}

bool CornerBlender::rounds(const Segment& incoming, const Segment& outgoing) const {
    if (mode_.type != ToleranceType::BLEND || mode_.maxDeviation <= 0) {
        return false;
    }
    if (!incoming.isLine() || !outgoing.isLine()) {
        return false;
    }

    double angle = cornerAngle(incoming.endTangent(), outgoing.startTangent());
    return !isColinear(angle) && angle <= PI - EPSILON;
}

double CornerBlender::trimLength(const Segment& incoming, const Segment& outgoing) const {
    if (!rounds(incoming, outgoing)) {
        return 0;
    }
    double angle = cornerAngle(incoming.endTangent(), outgoing.startTangent());
    return tangentLength(angle, mode_.maxDeviation, incoming.length(), outgoing.length());
}

std::optional<Segment> CornerBlender::blendArc(const Segment& incoming,
                                               const Segment& outgoing) const {
    if (!rounds(incoming, outgoing)) {
        return std::nullopt;
    }

    Vector3d t1 = incoming.endTangent();
    Vector3d t2 = outgoing.startTangent();
    double angle = cornerAngle(t1, t2);
    double length = trimLength(incoming, outgoing);
    double halfAngle = angle / 2.0;
    double radius = length / std::tan(halfAngle);

    Vector3d vertex = incoming.endPoint();
    Vector3d bisector = (t2 - t1).normalized();
    Vector3d axis = t1.cross(t2).normalized();

    Vector3d arcStart = vertex - length * t1;
    Vector3d arcEnd = vertex + length * t2;
    Vector3d center = vertex + bisector * (radius / std::cos(halfAngle));

    return Segment::arc(arcStart, arcEnd, center, radius, axis,
                        ArcDirection::COUNTER_CLOCKWISE);
}

} // namespace trajectory
} // namespace motion_planner
