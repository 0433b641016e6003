/**
 * @file CornerBlender.hpp
 * @brief Junction velocity limits under the active corner tolerance policy
 *
 * For each junction between consecutive segments the blender computes the
 * maximum speed at which the tool may pass through the junction:
 *
 *   EXACT_STOP  : 0
 *   EXACT_PATH  : 0 unless the tangents are colinear (then unrestricted)
 *   BLEND(d)    : speed on the corner-rounding arc whose deviation from the
 *                 programmed vertex is d, with centripetal acceleration
 *                 bounded by the smaller acceleration limit of the two
 *                 adjacent segments. BLEND(0) behaves like EXACT_PATH.
 *
 * Blend arc geometry (Kunz & Stilman, "Time-Optimal Trajectory Generation
 * for Path Following with Bounded Acceleration and Velocity", RSS 2012):
 *
 *   ℓ = min( d·sin(θ/2) / (1 - cos(θ/2)),  L_in/2,  L_out/2 )
 *   R = ℓ / tan(θ/2)
 *   v = sqrt(a · R)
 *
 * where θ is the turning angle between the tangents and ℓ is the distance
 * from the vertex to the arc's tangent points. Every result is finally
 * clipped to the velocity limits of both adjacent segments.
 *
 * Only line/line corners are rounded. The planner trims both lines by ℓ and
 * executes blendArc() between them. A corner that involves an arc is not
 * rounded and follows the EXACT_PATH rule in BLEND mode.
 */

#pragma once

#include "PlannerTypes.hpp"
#include "Segment.hpp"
#include <optional>

namespace motion_planner {
namespace trajectory {

class CornerBlender {
public:
    CornerBlender() = default;
    CornerBlender(const ToleranceMode& mode, double colinearTolerance);

    /**
     * Maximum speed through the junction incoming -> outgoing
     */
    double junctionVelocity(const Segment& incoming, const SegmentLimits& incomingLimits,
                            const Segment& outgoing, const SegmentLimits& outgoingLimits) const;

    /**
     * True if the junction incoming -> outgoing is replaced by a blend arc
     */
    bool rounds(const Segment& incoming, const Segment& outgoing) const;

    /**
     * Length cut from the end of incoming and the start of outgoing by the
     * blend arc (0 when the junction is not rounded)
     */
    double trimLength(const Segment& incoming, const Segment& outgoing) const;

    /**
     * Arc that rounds the junction in BLEND mode.
     * @return nullopt when the junction is not rounded
     */
    std::optional<Segment> blendArc(const Segment& incoming, const Segment& outgoing) const;

    /**
     * Turning angle between two unit tangents
     *
     * @return Angle in radians (0 = collinear, π = reversal)
     */
    static double cornerAngle(const Vector3d& incoming, const Vector3d& outgoing);

    /**
     * Radius of the blend arc for a corner.
     *
     * @param angle          Turning angle in radians
     * @param deviation      Maximum distance from the vertex (mm)
     * @param incomingLength Length available on the incoming segment
     * @param outgoingLength Length available on the outgoing segment
     */
    static double blendRadius(double angle, double deviation,
                              double incomingLength = UNLIMITED,
                              double outgoingLength = UNLIMITED);

    /**
     * Centripetal-safe corner speed sqrt(a · R)
     */
    static double blendVelocity(double angle, double acceleration, double deviation,
                                double incomingLength = UNLIMITED,
                                double outgoingLength = UNLIMITED);

    const ToleranceMode& mode() const { return mode_; }
    double colinearTolerance() const { return colinearTolerance_; }

private:
    bool isColinear(double angle) const { return angle < colinearTolerance_; }

    // Distance from vertex to the tangent points of the blend arc
    static double tangentLength(double angle, double deviation,
                                double incomingLength, double outgoingLength);

    ToleranceMode mode_;
    double colinearTolerance_ = 1e-6;
};

} // namespace trajectory
} // namespace motion_planner
