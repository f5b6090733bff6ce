#ifndef NWSS_TESS_FLATTENER_H
#define NWSS_TESS_FLATTENER_H

#include "nwss-tess/geometry.h"
#include <array>
#include <vector>

namespace nwss {
namespace tess {

/**
 * Configuration for curve flattening
 */
struct FlattenerConfig {
    // Number of line segments a Bezier curve is split into
    int bezierPoints = 20;

    // Number of segments used for a full circle or ellipse
    int circlePoints = 24;

    // Upper bound on the segments emitted for a single curve
    int maxSegments = 10000;
};

/**
 * Converts Bezier curves and elliptical arcs into polyline points
 */
class CurveFlattener {
public:
    CurveFlattener();
    explicit CurveFlattener(const FlattenerConfig& config);

    // Set configuration options, recomputing the Bernstein table
    void setConfig(const FlattenerConfig& config);

    // Get current configuration
    const FlattenerConfig& getConfig() const;

    // Segment count actually used for Bezier curves after clamping
    int bezierSegments() const;

    // Segment count actually used for a full circle after clamping
    int circleSegments() const;

    /**
     * Append the sampled cubic curve to a loop.
     * All samples are appended, including p0; the final sample is exactly p3.
     */
    void cubicTo(const Point2D& p0, const Point2D& p1, const Point2D& p2,
                 const Point2D& p3, Loop& loop) const;

    // Append a quadratic curve, sampled as its degree-elevated cubic
    void quadraticTo(const Point2D& p0, const Point2D& control,
                     const Point2D& p1, Loop& loop) const;

    /**
     * Append an elliptical arc given in SVG endpoint parameterization.
     *
     * @param p0 Current point
     * @param rx Radius along the rotated x axis
     * @param ry Radius along the rotated y axis
     * @param phiDegrees Rotation of the ellipse x axis in degrees
     * @param largeArc Take the arc spanning more than 180 degrees
     * @param sweep Draw in the positive angle direction
     * @param p1 End point, appended exactly
     * @param loop Destination loop
     */
    void arcTo(const Point2D& p0, double rx, double ry, double phiDegrees,
               bool largeArc, bool sweep, const Point2D& p1, Loop& loop) const;

private:
    FlattenerConfig m_config;

    // Bernstein weights for each sample t = i / bezierPoints
    std::vector<std::array<double, 4>> m_coefficients;

    void computeCoefficients();
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_FLATTENER_H
