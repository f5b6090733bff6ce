#ifndef NWSS_TESS_PATH_BUILDER_H
#define NWSS_TESS_PATH_BUILDER_H

#include "nwss-tess/flattener.h"
#include "nwss-tess/geometry.h"
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * Stateful interpreter turning SVG path data and basic shapes into loops.
 *
 * Drawing calls accumulate into an in-progress loop. moveTo() starts a new
 * subpath, closePath() closes the current one, and endPath() hands back
 * every loop built since the last call.
 */
class PathBuilder {
public:
    /**
     * @param flattener Curve sampler, must outlive the builder
     * @param mergeTolerance Squared distance under which adjacent points merge
     */
    explicit PathBuilder(const CurveFlattener& flattener,
                         double mergeTolerance = DEFAULT_MERGE_TOLERANCE);

    /**
     * Interpret the value of a path "d" attribute.
     *
     * @param data Path data
     * @param warnings Receives a message for every unrecognised command
     * @throws ParseError on missing or malformed operands
     */
    void parsePathData(const std::string& data, std::vector<std::string>* warnings = nullptr);

    // Path commands in absolute coordinates
    void moveTo(const Point2D& point);
    void lineTo(const Point2D& point);
    void cubicTo(const Point2D& control1, const Point2D& control2, const Point2D& end);
    void smoothCubicTo(const Point2D& control2, const Point2D& end);
    void quadraticTo(const Point2D& control, const Point2D& end);
    void smoothQuadraticTo(const Point2D& end);
    void arcTo(double rx, double ry, double phiDegrees, bool largeArc, bool sweep,
               const Point2D& end);
    void closePath();

    /**
     * Rectangle, optionally with rounded corners.
     * Radii are clamped to half the matching side; a zero radius on either
     * axis draws square corners.
     */
    void addRect(double x, double y, double width, double height,
                 double rx = 0.0, double ry = 0.0);

    void addCircle(double cx, double cy, double r);
    void addEllipse(double cx, double cy, double rx, double ry);
    void addLine(double x1, double y1, double x2, double y2);

    /**
     * Polyline through coordinate pairs, closed for polygons
     * @throws ParseError if the coordinate count is odd
     */
    void addPolyline(const std::vector<double>& coordinates, bool closed);

    /**
     * Finish the current path.
     * Merges close points, drops empty loops and resets the builder.
     */
    std::vector<Loop> endPath();

    const Point2D& getCurrentPoint() const { return m_current; }

private:
    const CurveFlattener& m_flattener;
    double m_mergeTolerance;

    Point2D m_current;
    Point2D m_subpathStart;

    // Second control point of the previous cubic, for S/s
    Point2D m_lastCubicControl;
    bool m_previousWasCubic;

    // Control point of the previous quadratic, for T/t
    Point2D m_lastQuadControl;
    bool m_previousWasQuad;

    Loop m_loop;
    std::vector<Loop> m_loops;

    // Make sure the in-progress loop starts at the current point
    void beginSegment();

    // Move the in-progress loop to the finished list
    void finishLoop();

    void clearSmoothing();

    void addEllipseLoop(double cx, double cy, double rx, double ry);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_PATH_BUILDER_H
