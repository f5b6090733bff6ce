#define _USE_MATH_DEFINES
#include "nwss-tess/flattener.h"

#include <algorithm>
#include <cmath>

namespace nwss {
namespace tess {

namespace {

// Signed angle from u to v
double vectorAngle(double ux, double uy, double vx, double vy) {
    double norm = std::sqrt((ux * ux + uy * uy) * (vx * vx + vy * vy));
    if (norm == 0.0) {
        return 0.0;
    }

    double cosine = std::max(-1.0, std::min(1.0, (ux * vx + uy * vy) / norm));
    double angle = std::acos(cosine);
    return (ux * vy > uy * vx) ? angle : -angle;
}

} // namespace

CurveFlattener::CurveFlattener() {
    computeCoefficients();
}

CurveFlattener::CurveFlattener(const FlattenerConfig& config) : m_config(config) {
    computeCoefficients();
}

void CurveFlattener::setConfig(const FlattenerConfig& config) {
    m_config = config;
    computeCoefficients();
}

const FlattenerConfig& CurveFlattener::getConfig() const {
    return m_config;
}

int CurveFlattener::bezierSegments() const {
    int cap = std::max(1, m_config.maxSegments);
    return std::max(1, std::min(m_config.bezierPoints, cap));
}

int CurveFlattener::circleSegments() const {
    int cap = std::max(3, m_config.maxSegments);
    return std::max(3, std::min(m_config.circlePoints, cap));
}

void CurveFlattener::computeCoefficients() {
    int segments = bezierSegments();
    m_coefficients.clear();
    m_coefficients.reserve(segments + 1);

    for (int i = 0; i <= segments; ++i) {
        double t = static_cast<double>(i) / segments;
        double u = 1.0 - t;
        m_coefficients.push_back({{u * u * u, 3.0 * t * u * u, 3.0 * t * t * u, t * t * t}});
    }
}

void CurveFlattener::cubicTo(const Point2D& p0, const Point2D& p1, const Point2D& p2,
                             const Point2D& p3, Loop& loop) const {
    size_t last = m_coefficients.size() - 1;

    for (size_t i = 0; i < last; ++i) {
        const std::array<double, 4>& w = m_coefficients[i];
        loop.addPoint(Point2D(w[0] * p0.x + w[1] * p1.x + w[2] * p2.x + w[3] * p3.x,
                              w[0] * p0.y + w[1] * p1.y + w[2] * p2.y + w[3] * p3.y));
    }

    // Land exactly on the end point so following segments start from it
    loop.addPoint(p3);
}

void CurveFlattener::quadraticTo(const Point2D& p0, const Point2D& control,
                                 const Point2D& p1, Loop& loop) const {
    Point2D c1 = p0 + (control - p0) * (2.0 / 3.0);
    Point2D c2 = p1 + (control - p1) * (2.0 / 3.0);
    cubicTo(p0, c1, c2, p1, loop);
}

void CurveFlattener::arcTo(const Point2D& p0, double rx, double ry, double phiDegrees,
                           bool largeArc, bool sweep, const Point2D& p1, Loop& loop) const {
    if (p0.x == p1.x && p0.y == p1.y) {
        return;
    }

    rx = std::fabs(rx);
    ry = std::fabs(ry);
    if (rx == 0.0 || ry == 0.0) {
        loop.addPoint(p1);
        return;
    }

    double phi = phiDegrees * M_PI / 180.0;
    double cp = std::cos(phi);
    double sp = std::sin(phi);

    // Step 1: endpoints in the rotated frame
    double dx = 0.5 * (p0.x - p1.x);
    double dy = 0.5 * (p0.y - p1.y);
    double x_ = cp * dx + sp * dy;
    double y_ = -sp * dx + cp * dy;

    // Step 2: center in the rotated frame. A negative radicand means the
    // radii are too small; it is clamped to zero rather than scaling them up.
    double rxy = rx * y_;
    double ryx = ry * x_;
    double denominator = rxy * rxy + ryx * ryx;
    double r2 = (rx * ry * rx * ry - rxy * rxy - ryx * ryx) / denominator;
    if (r2 < 0.0) {
        r2 = 0.0;
    }

    double r = std::sqrt(r2);
    if (largeArc == sweep) {
        r = -r;
    }

    double cx_ = r * rx * y_ / ry;
    double cy_ = -r * ry * x_ / rx;

    // Step 3: center in user space
    double cx = cp * cx_ - sp * cy_ + 0.5 * (p0.x + p1.x);
    double cy = sp * cx_ + cp * cy_ + 0.5 * (p0.y + p1.y);

    // Step 4: start angle and sweep extent
    double ux = (x_ - cx_) / rx;
    double uy = (y_ - cy_) / ry;
    double vx = (-x_ - cx_) / rx;
    double vy = (-y_ - cy_) / ry;

    double psi = vectorAngle(1.0, 0.0, ux, uy);
    double delta = vectorAngle(ux, uy, vx, vy);

    if (sweep && delta < 0) delta += 2.0 * M_PI;
    if (!sweep && delta > 0) delta -= 2.0 * M_PI;

    int segments = static_cast<int>(std::fabs(m_config.circlePoints * delta / (2.0 * M_PI)));
    segments = std::max(segments, 1);
    segments = std::min(segments, std::max(1, m_config.maxSegments));

    loop.addPoint(p0);
    for (int i = 1; i < segments; ++i) {
        double theta = psi + i * delta / segments;
        double ct = std::cos(theta);
        double st = std::sin(theta);
        loop.addPoint(Point2D(cp * rx * ct - sp * ry * st + cx,
                              sp * rx * ct + cp * ry * st + cy));
    }
    loop.addPoint(p1);
}

} // namespace tess
} // namespace nwss
