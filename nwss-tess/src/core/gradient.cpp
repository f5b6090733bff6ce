#include "nwss-tess/gradient.h"

#include <algorithm>
#include <cmath>

namespace nwss {
namespace tess {

namespace {

uint8_t lerpChannel(uint8_t from, uint8_t to, double f) {
    double value = from + (static_cast<double>(to) - from) * f;
    return static_cast<uint8_t>(std::lround(std::max(0.0, std::min(255.0, value))));
}

} // namespace

Gradient::Gradient(const std::string& id)
    : m_id(id), m_units(Units::OBJECT_BOUNDING_BOX) {
}

Color Gradient::interpolate(const Point2D& point, const Bounds* bbox) const {
    Point2D local = point;

    // Bounding box units: the unit square spans the shape bounds
    if (m_units == Units::OBJECT_BOUNDING_BOX && bbox && !bbox->isEmpty &&
        bbox->width > 0 && bbox->height > 0) {
        local = Point2D((local.x - bbox->minX) / bbox->width,
                        (local.y - bbox->minY) / bbox->height);
    }

    // A degenerate gradient transform is treated as the identity
    if (m_transform.isInvertible()) {
        local = m_transform.invert().apply(local);
    }

    return colorAt(parameterAt(local));
}

Color Gradient::colorAt(double t) const {
    if (m_stops.empty()) {
        return Color(0, 0, 0, 0);
    }

    t = std::max(0.0, std::min(1.0, t));

    if (t <= m_stops.front().offset) {
        return m_stops.front().color;
    }
    if (t >= m_stops.back().offset) {
        return m_stops.back().color;
    }

    for (size_t i = 0; i + 1 < m_stops.size(); ++i) {
        const GradientStop& from = m_stops[i];
        const GradientStop& to = m_stops[i + 1];
        if (t < from.offset || t > to.offset) {
            continue;
        }

        double span = to.offset - from.offset;
        if (span <= 0) {
            return to.color;
        }

        double f = (t - from.offset) / span;
        return Color(lerpChannel(from.color.r, to.color.r, f),
                     lerpChannel(from.color.g, to.color.g, f),
                     lerpChannel(from.color.b, to.color.b, f),
                     lerpChannel(from.color.a, to.color.a, f));
    }

    return m_stops.back().color;
}

void Gradient::addStop(double offset, const Color& color) {
    offset = std::max(0.0, std::min(1.0, offset));
    if (!m_stops.empty()) {
        offset = std::max(offset, m_stops.back().offset);
    }
    m_stops.push_back(GradientStop(offset, color));
}

void Gradient::setStops(const std::vector<GradientStop>& stops) {
    m_stops.clear();
    for (const auto& stop : stops) {
        addStop(stop.offset, stop.color);
    }
}

LinearGradient::LinearGradient(const std::string& id, double x1, double y1,
                               double x2, double y2)
    : Gradient(id), m_start(x1, y1), m_end(x2, y2) {
}

double LinearGradient::parameterAt(const Point2D& point) const {
    Point2D direction = m_end - m_start;
    double lengthSquared = direction.x * direction.x + direction.y * direction.y;

    // Zero length vector paints the last stop
    if (lengthSquared == 0.0) {
        return 1.0;
    }

    Point2D offset = point - m_start;
    return (offset.x * direction.x + offset.y * direction.y) / lengthSquared;
}

RadialGradient::RadialGradient(const std::string& id, double cx, double cy, double r)
    : Gradient(id), m_center(cx, cy), m_radius(r) {
}

double RadialGradient::parameterAt(const Point2D& point) const {
    if (m_radius <= 0.0) {
        return 1.0;
    }
    return point.distanceTo(m_center) / m_radius;
}

} // namespace tess
} // namespace nwss
