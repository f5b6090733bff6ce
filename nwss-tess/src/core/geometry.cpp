#include "nwss-tess/geometry.h"
#include <algorithm>

namespace nwss {
namespace tess {

void Bounds::expand(const Point2D& point) {
    if (isEmpty) {
        minX = maxX = point.x;
        minY = maxY = point.y;
        isEmpty = false;
    } else {
        minX = std::min(minX, point.x);
        minY = std::min(minY, point.y);
        maxX = std::max(maxX, point.x);
        maxY = std::max(maxY, point.y);
    }

    width = maxX - minX;
    height = maxY - minY;
}

bool Loop::isClosed() const {
    if (m_points.size() < 2) {
        return false;
    }

    return m_points.front() == m_points.back();
}

void Loop::close() {
    if (m_points.empty()) {
        return;
    }

    Point2D first = m_points.front();
    m_points.push_back(first);
}

double Loop::length() const {
    if (m_points.size() < 2) {
        return 0.0;
    }

    double totalLength = 0.0;
    for (size_t i = 1; i < m_points.size(); ++i) {
        totalLength += m_points[i-1].distanceTo(m_points[i]);
    }

    return totalLength;
}

size_t Loop::mergeClosePoints(double toleranceSquared) {
    if (m_points.size() < 2) {
        return 0;
    }

    std::vector<Point2D> merged;
    merged.reserve(m_points.size());
    merged.push_back(m_points.front());

    for (size_t i = 1; i < m_points.size(); ++i) {
        if (m_points[i].squaredDistanceTo(merged.back()) > toleranceSquared) {
            merged.push_back(m_points[i]);
        }
    }

    size_t removed = m_points.size() - merged.size();
    m_points.swap(merged);
    return removed;
}

Polygon Polygon::fromLoop(const Loop& loop) {
    std::vector<Point2D> points = loop.getPoints();
    if (points.size() > 1 && points.front() == points.back()) {
        points.pop_back();
    }

    return Polygon(points);
}

double Polygon::area() const {
    return std::abs(signedArea());
}

double Polygon::signedArea() const {
    if (m_points.size() < 3) {
        return 0.0;
    }

    // Shoelace formula
    double area = 0.0;
    size_t j = m_points.size() - 1;

    for (size_t i = 0; i < m_points.size(); i++) {
        area += m_points[j].x * m_points[i].y - m_points[i].x * m_points[j].y;
        j = i;
    }

    return area / 2.0;
}

bool Polygon::isCounterClockwise() const {
    return signedArea() > 0;
}

void Polygon::reverse() {
    std::reverse(m_points.begin(), m_points.end());
}

Bounds Polygon::getBounds() const {
    Bounds bounds;
    for (const auto& point : m_points) {
        bounds.expand(point);
    }

    return bounds;
}

double triangleListArea(const std::vector<Point2D>& triangles) {
    double total = 0.0;
    for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
        const Point2D& a = triangles[i];
        const Point2D& b = triangles[i + 1];
        const Point2D& c = triangles[i + 2];
        total += std::abs((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y)) / 2.0;
    }

    return total;
}

} // namespace tess
} // namespace nwss
