#ifndef NWSS_TESS_GEOMETRY_H
#define NWSS_TESS_GEOMETRY_H

#include <vector>
#include <cmath>
#include <cstddef>

namespace nwss {
namespace tess {

// Squared distance under which adjacent loop points are merged
const double DEFAULT_MERGE_TOLERANCE = 0.001;

/**
 * Represents a 2D point with x and y coordinates
 */
struct Point2D {
    double x;
    double y;

    Point2D(double _x = 0, double _y = 0) : x(_x), y(_y) {}

    // Calculate distance to another point
    double distanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    double squaredDistanceTo(const Point2D& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return dx*dx + dy*dy;
    }

    // Operators for point manipulation
    Point2D operator+(const Point2D& other) const {
        return Point2D(x + other.x, y + other.y);
    }

    Point2D operator-(const Point2D& other) const {
        return Point2D(x - other.x, y - other.y);
    }

    Point2D operator*(double scalar) const {
        return Point2D(x * scalar, y * scalar);
    }

    bool operator==(const Point2D& other) const {
        // Using small epsilon for floating point comparison
        const double epsilon = 1e-6;
        return std::fabs(x - other.x) < epsilon && std::fabs(y - other.y) < epsilon;
    }

    bool operator!=(const Point2D& other) const {
        return !(*this == other);
    }
};

/**
 * Axis aligned bounding box of a set of points
 */
struct Bounds {
    double minX, minY, maxX, maxY;
    double width, height;
    bool isEmpty;

    Bounds() : minX(0), minY(0), maxX(0), maxY(0), width(0), height(0), isEmpty(true) {}

    // Grow the box so that it contains the point
    void expand(const Point2D& point);
};

/**
 * An ordered point sequence describing one contour of a shape.
 * A loop is closed when its last point duplicates its first one.
 */
class Loop {
public:
    Loop() = default;
    explicit Loop(const std::vector<Point2D>& points) : m_points(points) {}

    // Add a point to the loop
    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    // Get all points
    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    // Get a specific point
    const Point2D& getPoint(size_t index) const {
        return m_points.at(index);
    }

    const Point2D& front() const { return m_points.front(); }
    const Point2D& back() const { return m_points.back(); }

    // Get number of points
    size_t size() const {
        return m_points.size();
    }

    // Check if loop is empty
    bool empty() const {
        return m_points.empty();
    }

    // True when the closing point duplicates the first point
    bool isClosed() const;

    // Append a copy of the first point
    void close();

    // Calculate the total length of the polyline
    double length() const;

    /**
     * Remove points lying within the tolerance of the previously kept point.
     * @param toleranceSquared Squared merge distance
     * @return Number of points removed
     */
    size_t mergeClosePoints(double toleranceSquared = DEFAULT_MERGE_TOLERANCE);

private:
    std::vector<Point2D> m_points;
};

/**
 * Represents a closed polygon for area operations
 */
class Polygon {
public:
    Polygon() = default;
    explicit Polygon(const std::vector<Point2D>& points) : m_points(points) {}

    // Build from a loop, dropping the duplicated closing point
    static Polygon fromLoop(const Loop& loop);

    // Add a point to the polygon
    void addPoint(const Point2D& point) {
        m_points.push_back(point);
    }

    // Get all points
    const std::vector<Point2D>& getPoints() const {
        return m_points;
    }

    // Get a specific point
    const Point2D& getPoint(size_t index) const {
        return m_points.at(index);
    }

    // Get number of points
    size_t size() const {
        return m_points.size();
    }

    // Check if polygon is empty
    bool empty() const {
        return m_points.empty();
    }

    // Calculate the area of the polygon
    double area() const;

    // Shoelace area, positive for counter-clockwise rings (y axis up)
    double signedArea() const;

    // Check if the polygon is counter-clockwise
    bool isCounterClockwise() const;

    // Reverse the polygon orientation
    void reverse();

    // Get the bounding box
    Bounds getBounds() const;

private:
    std::vector<Point2D> m_points;
};

/**
 * Sum of the absolute areas of a flat triangle list (three points per triangle)
 */
double triangleListArea(const std::vector<Point2D>& triangles);

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_GEOMETRY_H
