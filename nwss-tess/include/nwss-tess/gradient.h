#ifndef NWSS_TESS_GRADIENT_H
#define NWSS_TESS_GRADIENT_H

#include "nwss-tess/geometry.h"
#include "nwss-tess/paint.h"
#include "nwss-tess/transform.h"
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * A colour stop along a gradient
 */
struct GradientStop {
    double offset;  // Position in [0, 1]
    Color color;

    GradientStop(double _offset = 0.0, const Color& _color = Color())
        : offset(_offset), color(_color) {}
};

/**
 * Base class for gradient paint servers.
 *
 * A gradient maps a point to a parameter t along its geometry and the
 * parameter to a colour through its stops. Points beyond the ends take the
 * colour of the nearest end (pad spread).
 */
class Gradient {
public:
    enum class Type {
        LINEAR,
        RADIAL
    };

    // Coordinate system of the gradient geometry
    enum class Units {
        USER_SPACE_ON_USE,
        OBJECT_BOUNDING_BOX
    };

    explicit Gradient(const std::string& id);
    virtual ~Gradient() = default;

    virtual Type getType() const = 0;

    /**
     * Colour of the gradient at a point.
     *
     * @param point Point in the user space of the painted shape
     * @param bbox Bounding box of the shape, used with OBJECT_BOUNDING_BOX
     *             units; ignored when null or empty
     * @return The interpolated colour, transparent black without stops
     */
    Color interpolate(const Point2D& point, const Bounds* bbox = nullptr) const;

    // Colour at parameter t, clamped to [0, 1]
    Color colorAt(double t) const;

    /**
     * Append a stop. Offsets are clamped to [0, 1] and never decrease,
     * a smaller offset is raised to the previous one.
     */
    void addStop(double offset, const Color& color);
    void setStops(const std::vector<GradientStop>& stops);
    const std::vector<GradientStop>& getStops() const { return m_stops; }

    const std::string& getId() const { return m_id; }

    void setTransform(const AffineTransform& transform) { m_transform = transform; }
    const AffineTransform& getTransform() const { return m_transform; }

    void setUnits(Units units) { m_units = units; }
    Units getUnits() const { return m_units; }

protected:
    // Gradient parameter for a point in gradient space
    virtual double parameterAt(const Point2D& point) const = 0;

private:
    std::string m_id;
    std::vector<GradientStop> m_stops;
    AffineTransform m_transform;
    Units m_units;
};

/**
 * Gradient along the vector (x1, y1) to (x2, y2)
 */
class LinearGradient : public Gradient {
public:
    LinearGradient(const std::string& id, double x1 = 0.0, double y1 = 0.0,
                   double x2 = 1.0, double y2 = 0.0);

    Type getType() const override { return Type::LINEAR; }

    Point2D getStart() const { return m_start; }
    Point2D getEnd() const { return m_end; }

protected:
    double parameterAt(const Point2D& point) const override;

private:
    Point2D m_start;
    Point2D m_end;
};

/**
 * Gradient by distance from a center, reaching t = 1 at radius r
 */
class RadialGradient : public Gradient {
public:
    RadialGradient(const std::string& id, double cx = 0.5, double cy = 0.5, double r = 0.5);

    Type getType() const override { return Type::RADIAL; }

    Point2D getCenter() const { return m_center; }
    double getRadius() const { return m_radius; }

protected:
    double parameterAt(const Point2D& point) const override;

private:
    Point2D m_center;
    double m_radius;
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_GRADIENT_H
