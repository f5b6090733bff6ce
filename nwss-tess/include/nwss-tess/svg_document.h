#ifndef NWSS_TESS_SVG_DOCUMENT_H
#define NWSS_TESS_SVG_DOCUMENT_H

#include "nwss-tess/geometry.h"
#include "nwss-tess/gradient.h"
#include "nwss-tess/paint.h"
#include "nwss-tess/transform.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * One drawable shape of a parsed document.
 *
 * Loops and triangles are in the shape's local coordinates; the transform
 * maps them into document space.
 */
class SVGPath {
public:
    SVGPath(const std::vector<Loop>& loops,
            const std::vector<Point2D>& triangles,
            const Paint& stroke,
            const Paint& fill,
            const AffineTransform& transform,
            const std::string& id = "",
            const std::string& title = "",
            const std::string& description = "");

    // Stroke outline
    const std::vector<Loop>& getLoops() const { return m_loops; }

    // Fill mesh, three points per triangle; empty without a fill
    const std::vector<Point2D>& getTriangles() const { return m_triangles; }

    const Paint& getStroke() const { return m_stroke; }
    const Paint& getFill() const { return m_fill; }
    const AffineTransform& getTransform() const { return m_transform; }

    const std::string& getId() const { return m_id; }
    const std::string& getTitle() const { return m_title; }
    const std::string& getDescription() const { return m_description; }

    bool hasFill() const { return !m_triangles.empty(); }

    // Bounds of the loops in local coordinates
    Bounds getLocalBounds() const;

    // Bounds of the loops in document space
    Bounds getDocumentBounds() const;

private:
    std::vector<Loop> m_loops;
    std::vector<Point2D> m_triangles;
    Paint m_stroke;
    Paint m_fill;
    AffineTransform m_transform;
    std::string m_id;
    std::string m_title;
    std::string m_description;
};

/**
 * Result of parsing an SVG file: shapes, gradients and diagnostics
 */
class SVGDocument {
public:
    SVGDocument();

    // All shapes in document order
    const std::vector<SVGPath>& getPaths() const { return m_paths; }

    /**
     * Find a shape by its id attribute.
     * When several shapes share an id the last one wins.
     *
     * @return The shape, or nullptr if not found
     */
    const SVGPath* pathById(const std::string& id) const;

    // Gradient registered under the id, or nullptr
    std::shared_ptr<const Gradient> gradientById(const std::string& id) const;

    const std::map<std::string, std::shared_ptr<const Gradient>>& getGradients() const {
        return m_gradients;
    }

    /**
     * Colour of a paint at a point of a shape.
     * Gradient references are looked up in the registry; missing gradients
     * and NONE resolve to transparent black.
     *
     * @param paint Fill or stroke paint
     * @param point Point in the shape's local coordinates
     * @param bbox Shape bounds for bounding box gradient units
     */
    Color resolveColor(const Paint& paint, const Point2D& point, const Bounds* bbox = nullptr) const;

    double getWidth() const { return m_width; }
    double getHeight() const { return m_height; }

    // Transform from root user space to document space
    const AffineTransform& getRootTransform() const { return m_rootTransform; }

    // Diagnostics collected while parsing
    const std::vector<std::string>& getWarnings() const { return m_warnings; }

    // Bounds of all shapes in document space
    Bounds getContentBounds() const;

    size_t getTriangleCount() const;

    // Number of stroke line segments
    size_t getLineCount() const;

private:
    friend class SVGParser;

    void addPath(const SVGPath& path);
    void addGradient(const std::shared_ptr<const Gradient>& gradient);

    std::vector<SVGPath> m_paths;
    std::map<std::string, size_t> m_pathIndex;
    std::map<std::string, std::shared_ptr<const Gradient>> m_gradients;
    double m_width;
    double m_height;
    AffineTransform m_rootTransform;
    std::vector<std::string> m_warnings;
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_SVG_DOCUMENT_H
