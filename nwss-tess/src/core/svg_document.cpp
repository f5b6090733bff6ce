#include "nwss-tess/svg_document.h"

namespace nwss {
namespace tess {

SVGPath::SVGPath(const std::vector<Loop>& loops,
                 const std::vector<Point2D>& triangles,
                 const Paint& stroke,
                 const Paint& fill,
                 const AffineTransform& transform,
                 const std::string& id,
                 const std::string& title,
                 const std::string& description)
    : m_loops(loops),
      m_triangles(triangles),
      m_stroke(stroke),
      m_fill(fill),
      m_transform(transform),
      m_id(id),
      m_title(title),
      m_description(description) {
}

Bounds SVGPath::getLocalBounds() const {
    Bounds bounds;
    for (const auto& loop : m_loops) {
        for (const auto& point : loop.getPoints()) {
            bounds.expand(point);
        }
    }
    return bounds;
}

Bounds SVGPath::getDocumentBounds() const {
    Bounds bounds;
    for (const auto& loop : m_loops) {
        for (const auto& point : loop.getPoints()) {
            bounds.expand(m_transform.apply(point));
        }
    }
    return bounds;
}

SVGDocument::SVGDocument() : m_width(0.0), m_height(0.0) {}

const SVGPath* SVGDocument::pathById(const std::string& id) const {
    auto it = m_pathIndex.find(id);
    if (it == m_pathIndex.end()) {
        return nullptr;
    }
    return &m_paths[it->second];
}

std::shared_ptr<const Gradient> SVGDocument::gradientById(const std::string& id) const {
    auto it = m_gradients.find(id);
    if (it == m_gradients.end()) {
        return nullptr;
    }
    return it->second;
}

Color SVGDocument::resolveColor(const Paint& paint, const Point2D& point, const Bounds* bbox) const {
    switch (paint.getType()) {
        case Paint::Type::SOLID:
            return paint.getColor();
        case Paint::Type::GRADIENT: {
            auto gradient = gradientById(paint.getGradientId());
            if (gradient) {
                return gradient->interpolate(point, bbox);
            }
            break;
        }
        case Paint::Type::NONE:
            break;
    }
    return Color(0, 0, 0, 0);
}

Bounds SVGDocument::getContentBounds() const {
    Bounds bounds;
    for (const auto& path : m_paths) {
        Bounds pathBounds = path.getDocumentBounds();
        if (pathBounds.isEmpty) {
            continue;
        }
        bounds.expand(Point2D(pathBounds.minX, pathBounds.minY));
        bounds.expand(Point2D(pathBounds.maxX, pathBounds.maxY));
    }
    return bounds;
}

size_t SVGDocument::getTriangleCount() const {
    size_t count = 0;
    for (const auto& path : m_paths) {
        count += path.getTriangles().size() / 3;
    }
    return count;
}

size_t SVGDocument::getLineCount() const {
    size_t count = 0;
    for (const auto& path : m_paths) {
        for (const auto& loop : path.getLoops()) {
            if (loop.size() > 1) {
                count += loop.size() - 1;
            }
        }
    }
    return count;
}

void SVGDocument::addPath(const SVGPath& path) {
    m_paths.push_back(path);
    if (!path.getId().empty()) {
        m_pathIndex[path.getId()] = m_paths.size() - 1;
    }
}

void SVGDocument::addGradient(const std::shared_ptr<const Gradient>& gradient) {
    m_gradients[gradient->getId()] = gradient;
}

} // namespace tess
} // namespace nwss
