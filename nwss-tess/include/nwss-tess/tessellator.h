#ifndef NWSS_TESS_TESSELLATOR_H
#define NWSS_TESS_TESSELLATOR_H

#include "nwss-tess/geometry.h"
#include <clipper2/clipper.h>
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * Options for fill tessellation
 */
struct TessellatorOptions {
    // Integer coordinates per user unit used for the polygon union
    double scaleFactor = 1000.0;

    /**
     * Minimum number of integer steps across the larger extent of the loops.
     * Small geometry raises the scale above scaleFactor to reach it, so
     * sub-unit shapes are not snapped onto a coarse grid. Zero disables it.
     */
    double minGridSteps = 100000.0;
};

/**
 * Result of a fill tessellation
 */
struct TessellationResult {
    // Flat triangle list, three points per triangle, counter-clockwise
    std::vector<Point2D> triangles;

    bool success = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    void addError(const std::string& error) {
        errors.push_back(error);
        success = false;
    }

    size_t triangleCount() const { return triangles.size() / 3; }

    // Total covered area
    double area() const { return triangleListArea(triangles); }
};

/**
 * Fills loops into a triangle mesh under the non-zero winding rule.
 *
 * Overlapping, self-intersecting and nested contours are resolved with a
 * Clipper2 union first; every resulting outer polygon then has its holes
 * bridged into the boundary and is ear-clipped.
 */
class Tessellator {
public:
    /**
     * Triangulate the region enclosed by the loops.
     * Loops with fewer than three points are ignored.
     *
     * @param loops Contours, open loops are closed implicitly
     * @param options Tessellation options
     * @return Triangles and status, the triangle list is empty on failure
     */
    static TessellationResult triangulate(const std::vector<Loop>& loops,
                                          const TessellatorOptions& options = TessellatorOptions());

private:
    // Working ring in scaled integer coordinates
    using Ring = std::vector<Point2D>;

    // Scale used for the union, at least scaleFactor
    static double effectiveScale(const std::vector<Loop>& loops, const TessellatorOptions& options);

    // Clipper2 conversion utilities
    static Clipper2Lib::Paths64 loopsToClipperPaths(const std::vector<Loop>& loops, double scale);
    static Ring clipperPathToRing(const Clipper2Lib::Path64& path);

    // Triangulate one outer polygon with its holes, then recurse into islands
    static void triangulateNode(const Clipper2Lib::PolyPath64& node, double scale,
                                TessellationResult& result);

    // Splice holes into the outer ring through mutually visible vertex pairs
    static bool bridgeHoles(Ring& outer, std::vector<Ring>& holes);
    static bool bridgeHole(Ring& outer, const Ring& hole);

    // Ear clipping of a counter-clockwise ring
    static bool earClip(Ring ring, std::vector<Point2D>& triangles);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_TESSELLATOR_H
