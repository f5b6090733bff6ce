#include "nwss-tess/tessellator.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nwss {
namespace tess {

namespace {

double cross(const Point2D& a, const Point2D& b) {
    return a.x * b.y - a.y * b.x;
}

// Turn direction at curr, positive for a left (convex) turn
double turn(const Point2D& prev, const Point2D& curr, const Point2D& next) {
    return cross(curr - prev, next - curr);
}

// Inclusive test against a counter-clockwise triangle
bool pointInTriangle(const Point2D& p, const Point2D& a, const Point2D& b, const Point2D& c) {
    return cross(b - a, p - a) >= 0 &&
           cross(c - b, p - b) >= 0 &&
           cross(a - c, p - c) >= 0;
}

double ringMaxX(const std::vector<Point2D>& ring) {
    double maxX = -std::numeric_limits<double>::infinity();
    for (const auto& p : ring) {
        maxX = std::max(maxX, p.x);
    }
    return maxX;
}

void removeRepeatedPoints(std::vector<Point2D>& ring) {
    std::vector<Point2D> cleaned;
    cleaned.reserve(ring.size());
    for (const auto& p : ring) {
        if (cleaned.empty() || cleaned.back() != p) {
            cleaned.push_back(p);
        }
    }
    while (cleaned.size() > 1 && cleaned.front() == cleaned.back()) {
        cleaned.pop_back();
    }
    ring.swap(cleaned);
}

} // namespace

TessellationResult Tessellator::triangulate(const std::vector<Loop>& loops,
                                            const TessellatorOptions& options) {
    TessellationResult result;

    if (options.scaleFactor <= 0) {
        result.addError("Tessellation scale factor must be positive");
        return result;
    }

    double scale = effectiveScale(loops, options);
    Clipper2Lib::Paths64 subjects = loopsToClipperPaths(loops, scale);
    if (subjects.empty()) {
        return result;
    }

    try {
        Clipper2Lib::Clipper64 clipper;
        clipper.AddSubject(subjects);

        Clipper2Lib::PolyTree64 tree;
        if (!clipper.Execute(Clipper2Lib::ClipType::Union, Clipper2Lib::FillRule::NonZero, tree)) {
            result.addError("Polygon union failed");
            return result;
        }

        for (const auto& outer : tree) {
            triangulateNode(*outer, scale, result);
        }
    } catch (const std::exception& e) {
        result.addError(std::string("Tessellation failed: ") + e.what());
    }

    if (!result.success) {
        result.triangles.clear();
    }

    return result;
}

double Tessellator::effectiveScale(const std::vector<Loop>& loops, const TessellatorOptions& options) {
    Bounds bounds;
    for (const auto& loop : loops) {
        if (loop.size() < 3) {
            continue;
        }
        Bounds loopBounds = Polygon(loop.getPoints()).getBounds();
        if (!loopBounds.isEmpty) {
            bounds.expand(Point2D(loopBounds.minX, loopBounds.minY));
            bounds.expand(Point2D(loopBounds.maxX, loopBounds.maxY));
        }
    }

    double extent = std::max(bounds.width, bounds.height);
    if (bounds.isEmpty || extent <= 0 || options.minGridSteps <= 0) {
        return options.scaleFactor;
    }

    return std::max(options.scaleFactor, options.minGridSteps / extent);
}

Clipper2Lib::Paths64 Tessellator::loopsToClipperPaths(const std::vector<Loop>& loops, double scale) {
    Clipper2Lib::Paths64 paths;

    for (const auto& loop : loops) {
        if (loop.size() < 3) {
            continue;
        }

        Clipper2Lib::Path64 path;
        path.reserve(loop.size());
        for (const auto& point : loop.getPoints()) {
            path.push_back(Clipper2Lib::Point64(
                static_cast<int64_t>(std::llround(point.x * scale)),
                static_cast<int64_t>(std::llround(point.y * scale))
            ));
        }
        paths.push_back(path);
    }

    return paths;
}

Tessellator::Ring Tessellator::clipperPathToRing(const Clipper2Lib::Path64& path) {
    Ring ring;
    ring.reserve(path.size());

    for (const auto& point : path) {
        ring.push_back(Point2D(static_cast<double>(point.x), static_cast<double>(point.y)));
    }

    removeRepeatedPoints(ring);
    return ring;
}

void Tessellator::triangulateNode(const Clipper2Lib::PolyPath64& node, double scale,
                                  TessellationResult& result) {
    Ring outer = clipperPathToRing(node.Polygon());

    std::vector<Ring> holes;
    for (const auto& hole : node) {
        Ring ring = clipperPathToRing(hole->Polygon());
        if (ring.size() >= 3) {
            // Holes run clockwise
            Polygon polygon(ring);
            if (polygon.isCounterClockwise()) {
                polygon.reverse();
            }
            holes.push_back(polygon.getPoints());
        }

        // Islands inside the hole are separate outer polygons
        for (const auto& island : *hole) {
            triangulateNode(*island, scale, result);
        }
    }

    if (outer.size() < 3) {
        return;
    }

    Polygon boundary(outer);
    if (!boundary.isCounterClockwise()) {
        boundary.reverse();
        outer = boundary.getPoints();
    }

    if (!bridgeHoles(outer, holes)) {
        result.addError("Could not connect a hole to its outer boundary");
        return;
    }

    std::vector<Point2D> triangles;
    if (!earClip(outer, triangles)) {
        result.addError("Ear clipping failed for polygon with " +
                        std::to_string(outer.size()) + " vertices");
        return;
    }

    for (const auto& point : triangles) {
        result.triangles.push_back(Point2D(point.x / scale, point.y / scale));
    }
}

bool Tessellator::bridgeHoles(Ring& outer, std::vector<Ring>& holes) {
    // Rightmost holes first, so each bridge only crosses already merged rings
    std::sort(holes.begin(), holes.end(), [](const Ring& a, const Ring& b) {
        return ringMaxX(a) > ringMaxX(b);
    });

    for (const auto& hole : holes) {
        if (!bridgeHole(outer, hole)) {
            return false;
        }
    }
    return true;
}

bool Tessellator::bridgeHole(Ring& outer, const Ring& hole) {
    // M is the rightmost hole vertex
    size_t mIndex = 0;
    for (size_t i = 1; i < hole.size(); ++i) {
        if (hole[i].x > hole[mIndex].x ||
            (hole[i].x == hole[mIndex].x && hole[i].y < hole[mIndex].y)) {
            mIndex = i;
        }
    }
    const Point2D m = hole[mIndex];

    // Cast a ray from M towards +x and find the closest boundary edge it hits.
    // Only edges running in +y face the inside of a counter-clockwise ring.
    const size_t count = outer.size();
    const size_t none = std::numeric_limits<size_t>::max();
    double bestX = std::numeric_limits<double>::infinity();
    size_t pIndex = none;
    bool hitVertex = false;

    for (size_t i = 0; i < count; ++i) {
        const Point2D& a = outer[i];
        const Point2D& b = outer[(i + 1) % count];
        if (!(a.y < b.y) || m.y < a.y || m.y > b.y) {
            continue;
        }

        double x = a.x + (m.y - a.y) * (b.x - a.x) / (b.y - a.y);
        if (x < m.x || x >= bestX) {
            continue;
        }

        bestX = x;
        if (m.y == a.y) {
            pIndex = i;
            hitVertex = true;
        } else if (m.y == b.y) {
            pIndex = (i + 1) % count;
            hitVertex = true;
        } else {
            pIndex = (a.x > b.x) ? i : (i + 1) % count;
            hitVertex = false;
        }
    }

    if (pIndex == none) {
        return false;
    }

    if (!hitVertex) {
        // P may be hidden behind reflex vertices inside triangle (M, I, P);
        // the one closest in angle to the ray is visible
        const Point2D intersection(bestX, m.y);
        const Point2D p = outer[pIndex];

        Point2D a = m, b = intersection, c = p;
        if (cross(b - a, c - a) < 0) {
            std::swap(b, c);
        }

        double bestCos = -2.0;
        double bestDistance = std::numeric_limits<double>::infinity();
        size_t candidate = pIndex;

        for (size_t j = 0; j < count; ++j) {
            const Point2D& r = outer[j];
            if (j == pIndex || r == p) {
                continue;
            }
            if (turn(outer[(j + count - 1) % count], r, outer[(j + 1) % count]) > 0) {
                continue;
            }
            if (!pointInTriangle(r, a, b, c)) {
                continue;
            }

            double distance = m.distanceTo(r);
            if (distance == 0.0) {
                continue;
            }
            double cosine = (r.x - m.x) / distance;
            if (cosine > bestCos || (cosine == bestCos && distance < bestDistance)) {
                bestCos = cosine;
                bestDistance = distance;
                candidate = j;
            }
        }
        pIndex = candidate;
    }

    // Splice: outer up to P, the full hole starting and ending at M, back to P
    Ring merged;
    merged.reserve(count + hole.size() + 2);
    merged.insert(merged.end(), outer.begin(), outer.begin() + pIndex + 1);
    for (size_t k = 0; k <= hole.size(); ++k) {
        merged.push_back(hole[(mIndex + k) % hole.size()]);
    }
    merged.push_back(outer[pIndex]);
    merged.insert(merged.end(), outer.begin() + pIndex + 1, outer.end());

    outer.swap(merged);
    return true;
}

bool Tessellator::earClip(Ring ring, std::vector<Point2D>& triangles) {
    removeRepeatedPoints(ring);

    while (ring.size() > 3) {
        const size_t n = ring.size();
        bool earFound = false;

        for (size_t i = 0; i < n; ++i) {
            const size_t i0 = (i + n - 1) % n;
            const size_t i2 = (i + 1) % n;
            const Point2D& a = ring[i0];
            const Point2D& b = ring[i];
            const Point2D& c = ring[i2];

            if (turn(a, b, c) <= 0) {
                continue;
            }

            bool contains = false;
            for (size_t j = 0; j < n; ++j) {
                if (j == i0 || j == i || j == i2) {
                    continue;
                }
                const Point2D& p = ring[j];
                // Bridge vertices are duplicated, their copies never block an ear
                if (p == a || p == b || p == c) {
                    continue;
                }
                // Only reflex vertices can reach into an ear
                if (turn(ring[(j + n - 1) % n], p, ring[(j + 1) % n]) > 0) {
                    continue;
                }
                if (pointInTriangle(p, a, b, c)) {
                    contains = true;
                    break;
                }
            }
            if (contains) {
                continue;
            }

            triangles.push_back(a);
            triangles.push_back(b);
            triangles.push_back(c);
            ring.erase(ring.begin() + i);
            earFound = true;
            break;
        }

        if (earFound) {
            continue;
        }

        // No ear: drop one zero-area vertex (collinear run or bridge spike) and retry
        bool removed = false;
        for (size_t i = 0; i < n; ++i) {
            if (turn(ring[(i + n - 1) % n], ring[i], ring[(i + 1) % n]) == 0) {
                ring.erase(ring.begin() + i);
                removed = true;
                break;
            }
        }
        if (!removed) {
            return false;
        }
    }

    if (ring.size() == 3) {
        double t = turn(ring[0], ring[1], ring[2]);
        if (t < 0) {
            return false;
        }
        if (t > 0) {
            triangles.push_back(ring[0]);
            triangles.push_back(ring[1]);
            triangles.push_back(ring[2]);
        }
    }

    return true;
}

} // namespace tess
} // namespace nwss
