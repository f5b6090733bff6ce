#ifndef NWSS_TESS_ERRORS_H
#define NWSS_TESS_ERRORS_H

#include <stdexcept>
#include <string>

namespace nwss {
namespace tess {

/**
 * Raised for malformed attribute data (numbers, transforms, path data).
 * The document parser contains it to the element that produced it.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Raised when a transform with a zero determinant is inverted
 */
class DegenerateTransformError : public std::runtime_error {
public:
    explicit DegenerateTransformError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Structural failure that invalidates the whole document (no root, not an SVG)
 */
class SVGError : public std::runtime_error {
public:
    explicit SVGError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_ERRORS_H
