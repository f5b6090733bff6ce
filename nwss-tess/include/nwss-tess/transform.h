#ifndef NWSS_TESS_TRANSFORM_H
#define NWSS_TESS_TRANSFORM_H

#include "nwss-tess/geometry.h"
#include <array>
#include <string>

namespace nwss {
namespace tess {

/**
 * 2D affine transform in SVG matrix order.
 *
 *   | a  c  e |
 *   | b  d  f |
 *   | 0  0  1 |
 *
 * A point (x, y) maps to (a*x + c*y + e, b*x + d*y + f).
 */
class AffineTransform {
public:
  // Identity transform
  AffineTransform();

  static AffineTransform identity();

  static AffineTransform fromValues(double a, double b, double c, double d,
                                    double e, double f);

  static AffineTransform translation(double tx, double ty);
  static AffineTransform scaling(double sx, double sy);

  /**
   * Rotation about a pivot point
   *
   * @param angleDegrees Rotation angle in degrees
   * @param cx Pivot x coordinate
   * @param cy Pivot y coordinate
   */
  static AffineTransform rotation(double angleDegrees, double cx = 0.0,
                                  double cy = 0.0);

  /**
   * Parse an SVG transform attribute.
   *
   * Recognizes matrix(), translate(), scale(), rotate(), skewX() and skewY(),
   * either alone or as a list composed left to right. Empty text yields the
   * identity.
   *
   * @param text The attribute value
   * @return The parsed transform
   * @throws ParseError if the text is malformed
   */
  static AffineTransform parse(const std::string &text);

  // Map a point through the transform
  Point2D apply(const Point2D &point) const;

  /**
   * Compose two transforms. The result applies other first, then this,
   * so parent.compose(child) maps child coordinates into parent space.
   */
  AffineTransform compose(const AffineTransform &other) const;

  /**
   * Invert the transform
   *
   * @throws DegenerateTransformError if the determinant is zero
   */
  AffineTransform invert() const;

  bool isInvertible() const;

  double determinant() const;

  bool isIdentity() const;

  // Component-wise comparison within epsilon
  bool isApprox(const AffineTransform &other, double epsilon = 1e-9) const;

  /**
   * Export as a column-major 4x4 matrix for 3D pipelines
   * (z row zeroed, 1 on the diagonal).
   */
  std::array<double, 16> toHomogeneous4x4() const;

  // Six parameters in a, b, c, d, e, f order
  const std::array<double, 6> &getValues() const { return m_values; }

  double a() const { return m_values[0]; }
  double b() const { return m_values[1]; }
  double c() const { return m_values[2]; }
  double d() const { return m_values[3]; }
  double e() const { return m_values[4]; }
  double f() const { return m_values[5]; }

  // Human-readable form, e.g. "matrix(1, 0, 0, 1, 0, 0)"
  std::string toString() const;

private:
  std::array<double, 6> m_values;
};

}  // namespace tess
}  // namespace nwss

#endif  // NWSS_TESS_TRANSFORM_H
