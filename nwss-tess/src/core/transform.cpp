#define _USE_MATH_DEFINES
#include "nwss-tess/transform.h"
#include "nwss-tess/attribute_parser.h"
#include "nwss-tess/errors.h"

#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

namespace nwss {
namespace tess {

namespace {

const double DETERMINANT_EPSILON = 1e-12;

double toRadians(double degrees) { return degrees * M_PI / 180.0; }

// Build the transform for a single function of a transform list
AffineTransform buildFunction(const std::string &name,
                              const std::vector<double> &args) {
  size_t count = args.size();

  if (name == "matrix") {
    if (count != 6) {
      throw ParseError("matrix() expects 6 values, got " +
                       std::to_string(count));
    }
    return AffineTransform::fromValues(args[0], args[1], args[2], args[3],
                                       args[4], args[5]);
  }

  if (name == "translate") {
    if (count != 1 && count != 2) {
      throw ParseError("translate() expects 1 or 2 values, got " +
                       std::to_string(count));
    }
    return AffineTransform::translation(args[0], count == 2 ? args[1] : 0.0);
  }

  if (name == "scale") {
    if (count != 1 && count != 2) {
      throw ParseError("scale() expects 1 or 2 values, got " +
                       std::to_string(count));
    }
    return AffineTransform::scaling(args[0], count == 2 ? args[1] : args[0]);
  }

  if (name == "rotate") {
    if (count == 1) {
      return AffineTransform::rotation(args[0]);
    }
    if (count == 3) {
      return AffineTransform::rotation(args[0], args[1], args[2]);
    }
    throw ParseError("rotate() expects 1 or 3 values, got " +
                     std::to_string(count));
  }

  if (name == "skewX" || name == "skewY") {
    if (count != 1) {
      throw ParseError(name + "() expects 1 value, got " +
                       std::to_string(count));
    }
    double t = std::tan(toRadians(args[0]));
    if (name == "skewX") {
      return AffineTransform::fromValues(1, 0, t, 1, 0, 0);
    }
    return AffineTransform::fromValues(1, t, 0, 1, 0, 0);
  }

  throw ParseError("Unknown transform function: " + name);
}

}  // namespace

AffineTransform::AffineTransform() : m_values{{1, 0, 0, 1, 0, 0}} {}

AffineTransform AffineTransform::identity() { return AffineTransform(); }

AffineTransform AffineTransform::fromValues(double a, double b, double c,
                                            double d, double e, double f) {
  AffineTransform t;
  t.m_values = {{a, b, c, d, e, f}};
  return t;
}

AffineTransform AffineTransform::translation(double tx, double ty) {
  return fromValues(1, 0, 0, 1, tx, ty);
}

AffineTransform AffineTransform::scaling(double sx, double sy) {
  return fromValues(sx, 0, 0, sy, 0, 0);
}

AffineTransform AffineTransform::rotation(double angleDegrees, double cx,
                                          double cy) {
  double angle = toRadians(angleDegrees);
  double cosA = std::cos(angle);
  double sinA = std::sin(angle);

  double translateX = (-cx * cosA) + (cy * sinA) + cx;
  double translateY = (-cx * sinA) - (cy * cosA) + cy;

  return fromValues(cosA, sinA, -sinA, cosA, translateX, translateY);
}

AffineTransform AffineTransform::parse(const std::string &text) {
  AffineTransform result;
  size_t pos = 0;
  size_t length = text.size();

  while (true) {
    // Skip separators between list items
    while (pos < length &&
           (std::isspace(static_cast<unsigned char>(text[pos])) ||
            text[pos] == ',')) {
      pos++;
    }
    if (pos >= length) {
      break;
    }

    size_t nameStart = pos;
    while (pos < length && std::isalpha(static_cast<unsigned char>(text[pos]))) {
      pos++;
    }
    std::string name = text.substr(nameStart, pos - nameStart);
    if (name.empty()) {
      throw ParseError("Malformed transform: " + text);
    }

    while (pos < length && std::isspace(static_cast<unsigned char>(text[pos]))) {
      pos++;
    }
    if (pos >= length || text[pos] != '(') {
      throw ParseError("Expected '(' after " + name + " in transform: " + text);
    }

    size_t close = text.find(')', pos);
    if (close == std::string::npos) {
      throw ParseError("Unbalanced parentheses in transform: " + text);
    }

    std::string argText = text.substr(pos + 1, close - pos - 1);
    std::vector<double> args;
    for (const auto &token : AttributeParser::tokenize(argText)) {
      args.push_back(AttributeParser::parseNumber(token));
    }

    result = result.compose(buildFunction(name, args));
    pos = close + 1;
  }

  return result;
}

Point2D AffineTransform::apply(const Point2D &point) const {
  const std::array<double, 6> &v = m_values;
  return Point2D(v[0] * point.x + v[2] * point.y + v[4],
                 v[1] * point.x + v[3] * point.y + v[5]);
}

AffineTransform AffineTransform::compose(const AffineTransform &other) const {
  double a = m_values[0], b = m_values[1], c = m_values[2];
  double d = m_values[3], e = m_values[4], f = m_values[5];
  const std::array<double, 6> &o = other.m_values;

  return fromValues(a * o[0] + c * o[1], b * o[0] + d * o[1],
                    a * o[2] + c * o[3], b * o[2] + d * o[3],
                    a * o[4] + c * o[5] + e, b * o[4] + d * o[5] + f);
}

AffineTransform AffineTransform::invert() const {
  double det = determinant();
  if (std::fabs(det) < DETERMINANT_EPSILON) {
    throw DegenerateTransformError("Cannot invert degenerate transform " +
                                   toString());
  }

  const std::array<double, 6> &v = m_values;
  return fromValues(v[3] / det, -v[1] / det, -v[2] / det, v[0] / det,
                    (v[2] * v[5] - v[3] * v[4]) / det,
                    (v[1] * v[4] - v[0] * v[5]) / det);
}

bool AffineTransform::isInvertible() const {
  return std::fabs(determinant()) >= DETERMINANT_EPSILON;
}

double AffineTransform::determinant() const {
  return m_values[0] * m_values[3] - m_values[1] * m_values[2];
}

bool AffineTransform::isIdentity() const { return isApprox(identity(), 0.0); }

bool AffineTransform::isApprox(const AffineTransform &other,
                               double epsilon) const {
  for (size_t i = 0; i < m_values.size(); ++i) {
    if (std::fabs(m_values[i] - other.m_values[i]) > epsilon) {
      return false;
    }
  }
  return true;
}

std::array<double, 16> AffineTransform::toHomogeneous4x4() const {
  const std::array<double, 6> &v = m_values;
  return {{v[0], v[1], 0.0, 0.0,
           v[2], v[3], 0.0, 0.0,
           0.0, 0.0, 1.0, 0.0,
           v[4], v[5], 0.0, 1.0}};
}

std::string AffineTransform::toString() const {
  std::stringstream ss;
  ss << "matrix(";
  for (size_t i = 0; i < m_values.size(); ++i) {
    if (i > 0) {
      ss << ", ";
    }
    ss << m_values[i];
  }
  ss << ")";
  return ss.str();
}

}  // namespace tess
}  // namespace nwss
