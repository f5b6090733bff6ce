#define _USE_MATH_DEFINES
#include "nwss-tess/path_builder.h"
#include "nwss-tess/attribute_parser.h"
#include "nwss-tess/errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace nwss {
namespace tess {

PathBuilder::PathBuilder(const CurveFlattener& flattener, double mergeTolerance)
    : m_flattener(flattener),
      m_mergeTolerance(mergeTolerance),
      m_previousWasCubic(false),
      m_previousWasQuad(false) {
}

void PathBuilder::parsePathData(const std::string& data, std::vector<std::string>* warnings) {
    std::vector<std::string> tokens = AttributeParser::tokenize(data);
    size_t index = 0;
    char opcode = 0;

    auto isCommand = [&tokens](size_t i) {
        return tokens[i].size() == 1 && std::isalpha(static_cast<unsigned char>(tokens[i][0]));
    };

    auto nextNumber = [&]() {
        if (index >= tokens.size() || isCommand(index)) {
            throw ParseError(std::string("Missing operand for path command '") + opcode + "'");
        }
        return AttributeParser::parseNumber(tokens[index++]);
    };

    auto nextPoint = [&]() {
        double x = nextNumber();
        double y = nextNumber();
        return Point2D(x, y);
    };

    // A flag is one character and may run into what follows, as in "a5 5 0 0110 0"
    auto nextFlag = [&]() {
        if (index >= tokens.size() || isCommand(index)) {
            throw ParseError(std::string("Missing operand for path command '") + opcode + "'");
        }
        std::string& token = tokens[index];
        char flag = token[0];
        if (flag != '0' && flag != '1') {
            throw ParseError(std::string("Arc flag must be 0 or 1 in path command '") + opcode + "'");
        }
        if (token.size() == 1) {
            index++;
        } else {
            token.erase(0, 1);
        }
        return flag == '1';
    };

    while (index < tokens.size()) {
        if (isCommand(index)) {
            opcode = tokens[index++][0];
        } else if (opcode == 0) {
            throw ParseError("Path data does not start with a command: " + data);
        } else if (opcode == 'Z' || opcode == 'z') {
            throw ParseError("Unexpected coordinate after closepath: " + tokens[index]);
        }

        bool relative = std::islower(static_cast<unsigned char>(opcode)) != 0;
        Point2D origin = relative ? m_current : Point2D(0, 0);

        switch (std::toupper(static_cast<unsigned char>(opcode))) {
            case 'M':
                moveTo(origin + nextPoint());
                // Further coordinate pairs are implicit lineto commands
                opcode = relative ? 'l' : 'L';
                break;

            case 'L':
                lineTo(origin + nextPoint());
                break;

            case 'H': {
                double x = nextNumber() + origin.x;
                lineTo(Point2D(x, m_current.y));
                break;
            }

            case 'V': {
                double y = nextNumber() + origin.y;
                lineTo(Point2D(m_current.x, y));
                break;
            }

            case 'C': {
                Point2D c1 = origin + nextPoint();
                Point2D c2 = origin + nextPoint();
                Point2D end = origin + nextPoint();
                cubicTo(c1, c2, end);
                break;
            }

            case 'S': {
                Point2D c2 = origin + nextPoint();
                Point2D end = origin + nextPoint();
                smoothCubicTo(c2, end);
                break;
            }

            case 'Q': {
                Point2D control = origin + nextPoint();
                Point2D end = origin + nextPoint();
                quadraticTo(control, end);
                break;
            }

            case 'T':
                smoothQuadraticTo(origin + nextPoint());
                break;

            case 'A': {
                double rx = nextNumber();
                double ry = nextNumber();
                double phi = nextNumber();
                bool largeArc = nextFlag();
                bool sweep = nextFlag();
                Point2D end = origin + nextPoint();
                arcTo(rx, ry, phi, largeArc, sweep, end);
                break;
            }

            case 'Z':
                closePath();
                break;

            default:
                if (warnings) {
                    warnings->push_back(std::string("Unrecognised path command '") + opcode + "'");
                }
                while (index < tokens.size() && !isCommand(index)) {
                    index++;
                }
                break;
        }
    }
}

void PathBuilder::moveTo(const Point2D& point) {
    finishLoop();
    m_current = point;
    m_subpathStart = point;
    m_loop.addPoint(point);
    clearSmoothing();
}

void PathBuilder::lineTo(const Point2D& point) {
    beginSegment();
    m_loop.addPoint(point);
    m_current = point;
    clearSmoothing();
}

void PathBuilder::cubicTo(const Point2D& control1, const Point2D& control2, const Point2D& end) {
    beginSegment();
    m_flattener.cubicTo(m_current, control1, control2, end, m_loop);
    m_current = end;
    clearSmoothing();
    m_lastCubicControl = control2;
    m_previousWasCubic = true;
}

void PathBuilder::smoothCubicTo(const Point2D& control2, const Point2D& end) {
    Point2D control1 = m_current;
    if (m_previousWasCubic) {
        control1 = m_current * 2.0 - m_lastCubicControl;
    }
    cubicTo(control1, control2, end);
}

void PathBuilder::quadraticTo(const Point2D& control, const Point2D& end) {
    beginSegment();
    m_flattener.quadraticTo(m_current, control, end, m_loop);
    m_current = end;
    clearSmoothing();
    m_lastQuadControl = control;
    m_previousWasQuad = true;
}

void PathBuilder::smoothQuadraticTo(const Point2D& end) {
    Point2D control = m_current;
    if (m_previousWasQuad) {
        control = m_current * 2.0 - m_lastQuadControl;
    }
    quadraticTo(control, end);
}

void PathBuilder::arcTo(double rx, double ry, double phiDegrees, bool largeArc, bool sweep,
                        const Point2D& end) {
    beginSegment();
    m_flattener.arcTo(m_current, rx, ry, phiDegrees, largeArc, sweep, end, m_loop);
    m_current = end;
    clearSmoothing();
}

void PathBuilder::closePath() {
    if (!m_loop.empty()) {
        m_loop.close();
        m_loops.push_back(m_loop);
        m_loop = Loop();
    }
    m_current = m_subpathStart;
    clearSmoothing();
}

void PathBuilder::addRect(double x, double y, double width, double height,
                          double rx, double ry) {
    if (width <= 0 || height <= 0) {
        return;
    }

    rx = std::min(std::fabs(rx), width / 2);
    ry = std::min(std::fabs(ry), height / 2);

    if (rx <= 0 || ry <= 0) {
        moveTo(Point2D(x, y));
        lineTo(Point2D(x + width, y));
        lineTo(Point2D(x + width, y + height));
        lineTo(Point2D(x, y + height));
        closePath();
        return;
    }

    // Rounded corners, one quarter arc per corner
    moveTo(Point2D(x, y + ry));
    lineTo(Point2D(x, y + height - ry));
    arcTo(rx, ry, 0, false, false, Point2D(x + rx, y + height));

    lineTo(Point2D(x + width - rx, y + height));
    arcTo(rx, ry, 0, false, false, Point2D(x + width, y + height - ry));

    lineTo(Point2D(x + width, y + ry));
    arcTo(rx, ry, 0, false, false, Point2D(x + width - rx, y));

    lineTo(Point2D(x + rx, y));
    arcTo(rx, ry, 0, false, false, Point2D(x, y + ry));
    closePath();
}

void PathBuilder::addCircle(double cx, double cy, double r) {
    if (r <= 0) {
        return;
    }
    addEllipseLoop(cx, cy, r, r);
}

void PathBuilder::addEllipse(double cx, double cy, double rx, double ry) {
    if (rx <= 0 || ry <= 0) {
        return;
    }
    addEllipseLoop(cx, cy, rx, ry);
}

void PathBuilder::addLine(double x1, double y1, double x2, double y2) {
    moveTo(Point2D(x1, y1));
    lineTo(Point2D(x2, y2));
}

void PathBuilder::addPolyline(const std::vector<double>& coordinates, bool closed) {
    if (coordinates.size() % 2 != 0) {
        throw ParseError("Odd number of coordinates in points list");
    }
    if (coordinates.empty()) {
        return;
    }

    moveTo(Point2D(coordinates[0], coordinates[1]));
    for (size_t i = 2; i + 1 < coordinates.size(); i += 2) {
        lineTo(Point2D(coordinates[i], coordinates[i + 1]));
    }

    if (closed) {
        closePath();
    }
}

std::vector<Loop> PathBuilder::endPath() {
    finishLoop();

    std::vector<Loop> result;
    for (auto& loop : m_loops) {
        loop.mergeClosePoints(m_mergeTolerance);
        if (!loop.empty()) {
            result.push_back(loop);
        }
    }

    m_loops.clear();
    m_current = Point2D();
    m_subpathStart = Point2D();
    clearSmoothing();

    return result;
}

void PathBuilder::beginSegment() {
    if (m_loop.empty()) {
        m_loop.addPoint(m_current);
    }
}

void PathBuilder::finishLoop() {
    if (!m_loop.empty()) {
        m_loops.push_back(m_loop);
        m_loop = Loop();
    }
}

void PathBuilder::clearSmoothing() {
    m_previousWasCubic = false;
    m_previousWasQuad = false;
}

void PathBuilder::addEllipseLoop(double cx, double cy, double rx, double ry) {
    int segments = m_flattener.circleSegments();

    for (int i = 0; i < segments; ++i) {
        double theta = 2.0 * i * M_PI / segments;
        Point2D point(cx + rx * std::cos(theta), cy + ry * std::sin(theta));
        if (i == 0) {
            moveTo(point);
        } else {
            lineTo(point);
        }
    }
    closePath();
}

} // namespace tess
} // namespace nwss
