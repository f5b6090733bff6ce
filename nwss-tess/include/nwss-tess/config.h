#ifndef NWSS_TESS_CONFIG_H
#define NWSS_TESS_CONFIG_H

#include "nwss-tess/flattener.h"
#include "nwss-tess/svg_parser.h"
#include "nwss-tess/tessellator.h"
#include <string>

namespace nwss {
namespace tess {

/**
 * Configuration class for tessellation settings, stored as an INI file
 */
class TessConfig {
public:
    TessConfig();
    ~TessConfig();

    /**
     * Initialize with default values
     */
    void setDefaults();

    /**
     * Load configuration from file
     * @param filename Path to the config file
     * @return True if loaded successfully, false for unreadable files and invalid values
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Save configuration to file
     * @param filename Path where to save the config
     * @return True if saved successfully
     */
    bool saveToFile(const std::string& filename) const;

    /**
     * Check if this is the first run (no config file exists)
     * @param filename Path to the config file
     * @return True if the config file doesn't exist
     */
    static bool isFirstRun(const std::string& filename);

    // Getters and setters for configuration properties
    int getBezierPoints() const { return m_bezierPoints; }
    void setBezierPoints(int points) { m_bezierPoints = points; }

    int getCirclePoints() const { return m_circlePoints; }
    void setCirclePoints(int points) { m_circlePoints = points; }

    int getMaxSegments() const { return m_maxSegments; }
    void setMaxSegments(int segments) { m_maxSegments = segments; }

    double getScaleFactor() const { return m_scaleFactor; }
    void setScaleFactor(double factor) { m_scaleFactor = factor; }

    double getMinGridSteps() const { return m_minGridSteps; }
    void setMinGridSteps(double steps) { m_minGridSteps = steps; }

    bool getInvertY() const { return m_invertY; }
    void setInvertY(bool invert) { m_invertY = invert; }

    bool getStrokeFromFill() const { return m_strokeFromFill; }
    void setStrokeFromFill(bool enabled) { m_strokeFromFill = enabled; }

    double getDpi() const { return m_dpi; }
    void setDpi(double dpi) { m_dpi = dpi; }

    double getMergeTolerance() const { return m_mergeTolerance; }
    void setMergeTolerance(double tolerance) { m_mergeTolerance = tolerance; }

    bool getVerbose() const { return m_verbose; }
    void setVerbose(bool verbose) { m_verbose = verbose; }

    // Conversions to the engine settings
    FlattenerConfig toFlattenerConfig() const;
    TessellatorOptions toTessellatorOptions() const;
    ParserConfig toParserConfig() const;

private:
    // Flattening
    int m_bezierPoints;        // Segments per Bezier curve
    int m_circlePoints;        // Segments per full circle
    int m_maxSegments;         // Cap on segments for one curve

    // Tessellation
    double m_scaleFactor;      // Integer units per user unit for polygon clipping
    double m_minGridSteps;     // Grid floor across the fill extent

    // Document
    bool m_invertY;            // Flip y so it grows upwards
    bool m_strokeFromFill;     // Stroke with the fill when the stroke is transparent
    double m_dpi;              // Resolution for physical units
    double m_mergeTolerance;   // Squared merge distance for loop points

    // Logging
    bool m_verbose;            // Echo parser diagnostics

    // Helper methods for parsing
    bool parseLine(const std::string& line, std::string& key, std::string& value) const;
    static bool parseBool(const std::string& value, bool& result);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_CONFIG_H
