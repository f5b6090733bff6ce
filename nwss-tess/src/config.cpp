#include "nwss-tess/config.h"
#include "nwss-tess/attribute_parser.h"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace nwss {
namespace tess {

namespace {

// Whole-string conversions; trailing garbage is an error
int toInt(const std::string& value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

double toDouble(const std::string& value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return result;
}

} // namespace

TessConfig::TessConfig() {
    setDefaults();
}

TessConfig::~TessConfig() = default;

void TessConfig::setDefaults() {
    // Flattening
    m_bezierPoints = 20;
    m_circlePoints = 24;
    m_maxSegments = 10000;

    // Tessellation
    m_scaleFactor = 1000.0;
    m_minGridSteps = 100000.0;

    // Document
    m_invertY = false;
    m_strokeFromFill = true;
    m_dpi = 96.0;
    m_mergeTolerance = DEFAULT_MERGE_TOLERANCE;

    // Logging
    m_verbose = true;
}

bool TessConfig::isFirstRun(const std::string& filename) {
    std::ifstream file(filename);
    return !file.good();
}

bool TessConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file: " << filename << std::endl;
        return false;
    }

    std::string line;
    std::string section;
    int lineNumber = 0;

    // First set defaults, then override with values from file
    setDefaults();

    while (std::getline(file, line)) {
        lineNumber++;
        line = AttributeParser::trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header
        if (line[0] == '[' && line[line.length() - 1] == ']') {
            section = AttributeParser::trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key=value
        std::string key, value;
        if (!parseLine(line, key, value)) {
            continue;
        }

        // Process the key-value pair according to the section
        try {
            bool valid = true;
            if (section == "flattening") {
                if (key == "bezier_points") m_bezierPoints = toInt(value);
                else if (key == "circle_points") m_circlePoints = toInt(value);
                else if (key == "max_segments") m_maxSegments = toInt(value);
            }
            else if (section == "tessellation") {
                if (key == "scale_factor") m_scaleFactor = toDouble(value);
                else if (key == "min_grid_steps") m_minGridSteps = toDouble(value);
            }
            else if (section == "document") {
                if (key == "invert_y") valid = parseBool(value, m_invertY);
                else if (key == "stroke_from_fill") valid = parseBool(value, m_strokeFromFill);
                else if (key == "dpi") m_dpi = toDouble(value);
                else if (key == "merge_tolerance") m_mergeTolerance = toDouble(value);
            }
            else if (section == "logging") {
                if (key == "verbose") valid = parseBool(value, m_verbose);
            }

            if (!valid) {
                throw std::invalid_argument("not a boolean");
            }
        } catch (const std::exception& e) {
            std::cerr << "Error: Invalid value '" << value << "' for " << section << "." << key
                      << " in " << filename << " line " << lineNumber
                      << " (" << e.what() << ")" << std::endl;
            return false;
        }
    }

    file.close();
    return true;
}

bool TessConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not open config file for writing: " << filename << std::endl;
        return false;
    }

    // Write file header
    file << "# NWSS Tess Configuration File" << std::endl;
    file << "# Automatically generated" << std::endl << std::endl;

    // Flattening section
    file << "[flattening]" << std::endl;
    file << "bezier_points=" << m_bezierPoints << std::endl;
    file << "circle_points=" << m_circlePoints << std::endl;
    file << "max_segments=" << m_maxSegments << std::endl << std::endl;

    // Tessellation section
    file << "[tessellation]" << std::endl;
    file << "scale_factor=" << m_scaleFactor << std::endl;
    file << "min_grid_steps=" << m_minGridSteps << std::endl << std::endl;

    // Document section
    file << "[document]" << std::endl;
    file << "invert_y=" << (m_invertY ? "true" : "false") << std::endl;
    file << "stroke_from_fill=" << (m_strokeFromFill ? "true" : "false") << std::endl;
    file << "dpi=" << m_dpi << std::endl;
    file << "merge_tolerance=" << m_mergeTolerance << std::endl << std::endl;

    // Logging section
    file << "[logging]" << std::endl;
    file << "verbose=" << (m_verbose ? "true" : "false") << std::endl;

    file.close();
    return true;
}

FlattenerConfig TessConfig::toFlattenerConfig() const {
    FlattenerConfig config;
    config.bezierPoints = m_bezierPoints;
    config.circlePoints = m_circlePoints;
    config.maxSegments = m_maxSegments;
    return config;
}

TessellatorOptions TessConfig::toTessellatorOptions() const {
    TessellatorOptions options;
    options.scaleFactor = m_scaleFactor;
    options.minGridSteps = m_minGridSteps;
    return options;
}

ParserConfig TessConfig::toParserConfig() const {
    ParserConfig config;
    config.flattener = toFlattenerConfig();
    config.tessellator = toTessellatorOptions();
    config.invertY = m_invertY;
    config.strokeFromFill = m_strokeFromFill;
    config.dpi = m_dpi;
    config.mergeTolerance = m_mergeTolerance;
    config.verbose = m_verbose;
    return config;
}

bool TessConfig::parseLine(const std::string& line, std::string& key, std::string& value) const {
    size_t pos = line.find('=');
    if (pos == std::string::npos) {
        return false;
    }

    key = AttributeParser::trim(line.substr(0, pos));
    value = AttributeParser::trim(line.substr(pos + 1));

    return !key.empty();
}

bool TessConfig::parseBool(const std::string& value, bool& result) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        result = true;
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        result = false;
        return true;
    }
    return false;
}

} // namespace tess
} // namespace nwss
