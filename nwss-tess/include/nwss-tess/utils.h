#ifndef NWSS_TESS_UTILS_H
#define NWSS_TESS_UTILS_H

#include <string>
#include "nwss-tess/paint.h"
#include "nwss-tess/svg_document.h"

namespace nwss {
namespace tess {

class Utils {
public:
    // Save stroke loops and fill triangles, in document space, to a CSV file
    static bool savePathsToCSV(const SVGDocument& document, const std::string& filename);

    // Generate a visualization SVG showing the fill triangles and stroke loops
    static bool generateVisualization(const SVGDocument& document, const std::string& outputFile);

    // Convert a colour to a #rrggbb string
    static std::string colorToHex(const Color& color);

    // Format a number with a specific precision
    static std::string formatNumber(double value, int precision = 4);

    // Get the file extension from a path
    static std::string getFileExtension(const std::string& path);

    // Get the filename without extension
    static std::string getBaseName(const std::string& path);

    // Generate a filename with a different extension
    static std::string replaceExtension(const std::string& path, const std::string& newExtension);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_UTILS_H
