#include "nwss-tess/config.h"
#include "nwss-tess/svg_parser.h"
#include "nwss-tess/utils.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace nwss::tess;

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <svg_file> [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --output <file>         Output file for loops and triangles (default: input.csv)" << std::endl;
    std::cout << "  --visualize <file>      Create visualization SVG (default: input.viz.svg)" << std::endl;
    std::cout << "  --bezier-points <num>   Segments per bezier curve (default: 20)" << std::endl;
    std::cout << "  --circle-points <num>   Segments per full circle or arc (default: 24)" << std::endl;
    std::cout << "  --invert-y              Flip the y axis so it grows upwards" << std::endl;
    std::cout << "  --config <file>         Read settings from an INI config file" << std::endl;
    std::cout << "  --quiet                 Do not echo parser warnings" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Parse command line arguments
    std::string svgFile = argv[1];
    std::string outputFile = Utils::replaceExtension(svgFile, "csv");
    std::string visualizeFile = Utils::replaceExtension(svgFile, "viz.svg");

    TessConfig config;
    std::string configFile;

    // Options given on the command line win over the config file
    std::vector<std::string> overrides;
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else {
            overrides.push_back(arg);
        }
    }

    if (!configFile.empty()) {
        if (!config.loadFromFile(configFile)) {
            std::cerr << "Error: Failed to load config file." << std::endl;
            return 1;
        }
        std::cout << "Loaded configuration from: " << configFile << std::endl;
    }

    try {
        for (size_t i = 0; i < overrides.size(); i++) {
            const std::string& arg = overrides[i];
            bool hasValue = i + 1 < overrides.size();

            if (arg == "--output" && hasValue) {
                outputFile = overrides[++i];
            }
            else if (arg == "--visualize" && hasValue) {
                visualizeFile = overrides[++i];
            }
            else if (arg == "--bezier-points" && hasValue) {
                config.setBezierPoints(std::stoi(overrides[++i]));
            }
            else if (arg == "--circle-points" && hasValue) {
                config.setCirclePoints(std::stoi(overrides[++i]));
            }
            else if (arg == "--invert-y") {
                config.setInvertY(true);
            }
            else if (arg == "--quiet") {
                config.setVerbose(false);
            }
            else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid numeric option value (" << e.what() << ")" << std::endl;
        return 1;
    }

    std::string extension = Utils::getFileExtension(svgFile);
    if (extension != "svg" && extension != "svgz") {
        std::cout << "Note: " << svgFile << " does not have an .svg or .svgz extension" << std::endl;
    }

    // Parse SVG file
    std::cout << "Parsing SVG file: " << svgFile << std::endl;
    SVGParser parser(config.toParserConfig());
    if (!parser.loadFromFile(svgFile)) {
        std::cerr << "Error: Failed to parse SVG file." << std::endl;
        return 1;
    }

    const SVGDocument& document = parser.getDocument();
    std::cout << "SVG Dimensions: " << document.getWidth() << " x " << document.getHeight() << std::endl;

    // Print flattening settings
    std::cout << "Flattening settings:" << std::endl;
    std::cout << "  Bezier points: " << config.getBezierPoints() << std::endl;
    std::cout << "  Circle points: " << config.getCirclePoints() << std::endl;
    std::cout << "  Invert Y: " << (config.getInvertY() ? "yes" : "no") << std::endl;

    const auto& paths = document.getPaths();
    std::cout << "\nFound " << paths.size() << " paths:" << std::endl;

    for (size_t i = 0; i < paths.size(); i++) {
        const SVGPath& path = paths[i];
        std::cout << "Path " << i << ":" << std::endl;
        std::cout << "  ID: " << (path.getId().empty() ? "(unnamed)" : path.getId()) << std::endl;
        if (!path.getTitle().empty()) {
            std::cout << "  Title: " << path.getTitle() << std::endl;
        }
        std::cout << "  Fill: " << path.getFill().toString() << std::endl;
        std::cout << "  Stroke: " << path.getStroke().toString() << std::endl;

        Bounds bounds = path.getDocumentBounds();
        std::cout << "  Bounds: [" << Utils::formatNumber(bounds.minX, 2) << ", "
                  << Utils::formatNumber(bounds.minY, 2) << ", "
                  << Utils::formatNumber(bounds.maxX, 2) << ", "
                  << Utils::formatNumber(bounds.maxY, 2) << "]" << std::endl;

        const auto& loops = path.getLoops();
        std::cout << "  Loops: " << loops.size() << std::endl;
        for (size_t j = 0; j < loops.size(); j++) {
            const auto& loop = loops[j];
            std::cout << "    Loop " << j << ": " << loop.size() << " points, length: "
                      << Utils::formatNumber(loop.length(), 2)
                      << (loop.isClosed() ? " (closed)" : "") << std::endl;

            // Print first few points
            const auto& points = loop.getPoints();
            const size_t maxPointsToPrint = 3;
            if (!points.empty()) {
                std::cout << "      First points: ";
                for (size_t k = 0; k < std::min(maxPointsToPrint, points.size()); k++) {
                    if (k > 0) std::cout << ", ";
                    std::cout << "(" << Utils::formatNumber(points[k].x, 1) << ","
                              << Utils::formatNumber(points[k].y, 1) << ")";
                }
                if (points.size() > maxPointsToPrint) {
                    std::cout << ", ...";
                }
                std::cout << std::endl;
            }
        }

        if (path.hasFill()) {
            std::cout << "  Triangles: " << path.getTriangles().size() / 3
                      << ", area: " << Utils::formatNumber(triangleListArea(path.getTriangles()), 2)
                      << std::endl;
        }
    }

    std::cout << "\nTotals: " << document.getTriangleCount() << " triangles, "
              << document.getLineCount() << " line segments, "
              << document.getGradients().size() << " gradients, "
              << document.getWarnings().size() << " warnings" << std::endl;

    // Save to CSV
    std::cout << "\nSaving " << paths.size() << " paths to: " << outputFile << std::endl;
    if (Utils::savePathsToCSV(document, outputFile)) {
        std::cout << "CSV file created successfully." << std::endl;
    }

    // Generate visualization
    std::cout << "Generating visualization: " << visualizeFile << std::endl;
    if (Utils::generateVisualization(document, visualizeFile)) {
        std::cout << "Visualization created successfully." << std::endl;
    }

    return 0;
}
