#include "nwss-tess/utils.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <iostream>

namespace nwss {
namespace tess {

namespace {

std::string opacityOf(const Color& color) {
    return Utils::formatNumber(color.a / 255.0, 3);
}

} // namespace

bool Utils::savePathsToCSV(const SVGDocument& document, const std::string& filename) {
    std::ofstream outFile(filename);
    if (!outFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << filename << std::endl;
        return false;
    }

    outFile << "# Tessellated SVG Paths" << std::endl;
    outFile << "# Format: path_index,kind,element_index,vertex_index,x,y" << std::endl;
    outFile << "# kind is 'loop' for stroke outlines and 'triangle' for fill triangles" << std::endl;

    const auto& paths = document.getPaths();
    for (size_t pathIndex = 0; pathIndex < paths.size(); pathIndex++) {
        const SVGPath& path = paths[pathIndex];
        const AffineTransform& transform = path.getTransform();

        outFile << "# Path " << pathIndex;
        if (!path.getId().empty()) {
            outFile << " id=" << path.getId();
        }
        outFile << " (" << path.getLoops().size() << " loops, "
                << path.getTriangles().size() / 3 << " triangles)" << std::endl;

        const auto& loops = path.getLoops();
        for (size_t loopIndex = 0; loopIndex < loops.size(); loopIndex++) {
            const auto& points = loops[loopIndex].getPoints();
            for (size_t pointIndex = 0; pointIndex < points.size(); pointIndex++) {
                Point2D p = transform.apply(points[pointIndex]);
                outFile << pathIndex << ",loop," << loopIndex << "," << pointIndex << ","
                        << formatNumber(p.x) << "," << formatNumber(p.y) << std::endl;
            }
        }

        const auto& triangles = path.getTriangles();
        for (size_t i = 0; i < triangles.size(); i++) {
            Point2D p = transform.apply(triangles[i]);
            outFile << pathIndex << ",triangle," << i / 3 << "," << i % 3 << ","
                    << formatNumber(p.x) << "," << formatNumber(p.y) << std::endl;
        }

        outFile << std::endl; // Empty line between paths
    }

    outFile.close();
    return true;
}

bool Utils::generateVisualization(const SVGDocument& document, const std::string& outputFile) {
    std::ofstream vizFile(outputFile);
    if (!vizFile.is_open()) {
        std::cerr << "Error: Could not open file for writing: " << outputFile << std::endl;
        return false;
    }

    double width = document.getWidth();
    double height = document.getHeight();

    vizFile << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>" << std::endl;
    vizFile << "<svg width=\"" << width << "\" height=\"" << height
            << "\" viewBox=\"0 0 " << width << " " << height
            << "\" xmlns=\"http://www.w3.org/2000/svg\">" << std::endl;

    for (const auto& path : document.getPaths()) {
        const AffineTransform& transform = path.getTransform();
        Bounds bbox = path.getLocalBounds();

        // Fill triangles, each coloured at its centroid
        const auto& triangles = path.getTriangles();
        if (!triangles.empty()) {
            vizFile << "  <g stroke=\"none\">" << std::endl;
            for (size_t i = 0; i + 2 < triangles.size(); i += 3) {
                Point2D centroid = (triangles[i] + triangles[i + 1] + triangles[i + 2]) * (1.0 / 3.0);
                Color color = document.resolveColor(path.getFill(), centroid, &bbox);

                vizFile << "    <polygon points=\"";
                for (size_t k = 0; k < 3; k++) {
                    Point2D p = transform.apply(triangles[i + k]);
                    vizFile << formatNumber(p.x) << "," << formatNumber(p.y) << " ";
                }
                vizFile << "\" fill=\"" << colorToHex(color)
                        << "\" fill-opacity=\"" << opacityOf(color) << "\" />" << std::endl;
            }
            vizFile << "  </g>" << std::endl;
        }

        // Stroke outlines
        for (const auto& loop : path.getLoops()) {
            if (loop.empty()) {
                continue;
            }

            Color color = document.resolveColor(path.getStroke(), loop.front(), &bbox);
            if (color.a == 0) {
                // Invisible strokes are drawn as thin outlines
                color = Color(255, 0, 0, 255);
            }

            vizFile << "  <polyline points=\"";
            for (const auto& point : loop.getPoints()) {
                Point2D p = transform.apply(point);
                vizFile << formatNumber(p.x) << "," << formatNumber(p.y) << " ";
            }
            vizFile << "\" fill=\"none\" stroke=\"" << colorToHex(color)
                    << "\" stroke-opacity=\"" << opacityOf(color)
                    << "\" stroke-width=\"0.5\" />" << std::endl;
        }
    }

    vizFile << "</svg>" << std::endl;
    vizFile.close();
    return true;
}

std::string Utils::colorToHex(const Color& color) {
    std::stringstream ss;
    ss << "#" << std::hex << std::setfill('0')
       << std::setw(2) << static_cast<int>(color.r)
       << std::setw(2) << static_cast<int>(color.g)
       << std::setw(2) << static_cast<int>(color.b);
    return ss.str();
}

std::string Utils::formatNumber(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string Utils::getFileExtension(const std::string& path) {
    size_t pos = path.find_last_of('.');
    size_t separator = path.find_last_of("/\\");
    if (pos == std::string::npos || (separator != std::string::npos && pos < separator)) {
        return "";
    }
    return path.substr(pos + 1);
}

std::string Utils::getBaseName(const std::string& path) {
    // Find the last directory separator
    size_t lastSeparator = path.find_last_of("/\\");
    std::string fileName = (lastSeparator == std::string::npos) ? path : path.substr(lastSeparator + 1);

    // Remove extension
    size_t lastDot = fileName.find_last_of('.');
    if (lastDot != std::string::npos) {
        fileName = fileName.substr(0, lastDot);
    }

    return fileName;
}

std::string Utils::replaceExtension(const std::string& path, const std::string& newExtension) {
    if (getFileExtension(path).empty()) {
        return path + "." + newExtension;
    }
    size_t pos = path.find_last_of('.');
    return path.substr(0, pos + 1) + newExtension;
}

} // namespace tess
} // namespace nwss
