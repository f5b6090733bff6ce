#ifndef NWSS_TESS_SVG_LOADER_H
#define NWSS_TESS_SVG_LOADER_H

#include <map>
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * One XML element of an SVG document
 */
struct SVGElement {
    // Local tag name, namespace prefix removed ("svg:rect" becomes "rect")
    std::string tag;
    std::map<std::string, std::string> attributes;
    std::vector<SVGElement> children;
    // Trimmed character data directly inside the element
    std::string text;

    bool hasAttribute(const std::string& name) const {
        return attributes.find(name) != attributes.end();
    }

    std::string getAttribute(const std::string& name, const std::string& defaultValue = "") const {
        auto it = attributes.find(name);
        return it != attributes.end() ? it->second : defaultValue;
    }

    // First direct child with the given tag, or nullptr
    const SVGElement* findChild(const std::string& childTag) const;
};

/**
 * Reads SVG files (plain or gzip compressed) into an element tree
 */
class SVGLoader {
public:
    /**
     * Load an SVG or SVGZ file
     *
     * @param filename Path to the file
     * @param root Receives the document element
     * @param error Receives a description of the failure
     * @return true if successful
     */
    static bool loadFile(const std::string& filename, SVGElement& root, std::string& error);

    /**
     * Parse SVG markup
     *
     * @param content XML text
     * @param root Receives the document element
     * @param error Receives a description of the failure
     * @return true if a root element was found
     */
    static bool loadString(const std::string& content, SVGElement& root, std::string& error);

    // True when the data starts with the gzip magic 1F 8B 08
    static bool isGzipped(const std::string& data);

    /**
     * Inflate gzip data
     * @return true if the stream decompressed completely
     */
    static bool decompressGzip(const std::string& data, std::string& output, std::string& error);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_SVG_LOADER_H
