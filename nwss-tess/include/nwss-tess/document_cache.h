#ifndef NWSS_TESS_DOCUMENT_CACHE_H
#define NWSS_TESS_DOCUMENT_CACHE_H

#include "nwss-tess/svg_document.h"
#include "nwss-tess/svg_parser.h"
#include <map>
#include <memory>
#include <string>
#include <tuple>

namespace nwss {
namespace tess {

/**
 * Keeps parsed documents for reuse, keyed by file and every parser setting
 * that changes the resulting document.
 * Not thread-safe.
 */
class SVGDocumentCache {
public:
    /**
     * Get the document for a file, parsing it on a miss.
     * Failed loads are not cached.
     *
     * @param filename Path to the SVG file
     * @param config Parser settings; all but verbose are part of the key
     * @return The shared document, or nullptr if the file could not be loaded
     */
    std::shared_ptr<const SVGDocument> get(const std::string& filename, const ParserConfig& config);

    // True if a document for the key is cached
    bool contains(const std::string& filename, const ParserConfig& config) const;

    void clear();

    size_t size() const { return m_documents.size(); }

private:
    // file, bezier points, circle points, max segments, scale factor, min grid steps,
    // invert y, stroke from fill, dpi, merge tolerance
    using Key = std::tuple<std::string, int, int, int, double, double, bool, bool, double, double>;

    static Key makeKey(const std::string& filename, const ParserConfig& config);

    std::map<Key, std::shared_ptr<const SVGDocument>> m_documents;
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_DOCUMENT_CACHE_H
