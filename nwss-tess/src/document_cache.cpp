#include "nwss-tess/document_cache.h"

namespace nwss {
namespace tess {

std::shared_ptr<const SVGDocument> SVGDocumentCache::get(const std::string& filename,
                                                         const ParserConfig& config) {
    Key key = makeKey(filename, config);

    auto it = m_documents.find(key);
    if (it != m_documents.end()) {
        return it->second;
    }

    SVGParser parser(config);
    if (!parser.loadFromFile(filename)) {
        return nullptr;
    }

    auto document = std::make_shared<const SVGDocument>(parser.getDocument());
    m_documents[key] = document;
    return document;
}

bool SVGDocumentCache::contains(const std::string& filename, const ParserConfig& config) const {
    return m_documents.find(makeKey(filename, config)) != m_documents.end();
}

void SVGDocumentCache::clear() {
    m_documents.clear();
}

SVGDocumentCache::Key SVGDocumentCache::makeKey(const std::string& filename, const ParserConfig& config) {
    return Key(filename,
               config.flattener.bezierPoints,
               config.flattener.circlePoints,
               config.flattener.maxSegments,
               config.tessellator.scaleFactor,
               config.tessellator.minGridSteps,
               config.invertY,
               config.strokeFromFill,
               config.dpi,
               config.mergeTolerance);
}

} // namespace tess
} // namespace nwss
