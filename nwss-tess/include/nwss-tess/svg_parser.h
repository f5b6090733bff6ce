#ifndef NWSS_TESS_SVG_PARSER_H
#define NWSS_TESS_SVG_PARSER_H

#include "nwss-tess/flattener.h"
#include "nwss-tess/paint.h"
#include "nwss-tess/svg_document.h"
#include "nwss-tess/svg_loader.h"
#include "nwss-tess/tessellator.h"
#include "nwss-tess/transform.h"
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * Settings for turning an element tree into a document
 */
struct ParserConfig {
    FlattenerConfig flattener;
    TessellatorOptions tessellator;

    // Flip the y axis so that y grows upwards from the bottom edge
    bool invertY = false;

    // Use the fill as stroke when the stroke is fully transparent
    bool strokeFromFill = true;

    // Resolution for physical length units
    double dpi = 96.0;

    // Squared distance under which adjacent loop points merge
    double mergeTolerance = DEFAULT_MERGE_TOLERANCE;

    // Echo diagnostics to stderr
    bool verbose = true;
};

/**
 * Walks an SVG element tree and builds the document: stroke loops, fill
 * triangles, resolved paints and the gradient registry.
 *
 * parse() keeps all per-document state on the stack, so one parser can be
 * shared between threads.
 */
class SVGParser {
public:
    SVGParser();
    explicit SVGParser(const ParserConfig& config);

    // Set configuration options
    void setConfig(const ParserConfig& config);

    // Get current configuration
    const ParserConfig& getConfig() const;

    /**
     * Build a document from an element tree
     *
     * @param root The document element
     * @param source Name used in diagnostics
     * @throws SVGError if the root element is missing or not an svg element
     */
    SVGDocument parse(const SVGElement& root, const std::string& source = "<memory>") const;

    // Load and parse an SVG or SVGZ file
    bool loadFromFile(const std::string& filename);

    // Parse SVG markup
    bool loadFromString(const std::string& content);

    // Document from the last successful load
    const SVGDocument& getDocument() const { return m_document; }

    const std::string& getLastError() const { return m_lastError; }

private:
    /**
     * Inherited state for one element. Derived from the parent and
     * discarded when the element's subtree is done.
     */
    struct ParseContext {
        AffineTransform transform;
        Paint fill;
        Paint stroke;
        double fillOpacity;
        double strokeOpacity;
        double opacity;
        bool renderable;
    };

    // Mutable state of a single parse() call
    struct ParseState {
        SVGDocument& document;
        const std::string& source;
    };

    ParserConfig m_config;
    CurveFlattener m_flattener;
    SVGDocument m_document;
    std::string m_lastError;

    bool loadDocument(const SVGElement& root, const std::string& source);

    // Establish width, height and the root transform
    void setupViewport(const SVGElement& root, ParseState& state) const;

    void parseElement(const SVGElement& element, const ParseContext& parent, ParseState& state) const;

    /**
     * Apply the element's transform, paint and opacity attributes
     * @throws ParseError on malformed values
     */
    ParseContext deriveContext(const SVGElement& element, const ParseContext& parent,
                               ParseState& state) const;

    /**
     * Flatten the element's shape into loops
     * @throws ParseError on malformed geometry
     */
    std::vector<Loop> buildGeometry(const SVGElement& element, ParseState& state) const;

    // Resolve paints, tessellate the fill and add the shape to the document
    void emitPath(const SVGElement& element, const std::vector<Loop>& loops,
                  const ParseContext& context, ParseState& state) const;

    void parseGradient(const SVGElement& element, ParseState& state) const;

    Paint resolvePaint(const std::string& value, const Paint& inherited, ParseState& state) const;

    void warn(ParseState& state, const std::string& message) const;
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_SVG_PARSER_H
