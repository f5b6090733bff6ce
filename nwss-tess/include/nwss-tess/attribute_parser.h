#ifndef NWSS_TESS_ATTRIBUTE_PARSER_H
#define NWSS_TESS_ATTRIBUTE_PARSER_H

#include "nwss-tess/paint.h"
#include <map>
#include <string>
#include <vector>

namespace nwss {
namespace tess {

/**
 * Scanners for SVG attribute values: token lists, numbers and lengths,
 * inline style declarations and colours.
 */
class AttributeParser {
public:
    /**
     * Split text into single ASCII letters and decimal numbers.
     * Commas, whitespace and any other characters act as separators.
     *
     * @param text The attribute value, e.g. path data
     * @return Matched substrings in the order they appear
     */
    static std::vector<std::string> tokenize(const std::string& text);

    /**
     * Split an inline style declaration into a key/value map.
     * Entries without a colon are ignored, the last duplicate key wins.
     */
    static std::map<std::string, std::string> parseStyleMap(const std::string& text);

    /**
     * Parse a complete decimal number with an optional "px" suffix
     * @throws ParseError if the text is not a number
     */
    static double parseNumber(const std::string& text);

    /**
     * Parse a length with an optional absolute unit (px, pt, pc, mm, cm, in)
     * into user units.
     *
     * @param text The length text
     * @param dpi Pixels per inch for physical units
     * @throws ParseError for malformed numbers, percentages and unknown units
     */
    static double parseLength(const std::string& text, double dpi = 96.0);

    /**
     * Parse every token of a list as a number (e.g. polyline points, viewBox)
     * @throws ParseError if a token is not numeric
     */
    static std::vector<double> parseNumberList(const std::string& text);

    /**
     * Parse a paint value.
     *
     * Recognizes #rgb, #rrggbb, rgb(r,g,b), url(#id), basic colour keywords
     * and "none". Empty text returns the default, so callers can tell an
     * unspecified paint from an explicit "none". Malformed values resolve to
     * no paint and append a message to warnings when given.
     *
     * @param text The attribute or style value
     * @param defaultPaint Returned when text is empty
     * @param warnings Optional diagnostics sink
     */
    static Paint parseColor(const std::string& text, const Paint& defaultPaint = Paint::none(),
                            std::vector<std::string>* warnings = nullptr);

    // Strip leading and trailing whitespace
    static std::string trim(const std::string& str);

private:
    /**
     * Scan a number starting at pos.
     * @return Position one past the number, or pos if there is none
     */
    static size_t scanNumber(const std::string& text, size_t pos);

    static bool parseHexColor(const std::string& hex, Color& color);
    static bool parseRgbFunction(const std::string& text, Color& color);
    static bool lookupNamedColor(const std::string& name, Color& color);
};

} // namespace tess
} // namespace nwss

#endif // NWSS_TESS_ATTRIBUTE_PARSER_H
