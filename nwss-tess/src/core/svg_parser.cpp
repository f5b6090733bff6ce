#include "nwss-tess/svg_parser.h"
#include "nwss-tess/attribute_parser.h"
#include "nwss-tess/errors.h"
#include "nwss-tess/path_builder.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>

namespace nwss {
namespace tess {

namespace {

const std::set<std::string> SHAPE_TAGS = {
    "path", "rect", "circle", "ellipse", "line", "polyline", "polygon"
};

const std::set<std::string> CONTAINER_TAGS = {
    "svg", "g", "a", "defs", "switch", "symbol"
};

// Walked past without a diagnostic
const std::set<std::string> SILENT_TAGS = {
    "title", "desc", "metadata", "stop"
};

double clampUnit(double value) {
    return std::max(0.0, std::min(1.0, value));
}

// Number, or percentage mapped to a fraction
double parseFraction(const std::string& text) {
    std::string value = AttributeParser::trim(text);
    if (!value.empty() && value.back() == '%') {
        return AttributeParser::parseNumber(value.substr(0, value.size() - 1)) / 100.0;
    }
    return AttributeParser::parseNumber(value);
}

// Attribute value with the inline style declaration taking precedence
bool lookupProperty(const SVGElement& element, const std::map<std::string, std::string>& style,
                    const std::string& name, std::string& value) {
    auto it = style.find(name);
    if (it != style.end()) {
        value = it->second;
        return true;
    }
    if (element.hasAttribute(name)) {
        value = element.getAttribute(name);
        return true;
    }
    return false;
}

std::string describe(const SVGElement& element) {
    std::string id = element.getAttribute("id");
    return id.empty() ? "<" + element.tag + ">" : "<" + element.tag + " id=\"" + id + "\">";
}

} // namespace

SVGParser::SVGParser() : m_flattener(m_config.flattener) {}

SVGParser::SVGParser(const ParserConfig& config)
    : m_config(config), m_flattener(config.flattener) {
}

void SVGParser::setConfig(const ParserConfig& config) {
    m_config = config;
    m_flattener.setConfig(config.flattener);
}

const ParserConfig& SVGParser::getConfig() const {
    return m_config;
}

bool SVGParser::loadFromFile(const std::string& filename) {
    SVGElement root;
    std::string error;

    if (!SVGLoader::loadFile(filename, root, error)) {
        m_lastError = error;
        std::cerr << "Error: " << error << std::endl;
        return false;
    }

    return loadDocument(root, filename);
}

bool SVGParser::loadFromString(const std::string& content) {
    SVGElement root;
    std::string error;

    if (!SVGLoader::loadString(content, root, error)) {
        m_lastError = error;
        std::cerr << "Error: " << error << std::endl;
        return false;
    }

    return loadDocument(root, "<string>");
}

bool SVGParser::loadDocument(const SVGElement& root, const std::string& source) {
    try {
        m_document = parse(root, source);
    } catch (const SVGError& e) {
        m_lastError = e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    m_lastError.clear();
    return true;
}

SVGDocument SVGParser::parse(const SVGElement& root, const std::string& source) const {
    if (root.tag.empty()) {
        throw SVGError("Document has no root element");
    }
    if (root.tag != "svg") {
        throw SVGError("Root element is <" + root.tag + ">, expected <svg>");
    }

    SVGDocument document;
    ParseState state{document, source};

    setupViewport(root, state);

    ParseContext context;
    context.transform = document.m_rootTransform;
    context.fill = Paint::solid(0, 0, 0, 255);
    context.stroke = Paint::solid(0, 0, 0, 0);
    context.fillOpacity = 1.0;
    context.strokeOpacity = 1.0;
    context.opacity = 1.0;
    context.renderable = true;

    parseElement(root, context, state);

    return document;
}

void SVGParser::setupViewport(const SVGElement& root, ParseState& state) const {
    SVGDocument& document = state.document;

    std::vector<double> viewBox;
    if (root.hasAttribute("viewBox")) {
        try {
            viewBox = AttributeParser::parseNumberList(root.getAttribute("viewBox"));
        } catch (const ParseError& e) {
            warn(state, std::string("Ignoring viewBox: ") + e.what());
        }
        if (!viewBox.empty() && (viewBox.size() != 4 || viewBox[2] <= 0 || viewBox[3] <= 0)) {
            warn(state, "Ignoring invalid viewBox \"" + root.getAttribute("viewBox") + "\"");
            viewBox.clear();
        }
    }

    // Explicit sizes; percentages fall back to the viewBox
    auto readSize = [&](const std::string& name, double& size) {
        std::string value = AttributeParser::trim(root.getAttribute(name));
        if (value.empty() || value.back() == '%') {
            return false;
        }
        try {
            size = AttributeParser::parseLength(value, m_config.dpi);
            return true;
        } catch (const ParseError& e) {
            warn(state, "Ignoring " + name + ": " + e.what());
            return false;
        }
    };

    double width = 0.0;
    double height = 0.0;
    bool hasWidth = readSize("width", width);
    bool hasHeight = readSize("height", height);

    if (!viewBox.empty()) {
        if (!hasWidth) width = viewBox[2];
        if (!hasHeight) height = viewBox[3];
    }

    document.m_width = width;
    document.m_height = height;

    AffineTransform viewTransform;
    if (!viewBox.empty()) {
        double sx = width / viewBox[2];
        double sy = height / viewBox[3];
        std::string aspect = AttributeParser::trim(root.getAttribute("preserveAspectRatio"));

        if (aspect.compare(0, 4, "none") == 0) {
            viewTransform = AffineTransform::scaling(sx, sy)
                .compose(AffineTransform::translation(-viewBox[0], -viewBox[1]));
        } else {
            // Uniform scale, centered in the viewport
            double scale = std::min(sx, sy);
            double tx = (width - viewBox[2] * scale) / 2.0;
            double ty = (height - viewBox[3] * scale) / 2.0;
            viewTransform = AffineTransform::translation(tx, ty)
                .compose(AffineTransform::scaling(scale, scale))
                .compose(AffineTransform::translation(-viewBox[0], -viewBox[1]));
        }
    }

    if (m_config.invertY) {
        document.m_rootTransform = AffineTransform::fromValues(1, 0, 0, -1, 0, height).compose(viewTransform);
    } else {
        document.m_rootTransform = viewTransform;
    }
}

void SVGParser::parseElement(const SVGElement& element, const ParseContext& parent,
                             ParseState& state) const {
    const std::string& tag = element.tag;

    if (SILENT_TAGS.count(tag)) {
        return;
    }

    if (tag == "linearGradient" || tag == "radialGradient") {
        parseGradient(element, state);
        return;
    }

    bool isShape = SHAPE_TAGS.count(tag) > 0;
    if (!isShape && !CONTAINER_TAGS.count(tag)) {
        warn(state, "Unsupported element " + describe(element) + " skipped");
        return;
    }

    ParseContext context;
    try {
        context = deriveContext(element, parent, state);
    } catch (const ParseError& e) {
        warn(state, "Skipping " + describe(element) + ": " + e.what());
        return;
    }

    // Symbol content is only drawn through <use>
    if (tag == "defs" || tag == "symbol") {
        context.renderable = false;
    }

    if (isShape && context.renderable) {
        try {
            std::vector<Loop> loops = buildGeometry(element, state);
            if (!loops.empty()) {
                emitPath(element, loops, context, state);
            }
        } catch (const ParseError& e) {
            warn(state, "Dropping geometry of " + describe(element) + ": " + e.what());
        }
    }

    for (const auto& child : element.children) {
        parseElement(child, context, state);
    }
}

SVGParser::ParseContext SVGParser::deriveContext(const SVGElement& element, const ParseContext& parent,
                                                 ParseState& state) const {
    ParseContext context = parent;

    if (element.hasAttribute("transform")) {
        context.transform = parent.transform.compose(AffineTransform::parse(element.getAttribute("transform")));
    }

    std::map<std::string, std::string> style = AttributeParser::parseStyleMap(element.getAttribute("style"));
    std::string value;

    if (lookupProperty(element, style, "fill", value)) {
        context.fill = resolvePaint(value, parent.fill, state);
    }
    if (lookupProperty(element, style, "stroke", value)) {
        context.stroke = resolvePaint(value, parent.stroke, state);
    }
    if (lookupProperty(element, style, "fill-opacity", value)) {
        context.fillOpacity = clampUnit(AttributeParser::parseNumber(value));
    }
    if (lookupProperty(element, style, "stroke-opacity", value)) {
        context.strokeOpacity = clampUnit(AttributeParser::parseNumber(value));
    }
    if (lookupProperty(element, style, "opacity", value)) {
        context.opacity = parent.opacity * clampUnit(AttributeParser::parseNumber(value));
    }

    return context;
}

Paint SVGParser::resolvePaint(const std::string& value, const Paint& inherited, ParseState& state) const {
    if (AttributeParser::trim(value) == "inherit") {
        return inherited;
    }

    std::vector<std::string> warnings;
    Paint paint = AttributeParser::parseColor(value, inherited, &warnings);
    for (const auto& warning : warnings) {
        warn(state, warning);
    }
    return paint;
}

std::vector<Loop> SVGParser::buildGeometry(const SVGElement& element, ParseState& state) const {
    PathBuilder builder(m_flattener, m_config.mergeTolerance);
    const std::string& tag = element.tag;

    auto length = [&](const std::string& name, double defaultValue) {
        if (!element.hasAttribute(name)) {
            return defaultValue;
        }
        return AttributeParser::parseLength(element.getAttribute(name), m_config.dpi);
    };

    if (tag == "path") {
        std::vector<std::string> warnings;
        builder.parsePathData(element.getAttribute("d"), &warnings);
        for (const auto& warning : warnings) {
            warn(state, warning + " in " + describe(element));
        }
    } else if (tag == "rect") {
        double x = length("x", 0.0);
        double y = length("y", 0.0);
        double width = length("width", 0.0);
        double height = length("height", 0.0);

        // A single radius applies to both axes
        bool hasRx = element.hasAttribute("rx");
        bool hasRy = element.hasAttribute("ry");
        double rx = hasRx ? length("rx", 0.0) : 0.0;
        double ry = hasRy ? length("ry", 0.0) : 0.0;
        if (hasRx && !hasRy) ry = rx;
        if (hasRy && !hasRx) rx = ry;

        builder.addRect(x, y, width, height, rx, ry);
    } else if (tag == "circle") {
        builder.addCircle(length("cx", 0.0), length("cy", 0.0), length("r", 0.0));
    } else if (tag == "ellipse") {
        builder.addEllipse(length("cx", 0.0), length("cy", 0.0), length("rx", 0.0), length("ry", 0.0));
    } else if (tag == "line") {
        builder.addLine(length("x1", 0.0), length("y1", 0.0), length("x2", 0.0), length("y2", 0.0));
    } else if (tag == "polyline" || tag == "polygon") {
        builder.addPolyline(AttributeParser::parseNumberList(element.getAttribute("points")),
                            tag == "polygon");
    }

    return builder.endPath();
}

void SVGParser::emitPath(const SVGElement& element, const std::vector<Loop>& loops,
                         const ParseContext& context, ParseState& state) const {
    Paint fill = context.fill.withOpacity(context.opacity * context.fillOpacity);
    Paint stroke = context.stroke.withOpacity(context.opacity * context.strokeOpacity);

    if (m_config.strokeFromFill && stroke.isTransparent()) {
        stroke = fill;
    }

    std::vector<Point2D> triangles;
    if (!fill.isNone()) {
        TessellationResult result = Tessellator::triangulate(loops, m_config.tessellator);
        for (const auto& warning : result.warnings) {
            warn(state, warning + " in " + describe(element));
        }

        if (result.success) {
            triangles = result.triangles;
        } else {
            for (const auto& error : result.errors) {
                warn(state, "Fill of " + describe(element) + " dropped: " + error);
            }
            fill = Paint::none();
        }
    }

    std::string title;
    std::string description;
    if (const SVGElement* titleElement = element.findChild("title")) {
        title = titleElement->text;
    }
    if (const SVGElement* descElement = element.findChild("desc")) {
        description = descElement->text;
    }

    state.document.addPath(SVGPath(loops, triangles, stroke, fill, context.transform,
                                   element.getAttribute("id"), title, description));
}

void SVGParser::parseGradient(const SVGElement& element, ParseState& state) const {
    std::string id = element.getAttribute("id");
    if (id.empty()) {
        warn(state, "Ignoring " + describe(element) + " without id");
        return;
    }

    try {
        bool userSpace = AttributeParser::trim(element.getAttribute("gradientUnits")) == "userSpaceOnUse";

        // Percentages refer to the bounding box, or to the viewport in user space
        const SVGDocument& document = state.document;
        double diagonal = std::sqrt((document.m_width * document.m_width +
                                     document.m_height * document.m_height) / 2.0);
        auto coordinate = [&](const std::string& name, double defaultValue, double reference) {
            std::string value = AttributeParser::trim(element.getAttribute(name));
            if (value.empty()) {
                return userSpace ? defaultValue * reference : defaultValue;
            }
            if (value.back() == '%') {
                return parseFraction(value) * (userSpace ? reference : 1.0);
            }
            return AttributeParser::parseLength(value, m_config.dpi);
        };

        std::shared_ptr<Gradient> gradient;
        if (element.tag == "linearGradient") {
            gradient = std::make_shared<LinearGradient>(id,
                coordinate("x1", 0.0, document.m_width),
                coordinate("y1", 0.0, document.m_height),
                coordinate("x2", 1.0, document.m_width),
                coordinate("y2", 0.0, document.m_height));
        } else {
            gradient = std::make_shared<RadialGradient>(id,
                coordinate("cx", 0.5, document.m_width),
                coordinate("cy", 0.5, document.m_height),
                coordinate("r", 0.5, diagonal));
        }

        gradient->setUnits(userSpace ? Gradient::Units::USER_SPACE_ON_USE
                                     : Gradient::Units::OBJECT_BOUNDING_BOX);

        if (element.hasAttribute("gradientTransform")) {
            gradient->setTransform(AffineTransform::parse(element.getAttribute("gradientTransform")));
        }

        for (const auto& child : element.children) {
            if (child.tag != "stop") {
                continue;
            }

            std::map<std::string, std::string> style = AttributeParser::parseStyleMap(child.getAttribute("style"));
            std::string value;

            double offset = 0.0;
            if (lookupProperty(child, style, "offset", value)) {
                offset = parseFraction(value);
            }

            Paint color = Paint::solid(0, 0, 0, 255);
            if (lookupProperty(child, style, "stop-color", value)) {
                color = resolvePaint(value, color, state);
            }

            double opacity = 1.0;
            if (lookupProperty(child, style, "stop-opacity", value)) {
                opacity = clampUnit(AttributeParser::parseNumber(value));
            }

            Color stopColor(0, 0, 0, 0);
            if (color.isSolid()) {
                stopColor = color.withOpacity(opacity).getColor();
            }
            gradient->addStop(offset, stopColor);
        }

        // Referenced gradient supplies the stops when there are none here
        if (gradient->getStops().empty()) {
            std::string href = element.getAttribute("xlink:href", element.getAttribute("href"));
            href = AttributeParser::trim(href);
            if (!href.empty() && href[0] == '#') {
                auto referenced = document.gradientById(href.substr(1));
                if (referenced) {
                    gradient->setStops(referenced->getStops());
                } else {
                    warn(state, "Gradient '" + id + "' references unknown gradient '" + href + "'");
                }
            }
        }

        state.document.addGradient(gradient);
    } catch (const ParseError& e) {
        warn(state, "Skipping gradient '" + id + "': " + e.what());
    }
}

void SVGParser::warn(ParseState& state, const std::string& message) const {
    state.document.m_warnings.push_back(message);
    if (m_config.verbose) {
        std::cerr << "Warning: SVG parser (" << state.source << ") - " << message << std::endl;
    }
}

} // namespace tess
} // namespace nwss
