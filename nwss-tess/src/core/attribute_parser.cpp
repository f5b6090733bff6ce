#include "nwss-tess/attribute_parser.h"
#include "nwss-tess/errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace nwss {
namespace tess {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isAsciiLetter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

struct NamedColor {
    const char* name;
    uint8_t r, g, b;
};

const NamedColor NAMED_COLORS[] = {
    {"black", 0, 0, 0},
    {"silver", 192, 192, 192},
    {"gray", 128, 128, 128},
    {"grey", 128, 128, 128},
    {"white", 255, 255, 255},
    {"maroon", 128, 0, 0},
    {"red", 255, 0, 0},
    {"purple", 128, 0, 128},
    {"fuchsia", 255, 0, 255},
    {"green", 0, 128, 0},
    {"lime", 0, 255, 0},
    {"olive", 128, 128, 0},
    {"yellow", 255, 255, 0},
    {"navy", 0, 0, 128},
    {"blue", 0, 0, 255},
    {"teal", 0, 128, 128},
    {"aqua", 0, 255, 255},
    {"orange", 255, 165, 0}
};

} // namespace

size_t AttributeParser::scanNumber(const std::string& text, size_t pos) {
    size_t length = text.size();
    size_t i = pos;

    if (i < length && (text[i] == '+' || text[i] == '-')) {
        i++;
    }

    size_t digits = 0;
    while (i < length && isDigit(text[i])) {
        i++;
        digits++;
    }

    if (i < length && text[i] == '.' && i + 1 < length && isDigit(text[i + 1])) {
        i++;
        while (i < length && isDigit(text[i])) {
            i++;
            digits++;
        }
    } else if (i < length && text[i] == '.' && digits > 0) {
        // "5." is a complete number
        i++;
    }

    if (digits == 0) {
        return pos;
    }

    // Exponent, only when followed by digits
    if (i < length && (text[i] == 'e' || text[i] == 'E')) {
        size_t e = i + 1;
        if (e < length && (text[e] == '+' || text[e] == '-')) {
            e++;
        }
        if (e < length && isDigit(text[e])) {
            while (e < length && isDigit(text[e])) {
                e++;
            }
            i = e;
        }
    }

    return i;
}

std::vector<std::string> AttributeParser::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    size_t length = text.size();

    while (i < length) {
        char c = text[i];

        size_t end = scanNumber(text, i);
        if (end > i) {
            tokens.push_back(text.substr(i, end - i));
            i = end;
            continue;
        }

        if (isAsciiLetter(c)) {
            tokens.push_back(std::string(1, c));
        }
        i++;
    }

    return tokens;
}

std::map<std::string, std::string> AttributeParser::parseStyleMap(const std::string& text) {
    std::map<std::string, std::string> styles;
    size_t start = 0;

    while (start <= text.size()) {
        size_t end = text.find(';', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        std::string item = text.substr(start, end - start);
        size_t colon = item.find(':');
        if (colon != std::string::npos) {
            std::string key = trim(item.substr(0, colon));
            if (!key.empty()) {
                styles[key] = trim(item.substr(colon + 1));
            }
        }

        start = end + 1;
    }

    return styles;
}

double AttributeParser::parseNumber(const std::string& text) {
    std::string value = trim(text);
    if (value.size() > 2 && value.compare(value.size() - 2, 2, "px") == 0) {
        value = trim(value.substr(0, value.size() - 2));
    }

    size_t end = scanNumber(value, 0);
    if (value.empty() || end != value.size()) {
        throw ParseError("Invalid number: '" + text + "'");
    }

    return std::strtod(value.c_str(), nullptr);
}

double AttributeParser::parseLength(const std::string& text, double dpi) {
    std::string value = trim(text);
    size_t end = scanNumber(value, 0);
    if (end == 0) {
        throw ParseError("Invalid length: '" + text + "'");
    }

    double number = std::strtod(value.substr(0, end).c_str(), nullptr);
    std::string unit = trim(value.substr(end));

    if (unit.empty() || unit == "px") return number;
    if (unit == "pt") return number * dpi / 72.0;
    if (unit == "pc") return number * dpi / 6.0;
    if (unit == "mm") return number * dpi / 25.4;
    if (unit == "cm") return number * dpi / 2.54;
    if (unit == "in") return number * dpi;

    throw ParseError("Unsupported length unit '" + unit + "' in '" + text + "'");
}

std::vector<double> AttributeParser::parseNumberList(const std::string& text) {
    std::vector<double> numbers;
    for (const auto& token : tokenize(text)) {
        numbers.push_back(parseNumber(token));
    }
    return numbers;
}

Paint AttributeParser::parseColor(const std::string& text, const Paint& defaultPaint,
                                  std::vector<std::string>* warnings) {
    std::string value = trim(text);
    if (value.empty()) {
        return defaultPaint;
    }

    if (value == "none") {
        return Paint::none();
    }

    Color color;

    if (value.compare(0, 4, "url(") == 0) {
        size_t hash = value.find('#');
        size_t close = value.find(')');
        if (hash != std::string::npos && close != std::string::npos && hash < close) {
            std::string id = trim(value.substr(hash + 1, close - hash - 1));
            if (!id.empty()) {
                return Paint::gradient(id);
            }
        }
    } else if (value[0] == '#') {
        if (parseHexColor(value.substr(1), color)) {
            return Paint::solid(color);
        }
    } else if (value.compare(0, 3, "rgb") == 0) {
        if (parseRgbFunction(value, color)) {
            return Paint::solid(color);
        }
    } else if (value == "transparent") {
        return Paint::solid(0, 0, 0, 0);
    } else if (lookupNamedColor(value, color)) {
        return Paint::solid(color);
    }

    if (warnings) {
        warnings->push_back("Could not parse color '" + text + "'");
    }
    return Paint::none();
}

bool AttributeParser::parseHexColor(const std::string& hex, Color& color) {
    if (hex.size() != 3 && hex.size() != 6) {
        return false;
    }
    if (!std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c); })) {
        return false;
    }

    if (hex.size() == 6) {
        color.r = static_cast<uint8_t>(std::strtol(hex.substr(0, 2).c_str(), nullptr, 16));
        color.g = static_cast<uint8_t>(std::strtol(hex.substr(2, 2).c_str(), nullptr, 16));
        color.b = static_cast<uint8_t>(std::strtol(hex.substr(4, 2).c_str(), nullptr, 16));
    } else {
        // #abc expands to #aabbcc
        color.r = static_cast<uint8_t>(std::strtol(hex.substr(0, 1).c_str(), nullptr, 16) * 17);
        color.g = static_cast<uint8_t>(std::strtol(hex.substr(1, 1).c_str(), nullptr, 16) * 17);
        color.b = static_cast<uint8_t>(std::strtol(hex.substr(2, 1).c_str(), nullptr, 16) * 17);
    }
    color.a = 255;
    return true;
}

bool AttributeParser::parseRgbFunction(const std::string& text, Color& color) {
    size_t open = text.find('(');
    size_t close = text.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return false;
    }
    if (trim(text.substr(0, open)) != "rgb") {
        return false;
    }

    std::string inner = text.substr(open + 1, close - open - 1);
    std::vector<double> channels;
    size_t start = 0;

    try {
        while (start <= inner.size()) {
            size_t comma = inner.find(',', start);
            if (comma == std::string::npos) {
                comma = inner.size();
            }

            std::string part = trim(inner.substr(start, comma - start));
            double value = 0.0;
            if (!part.empty() && part.back() == '%') {
                value = parseNumber(part.substr(0, part.size() - 1)) * 2.55;
            } else {
                value = parseNumber(part);
            }
            channels.push_back(value);
            start = comma + 1;
        }
    } catch (const ParseError&) {
        return false;
    }

    if (channels.size() != 3) {
        return false;
    }

    uint8_t* targets[3] = {&color.r, &color.g, &color.b};
    for (size_t i = 0; i < 3; ++i) {
        double clamped = std::max(0.0, std::min(255.0, channels[i]));
        *targets[i] = static_cast<uint8_t>(std::lround(clamped));
    }
    color.a = 255;
    return true;
}

bool AttributeParser::lookupNamedColor(const std::string& name, Color& color) {
    for (const auto& named : NAMED_COLORS) {
        if (name == named.name) {
            color = Color(named.r, named.g, named.b, 255);
            return true;
        }
    }
    return false;
}

std::string AttributeParser::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) {
        return std::isspace(c);
    });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace tess
} // namespace nwss
