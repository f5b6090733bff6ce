#include "nwss-tess/svg_loader.h"
#include "nwss-tess/attribute_parser.h"

#define NANOSVG_IMPLEMENTATION
#include "nanosvg.h"

#include <zlib.h>

#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

namespace nwss {
namespace tess {

namespace {

const size_t INFLATE_CHUNK = 16384;

// Replace the predefined XML entities
std::string decodeEntities(const std::string& text) {
    if (text.find('&') == std::string::npos) {
        return text;
    }

    static const struct {
        const char* entity;
        char value;
    } ENTITIES[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}
    };

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& e : ENTITIES) {
                size_t length = std::strlen(e.entity);
                if (text.compare(i, length, e.entity) == 0) {
                    result += e.value;
                    i += length;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            result += text[i++];
        }
    }
    return result;
}

std::string stripPrefix(const char* name) {
    const char* colon = std::strchr(name, ':');
    return colon ? std::string(colon + 1) : std::string(name);
}

/**
 * Receives XML events from the NanoSVG tokenizer and assembles the tree
 */
struct TreeBuilder {
    SVGElement root;
    bool hasRoot = false;
    bool rootClosed = false;
    std::vector<SVGElement*> stack;

    static void startElement(void* ud, const char* el, const char** attr) {
        TreeBuilder* builder = static_cast<TreeBuilder*>(ud);

        SVGElement element;
        element.tag = stripPrefix(el);
        for (int i = 0; attr[i] && attr[i + 1]; i += 2) {
            element.attributes[attr[i]] = decodeEntities(attr[i + 1]);
        }

        if (builder->stack.empty()) {
            // Only the first top-level element is the document
            if (builder->hasRoot) {
                return;
            }
            builder->root = element;
            builder->hasRoot = true;
            builder->stack.push_back(&builder->root);
            return;
        }

        SVGElement* parent = builder->stack.back();
        parent->children.push_back(element);
        builder->stack.push_back(&parent->children.back());
    }

    static void endElement(void* ud, const char* /*el*/) {
        TreeBuilder* builder = static_cast<TreeBuilder*>(ud);
        if (!builder->stack.empty()) {
            builder->stack.pop_back();
        }
    }

    static void content(void* ud, const char* s) {
        TreeBuilder* builder = static_cast<TreeBuilder*>(ud);
        if (builder->stack.empty()) {
            return;
        }

        SVGElement* element = builder->stack.back();
        std::string text = AttributeParser::trim(decodeEntities(s));
        if (text.empty()) {
            return;
        }
        if (!element->text.empty()) {
            element->text += " ";
        }
        element->text += text;
    }
};

} // namespace

const SVGElement* SVGElement::findChild(const std::string& childTag) const {
    for (const auto& child : children) {
        if (child.tag == childTag) {
            return &child;
        }
    }
    return nullptr;
}

bool SVGLoader::loadFile(const std::string& filename, SVGElement& root, std::string& error) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        error = "Could not open file " + filename;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string data = buffer.str();

    if (isGzipped(data)) {
        std::string inflated;
        if (!decompressGzip(data, inflated, error)) {
            error = "Failed to decompress " + filename + ": " + error;
            return false;
        }
        data.swap(inflated);
    }

    if (!loadString(data, root, error)) {
        error = error + " in " + filename;
        return false;
    }
    return true;
}

bool SVGLoader::loadString(const std::string& content, SVGElement& root, std::string& error) {
    // The tokenizer writes terminators into its input
    std::vector<char> buffer(content.begin(), content.end());
    buffer.push_back('\0');

    TreeBuilder builder;
    nsvg__parseXML(buffer.data(), TreeBuilder::startElement, TreeBuilder::endElement,
                   TreeBuilder::content, &builder);

    if (!builder.hasRoot) {
        error = "No root element found";
        return false;
    }

    root = std::move(builder.root);
    return true;
}

bool SVGLoader::isGzipped(const std::string& data) {
    return data.size() >= 3 &&
           static_cast<unsigned char>(data[0]) == 0x1F &&
           static_cast<unsigned char>(data[1]) == 0x8B &&
           static_cast<unsigned char>(data[2]) == 0x08;
}

bool SVGLoader::decompressGzip(const std::string& data, std::string& output, std::string& error) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    // 15 + 32 enables gzip header detection
    int ret = inflateInit2(&stream, 15 + 32);
    if (ret != Z_OK) {
        error = "inflateInit2 failed with code " + std::to_string(ret);
        return false;
    }

    output.clear();
    std::vector<char> chunk(INFLATE_CHUNK);

    do {
        stream.next_out = reinterpret_cast<Bytef*>(chunk.data());
        stream.avail_out = static_cast<uInt>(chunk.size());

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            error = stream.msg ? std::string(stream.msg) : "inflate failed with code " + std::to_string(ret);
            inflateEnd(&stream);
            return false;
        }

        output.append(chunk.data(), chunk.size() - stream.avail_out);

        // Truncated input: no progress possible with nothing left to read
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            error = "Unexpected end of compressed data";
            inflateEnd(&stream);
            return false;
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&stream);
    return true;
}

} // namespace tess
} // namespace nwss
