#include <gtest/gtest.h>
#include "nwss-tess/svg_loader.h"

#include <zlib.h>

#include <cstdio>
#include <cstring>
#include <fstream>

using namespace nwss::tess;

namespace {

const char* SAMPLE_SVG =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<!-- sample -->\n"
    "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"100\" height=\"50\">\n"
    "  <title>Tom &amp; Jerry</title>\n"
    "  <g id=\"layer\" fill=\"red\">\n"
    "    <rect x=\"1\" y=\"2\" width=\"3\" height=\"4\"/>\n"
    "    <svg:circle cx=\"5\" cy=\"5\" r=\"2\" data-label=\"a &lt; b\"/>\n"
    "  </g>\n"
    "</svg>\n";

// Compress with a gzip header, as an .svgz file carries it
std::string gzip(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    EXPECT_EQ(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);

    std::string output(deflateBound(&stream, static_cast<uLong>(data.size())) + 32, '\0');
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = reinterpret_cast<Bytef*>(&output[0]);
    stream.avail_out = static_cast<uInt>(output.size());

    EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
    output.resize(stream.total_out);
    deflateEnd(&stream);
    return output;
}

std::string writeTempFile(const std::string& name, const std::string& content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
}

} // namespace

TEST(SVGLoaderTest, BuildsElementTree) {
    SVGElement root;
    std::string error;
    ASSERT_TRUE(SVGLoader::loadString(SAMPLE_SVG, root, error)) << error;

    EXPECT_EQ(root.tag, "svg");
    EXPECT_EQ(root.getAttribute("width"), "100");
    EXPECT_EQ(root.getAttribute("height"), "50");
    EXPECT_FALSE(root.hasAttribute("viewBox"));
    EXPECT_EQ(root.getAttribute("viewBox", "none"), "none");

    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[0].tag, "title");
    EXPECT_EQ(root.children[0].text, "Tom & Jerry");

    const SVGElement* group = root.findChild("g");
    ASSERT_NE(group, nullptr);
    EXPECT_EQ(group->getAttribute("id"), "layer");
    ASSERT_EQ(group->children.size(), 2u);
    EXPECT_EQ(group->children[0].tag, "rect");
    EXPECT_EQ(group->children[0].getAttribute("height"), "4");
    EXPECT_EQ(root.findChild("desc"), nullptr);
}

TEST(SVGLoaderTest, StripsPrefixAndDecodesEntities) {
    SVGElement root;
    std::string error;
    ASSERT_TRUE(SVGLoader::loadString(SAMPLE_SVG, root, error)) << error;

    const SVGElement& circle = root.children[1].children[1];
    EXPECT_EQ(circle.tag, "circle");
    EXPECT_EQ(circle.getAttribute("data-label"), "a < b");
}

TEST(SVGLoaderTest, EmptyInputHasNoRoot) {
    SVGElement root;
    std::string error;
    EXPECT_FALSE(SVGLoader::loadString("   ", root, error));
    EXPECT_EQ(error, "No root element found");
}

TEST(SVGLoaderTest, DetectsGzipMagic) {
    EXPECT_TRUE(SVGLoader::isGzipped(gzip(SAMPLE_SVG)));
    EXPECT_FALSE(SVGLoader::isGzipped(SAMPLE_SVG));
    EXPECT_FALSE(SVGLoader::isGzipped("\x1f"));
}

TEST(SVGLoaderTest, DecompressesGzip) {
    std::string compressed = gzip(SAMPLE_SVG);
    std::string output;
    std::string error;

    ASSERT_TRUE(SVGLoader::decompressGzip(compressed, output, error)) << error;
    EXPECT_EQ(output, SAMPLE_SVG);
}

TEST(SVGLoaderTest, TruncatedGzipFails) {
    std::string compressed = gzip(SAMPLE_SVG);
    std::string truncated = compressed.substr(0, compressed.size() / 2);
    std::string output;
    std::string error;

    EXPECT_FALSE(SVGLoader::decompressGzip(truncated, output, error));
    EXPECT_FALSE(error.empty());
}

TEST(SVGLoaderTest, LoadsPlainAndCompressedFiles) {
    std::string plainPath = writeTempFile("nwss_tess_loader.svg", SAMPLE_SVG);
    std::string compressedPath = writeTempFile("nwss_tess_loader.svgz", gzip(SAMPLE_SVG));

    SVGElement plain;
    SVGElement compressed;
    std::string error;
    ASSERT_TRUE(SVGLoader::loadFile(plainPath, plain, error)) << error;
    ASSERT_TRUE(SVGLoader::loadFile(compressedPath, compressed, error)) << error;

    EXPECT_EQ(plain.tag, compressed.tag);
    EXPECT_EQ(plain.attributes, compressed.attributes);
    EXPECT_EQ(plain.children.size(), compressed.children.size());

    std::remove(plainPath.c_str());
    std::remove(compressedPath.c_str());
}

TEST(SVGLoaderTest, MissingFileFails) {
    SVGElement root;
    std::string error;
    EXPECT_FALSE(SVGLoader::loadFile("/nonexistent/drawing.svg", root, error));
    EXPECT_NE(error.find("/nonexistent/drawing.svg"), std::string::npos);
}
