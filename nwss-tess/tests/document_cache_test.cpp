#include <gtest/gtest.h>
#include "nwss-tess/document_cache.h"

#include <cstdio>
#include <fstream>

using namespace nwss::tess;

class DocumentCacheTest : public ::testing::Test {
protected:
    std::string path;
    ParserConfig config;

    void SetUp() override {
        path = ::testing::TempDir() + "nwss_tess_cache.svg";
        std::ofstream file(path);
        file << "<svg width=\"10\" height=\"10\"><circle id=\"c\" cx=\"5\" cy=\"5\" r=\"4\"/></svg>";
        config.verbose = false;
    }

    void TearDown() override {
        std::remove(path.c_str());
    }
};

TEST_F(DocumentCacheTest, ReusesParsedDocument) {
    SVGDocumentCache cache;
    auto first = cache.get(path, config);
    ASSERT_NE(first, nullptr);
    EXPECT_TRUE(cache.contains(path, config));

    auto second = cache.get(path, config);
    EXPECT_EQ(first, second);
    EXPECT_EQ(cache.size(), 1u);
}

TEST_F(DocumentCacheTest, ResolutionIsPartOfTheKey) {
    SVGDocumentCache cache;
    auto coarse = cache.get(path, config);

    ParserConfig fine = config;
    fine.flattener.circlePoints = 96;
    EXPECT_FALSE(cache.contains(path, fine));

    auto detailed = cache.get(path, fine);
    ASSERT_NE(coarse, nullptr);
    ASSERT_NE(detailed, nullptr);
    EXPECT_NE(coarse, detailed);
    EXPECT_EQ(cache.size(), 2u);

    EXPECT_EQ(coarse->pathById("c")->getLoops()[0].size(), 25u);
    EXPECT_EQ(detailed->pathById("c")->getLoops()[0].size(), 97u);
}

TEST_F(DocumentCacheTest, DocumentSettingsArePartOfTheKey) {
    SVGDocumentCache cache;
    auto upright = cache.get(path, config);

    ParserConfig flipped = config;
    flipped.invertY = true;
    auto inverted = cache.get(path, flipped);

    ASSERT_NE(upright, nullptr);
    ASSERT_NE(inverted, nullptr);
    EXPECT_NE(upright, inverted);
    EXPECT_TRUE(upright->getRootTransform().isIdentity());
    EXPECT_TRUE(inverted->getRootTransform().isApprox(
        AffineTransform::fromValues(1, 0, 0, -1, 0, 10)));

    // Verbosity only affects console output
    ParserConfig quiet = config;
    quiet.verbose = !config.verbose;
    EXPECT_EQ(cache.get(path, quiet), upright);

    ParserConfig other = config;
    other.strokeFromFill = false;
    EXPECT_FALSE(cache.contains(path, other));
    other = config;
    other.tessellator.scaleFactor = 10.0;
    EXPECT_FALSE(cache.contains(path, other));
    other = config;
    other.dpi = 72.0;
    EXPECT_FALSE(cache.contains(path, other));
    other = config;
    other.mergeTolerance = 0.5;
    EXPECT_FALSE(cache.contains(path, other));
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(DocumentCacheTest, FailuresAreNotCached) {
    SVGDocumentCache cache;
    EXPECT_EQ(cache.get("/nonexistent/file.svg", config), nullptr);
    EXPECT_FALSE(cache.contains("/nonexistent/file.svg", config));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(DocumentCacheTest, Clear) {
    SVGDocumentCache cache;
    ASSERT_NE(cache.get(path, config), nullptr);
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.contains(path, config));
}
