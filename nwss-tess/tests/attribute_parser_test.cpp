#include <gtest/gtest.h>
#include "nwss-tess/attribute_parser.h"
#include "nwss-tess/errors.h"

using namespace nwss::tess;

TEST(AttributeParserTest, TokenizeSplitsNumbersAndLetters) {
    std::vector<std::string> tokens = AttributeParser::tokenize("10,20 -5.5e2 L");
    std::vector<std::string> expected = {"10", "20", "-5.5e2", "L"};
    EXPECT_EQ(tokens, expected);
}

TEST(AttributeParserTest, TokenizeAdjacentSignsAndDots) {
    std::vector<std::string> expected = {"10", "-5"};
    EXPECT_EQ(AttributeParser::tokenize("10-5"), expected);

    expected = {"1.5", ".5"};
    EXPECT_EQ(AttributeParser::tokenize("1.5.5"), expected);
}

TEST(AttributeParserTest, TokenizePathData) {
    std::vector<std::string> expected = {"M", "0", "0", "h", "10", "v", "10", "z"};
    EXPECT_EQ(AttributeParser::tokenize("M0 0h10v10z"), expected);
}

TEST(AttributeParserTest, ExponentNeedsDigits) {
    // "e" without digits is an opcode letter, not part of the number
    std::vector<std::string> expected = {"2", "e", "3"};
    EXPECT_EQ(AttributeParser::tokenize("2e,3"), expected);

    expected = {"1e-3"};
    EXPECT_EQ(AttributeParser::tokenize("1e-3"), expected);
}

TEST(AttributeParserTest, StyleMap) {
    auto styles = AttributeParser::parseStyleMap("fill: red; stroke:#00f ;bogus; fill:blue;");
    EXPECT_EQ(styles.size(), 2u);
    EXPECT_EQ(styles["fill"], "blue");
    EXPECT_EQ(styles["stroke"], "#00f");
    EXPECT_EQ(styles.count("bogus"), 0u);
}

TEST(AttributeParserTest, StyleMapSplitsOnFirstColon) {
    auto styles = AttributeParser::parseStyleMap("font-family: a:b");
    EXPECT_EQ(styles["font-family"], "a:b");
}

TEST(AttributeParserTest, ParseNumber) {
    EXPECT_DOUBLE_EQ(AttributeParser::parseNumber("42"), 42.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseNumber(" -3.5 "), -3.5);
    EXPECT_DOUBLE_EQ(AttributeParser::parseNumber("1e2"), 100.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseNumber("12px"), 12.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseNumber(".5"), 0.5);

    EXPECT_THROW(AttributeParser::parseNumber(""), ParseError);
    EXPECT_THROW(AttributeParser::parseNumber("abc"), ParseError);
    EXPECT_THROW(AttributeParser::parseNumber("12 13"), ParseError);
}

TEST(AttributeParserTest, ParseLengthUnits) {
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("10"), 10.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("10px"), 10.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("1in"), 96.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("72pt"), 96.0);
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("1pc"), 16.0);
    EXPECT_NEAR(AttributeParser::parseLength("25.4mm"), 96.0, 1e-9);
    EXPECT_NEAR(AttributeParser::parseLength("2.54cm"), 96.0, 1e-9);
    EXPECT_DOUBLE_EQ(AttributeParser::parseLength("1in", 300.0), 300.0);

    EXPECT_THROW(AttributeParser::parseLength("50%"), ParseError);
    EXPECT_THROW(AttributeParser::parseLength("3em"), ParseError);
    EXPECT_THROW(AttributeParser::parseLength("wide"), ParseError);
}

TEST(AttributeParserTest, ParseNumberList) {
    std::vector<double> expected = {0, 0, 100, 50.5};
    EXPECT_EQ(AttributeParser::parseNumberList("0 0,100 50.5"), expected);
    EXPECT_TRUE(AttributeParser::parseNumberList("").empty());
}

TEST(AttributeParserTest, HexColors) {
    EXPECT_EQ(AttributeParser::parseColor("#ff0000"), Paint::solid(255, 0, 0));
    EXPECT_EQ(AttributeParser::parseColor("#f00"), Paint::solid(255, 0, 0));
    EXPECT_EQ(AttributeParser::parseColor("#1a2B3c"), Paint::solid(0x1a, 0x2b, 0x3c));
    EXPECT_EQ(AttributeParser::parseColor("#abc"), Paint::solid(0xaa, 0xbb, 0xcc));
}

TEST(AttributeParserTest, RgbFunction) {
    EXPECT_EQ(AttributeParser::parseColor("rgb(255, 0, 0)"), Paint::solid(255, 0, 0));
    EXPECT_EQ(AttributeParser::parseColor("rgb(0,128,255)"), Paint::solid(0, 128, 255));
    EXPECT_EQ(AttributeParser::parseColor("rgb( 10,20 , 30 )"), Paint::solid(10, 20, 30));
    EXPECT_EQ(AttributeParser::parseColor("rgb(100%, 20%, 0%)"), Paint::solid(255, 51, 0));
    EXPECT_EQ(AttributeParser::parseColor("rgb(300, -5, 0)"), Paint::solid(255, 0, 0));
}

TEST(AttributeParserTest, NamedAndSpecialColors) {
    EXPECT_EQ(AttributeParser::parseColor("black"), Paint::solid(0, 0, 0));
    EXPECT_EQ(AttributeParser::parseColor("orange"), Paint::solid(255, 165, 0));
    EXPECT_EQ(AttributeParser::parseColor("grey"), AttributeParser::parseColor("gray"));
    EXPECT_EQ(AttributeParser::parseColor("transparent"), Paint::solid(0, 0, 0, 0));
    EXPECT_TRUE(AttributeParser::parseColor("none").isNone());
}

TEST(AttributeParserTest, GradientReference) {
    Paint paint = AttributeParser::parseColor("url(#grad1)");
    ASSERT_TRUE(paint.isGradient());
    EXPECT_EQ(paint.getGradientId(), "grad1");
}

TEST(AttributeParserTest, EmptyUsesDefault) {
    Paint fallback = Paint::solid(1, 2, 3);
    EXPECT_EQ(AttributeParser::parseColor("", fallback), fallback);
    EXPECT_EQ(AttributeParser::parseColor("   ", fallback), fallback);
}

TEST(AttributeParserTest, UnknownColorWarnsAndIsNone) {
    std::vector<std::string> warnings;
    Paint paint = AttributeParser::parseColor("not-a-color", Paint::solid(0, 0, 0), &warnings);

    EXPECT_TRUE(paint.isNone());
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("not-a-color"), std::string::npos);

    warnings.clear();
    EXPECT_TRUE(AttributeParser::parseColor("#12345", Paint::none(), &warnings).isNone());
    EXPECT_EQ(warnings.size(), 1u);
}

TEST(AttributeParserTest, Trim) {
    EXPECT_EQ(AttributeParser::trim("  a b \t\n"), "a b");
    EXPECT_EQ(AttributeParser::trim("   "), "");
}
