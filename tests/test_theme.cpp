#include <gtest/gtest.h>

#include "rateline/format/theme.hpp"
#include "rateline/core/error_codes.hpp"

using rateline::core::CoreErrorCode;
using rateline::core::EngineError;
using rateline::format::Theme;

TEST(Theme, DefaultIsAscii) {
    Theme theme;
    EXPECT_EQ(Theme::ascii().glyphs(), theme.glyphs());
    EXPECT_EQ(" ", theme.empty());
    EXPECT_EQ("█", theme.full());
}

TEST(Theme, ResolvesBuiltInNames) {
    EXPECT_EQ("#", Theme::resolve("basic").full());
    EXPECT_EQ(" ", Theme::resolve("basic").glyph(7));
    EXPECT_EQ("▏", Theme::resolve("blocks").glyph(1));
    EXPECT_EQ("▉", Theme::resolve("blocks").glyph(7));
    EXPECT_EQ(":", Theme::resolve("ascii").glyph(2));
}

TEST(Theme, ResolvesNineGlyphString) {
    Theme theme = Theme::resolve(" 12345678");
    EXPECT_EQ("8", theme.full());
    EXPECT_EQ("4", theme.glyph(4));
}

TEST(Theme, WrongGlyphCountIsRejected) {
    try {
        Theme::fromGlyphs({" ", "#"});
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(CoreErrorCode::INVALID_THEME, e.code());
        EXPECT_NE(std::string(e.what()).find("glyph_count=2"), std::string::npos);
    }
}

TEST(Theme, UnknownNameIsRejected) {
    try {
        Theme::resolve("rainbow");
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_EQ(CoreErrorCode::UNKNOWN_THEME, e.code());
    }
}

TEST(Theme, PartialPicksGlyphByEighths) {
    Theme theme = Theme::blocks();
    
    EXPECT_EQ(" ", theme.partial(0.0));
    EXPECT_EQ(" ", theme.partial(0.1));
    EXPECT_EQ("▏", theme.partial(0.125));
    EXPECT_EQ("▌", theme.partial(0.5));
    EXPECT_EQ("▉", theme.partial(0.99));
    EXPECT_EQ("▉", theme.partial(1.0));
}
