#include <gtest/gtest.h>
#include "paintcore/core/color.h"

#include <limits>

using paintcore::HsbColor;

TEST(ColorTest, ParsesHexForms) {
    ColorRGBA c{};
    ASSERT_TRUE(paintcore::parseHexColor("#ff8000", c));
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_NEAR(c.g, 128.0f / 255.0f, 1e-6f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 1.0f);

    ASSERT_TRUE(paintcore::parseHexColor("0F0", c));
    EXPECT_FLOAT_EQ(c.g, 1.0f);

    ASSERT_TRUE(paintcore::parseHexColor("#00000080", c));
    EXPECT_NEAR(c.a, 128.0f / 255.0f, 1e-6f);
}

TEST(ColorTest, RejectsMalformedHex) {
    ColorRGBA c{0.25f, 0.25f, 0.25f, 1.0f};
    EXPECT_FALSE(paintcore::parseHexColor("", c));
    EXPECT_FALSE(paintcore::parseHexColor("#12", c));
    EXPECT_FALSE(paintcore::parseHexColor("#gg0000", c));
    EXPECT_FALSE(paintcore::parseHexColor("#1234567", c));
    EXPECT_FLOAT_EQ(c.r, 0.25f);
}

TEST(ColorTest, FormatsHex) {
    EXPECT_EQ(paintcore::toHexString(ColorRGBA{1.0f, 0.0f, 0.5f, 1.0f}), "#ff0080");
    EXPECT_EQ(paintcore::toHexString(ColorRGBA{0.0f, 0.0f, 0.0f, 0.0f}, true), "#00000000");
}

TEST(ColorTest, HsbConversion) {
    const HsbColor red = paintcore::rgbToHsb(ColorRGBA{1.0f, 0.0f, 0.0f, 1.0f});
    EXPECT_FLOAT_EQ(red.h, 0.0f);
    EXPECT_FLOAT_EQ(red.s, 1.0f);
    EXPECT_FLOAT_EQ(red.b, 1.0f);

    const HsbColor blue = paintcore::rgbToHsb(ColorRGBA{0.0f, 0.0f, 1.0f, 1.0f});
    EXPECT_FLOAT_EQ(blue.h, 240.0f);

    const ColorRGBA green = paintcore::hsbToRgb(HsbColor{480.0f, 1.0f, 1.0f});
    EXPECT_NEAR(green.r, 0.0f, 1e-6f);
    EXPECT_NEAR(green.g, 1.0f, 1e-6f);
    EXPECT_NEAR(green.b, 0.0f, 1e-6f);

    const ColorRGBA gray = paintcore::hsbToRgb(HsbColor{-30.0f, 0.0f, 0.5f}, 0.5f);
    EXPECT_FLOAT_EQ(gray.r, 0.5f);
    EXPECT_FLOAT_EQ(gray.g, 0.5f);
    EXPECT_FLOAT_EQ(gray.a, 0.5f);
}

TEST(ColorTest, SanitizeClampsAndDropsNaN) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const ColorRGBA c = paintcore::sanitizeColor(ColorRGBA{2.0f, -1.0f, nan, 0.5f});
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.0f);
    EXPECT_FLOAT_EQ(c.a, 0.5f);
}

TEST(RecentColorsTest, MostRecentFirstWithoutDuplicates) {
    paintcore::RecentColors recent(3);
    const ColorRGBA red{1.0f, 0.0f, 0.0f, 1.0f};
    const ColorRGBA green{0.0f, 1.0f, 0.0f, 1.0f};
    const ColorRGBA blue{0.0f, 0.0f, 1.0f, 1.0f};
    const ColorRGBA white{1.0f, 1.0f, 1.0f, 1.0f};

    recent.push(red);
    recent.push(green);
    recent.push(red);
    ASSERT_EQ(recent.items().size(), 2u);
    EXPECT_EQ(paintcore::toHexString(recent.items()[0], false), "#ff0000");
    EXPECT_EQ(paintcore::toHexString(recent.items()[1], false), "#00ff00");

    recent.push(blue);
    recent.push(white);
    ASSERT_EQ(recent.items().size(), 3u);
    EXPECT_EQ(paintcore::toHexString(recent.items()[0], false), "#ffffff");
    EXPECT_EQ(paintcore::toHexString(recent.items()[2], false), "#ff0000");

    recent.clear();
    EXPECT_TRUE(recent.items().empty());
}
