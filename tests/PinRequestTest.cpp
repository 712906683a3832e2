/* This file is part of PinForge.
 *
 * PinForge is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PinForge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PinForge.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Compose/PinRequest.h"
#include "Compose/StyleConfig.h"
#include "PinErrors.h"
#include <gtest/gtest.h>

TEST(PinStyleTest, AcceptsNamesAndDigits) {
    EXPECT_EQ(parsePinStyle("style1"), PinStyle::Style1);
    EXPECT_EQ(parsePinStyle("STYLE4"), PinStyle::Style4);
    EXPECT_EQ(parsePinStyle("  style5 "), PinStyle::Style5);
    EXPECT_EQ(parsePinStyle("3"), PinStyle::Style3);
    EXPECT_EQ(pinStyleFromNumber(2), PinStyle::Style2);
}

TEST(PinStyleTest, RejectsUnknownIdentifiers) {
    EXPECT_THROW(parsePinStyle("style6"), StyleNotRecognized);
    EXPECT_THROW(parsePinStyle("style"), StyleNotRecognized);
    EXPECT_THROW(parsePinStyle(""), StyleNotRecognized);
    EXPECT_THROW(parsePinStyle("style12"), StyleNotRecognized);
    EXPECT_THROW(pinStyleFromNumber(0), StyleNotRecognized);
    EXPECT_THROW(pinStyleFromNumber(6), StyleNotRecognized);

    try {
        parsePinStyle("fancy");
        FAIL() << "expected StyleNotRecognized";
    }
    catch (const StyleNotRecognized& e) {
        EXPECT_EQ(e.style(), "fancy");
    }
}

TEST(PinStyleTest, ToStringRoundTripsThroughParse) {
    for (int n = 1; n <= 5; ++n) {
        PinStyle style = pinStyleFromNumber(n);
        EXPECT_EQ(parsePinStyle(toString(style)), style);
    }
}

TEST(StyleConfigTest, EveryStyleHasATable) {
    for (int n = 1; n <= 5; ++n) {
        const StyleConfig& cfg = StyleConfig::forStyle(pinStyleFromNumber(n));
        EXPECT_EQ(cfg.style, pinStyleFromNumber(n));
        EXPECT_FLOAT_EQ(cfg.lineSpacing, 1.2f);
        EXPECT_LE(cfg.titleFont.minSize, cfg.titleFont.maxSize);
        EXPECT_FALSE(cfg.titleFont.candidates.empty());
        EXPECT_GT(cfg.cornerRadius, 0);
        EXPECT_GE(cfg.titleBox.x, 0);
        EXPECT_LE(cfg.titleBox.x + cfg.titleBox.w, 1000);
    }
}

TEST(StyleConfigTest, SizeRangesAndCorners) {
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style1).titleFont.maxSize, 84);
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style4).titleFont.minSize, 33);
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style4).titleFont.maxSize, 88);
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style5).titleFont.maxSize, 96);
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style1).cornerRadius, 60);
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style4).cornerRadius, 30);
}

TEST(StyleConfigTest, LongTitleLowersStyle4Ceiling) {
    const StyleConfig& cfg = StyleConfig::forStyle(PinStyle::Style4);

    FontSpec shortSpec = cfg.titleFontFor("Cozy Autumn Porch Ideas");
    EXPECT_EQ(shortSpec.maxSize, 88);

    FontSpec manyWords = cfg.titleFontFor("one two three four five six seven eight nine");
    EXPECT_EQ(manyWords.maxSize, 70);
    EXPECT_EQ(manyWords.minSize, 33);

    FontSpec manyChars = cfg.titleFontFor(std::string(61, 'x'));
    EXPECT_EQ(manyChars.maxSize, 70);

    // other styles ignore title length
    EXPECT_EQ(StyleConfig::forStyle(PinStyle::Style1).titleFontFor(std::string(200, 'x')).maxSize, 84);
}

TEST(StyleConfigTest, Style1PanelPadsFiftyByThirtyFive) {
    const StyleConfig& cfg = StyleConfig::forStyle(PinStyle::Style1);
    EXPECT_EQ(cfg.panelPaddingX, 50);
    EXPECT_EQ(cfg.panelPaddingTop, 35);
    EXPECT_EQ(cfg.panelPaddingBottom, 35);
}
