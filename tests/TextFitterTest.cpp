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

#include "TestSupport.h"
#include "Graphics/Font.h"
#include "Graphics/FontCache.h"
#include "Graphics/TextFitter.h"
#include <gtest/gtest.h>
#include <cmath>

namespace
{

class TextFitterTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestSupport::initializeSdl();
        spec_.candidates = { "DejaVuSans-Bold.ttf", "DejaVuSans.ttf" };
        spec_.minSize = 30;
        spec_.maxSize = 80;
    }

    TextFitter fitter_{ TestSupport::fonts() };
    FontSpec spec_;
};

bool endsWith(const std::string& s, const std::string& suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}

TEST_F(TextFitterTest, ShortTitleUsesMaximumSize) {
    TextLayout layout = fitter_.fit("Hello", 800, 640, spec_);
    EXPECT_EQ(layout.fontSize, 80);
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_EQ(layout.lines[0], "Hello");
    EXPECT_FALSE(layout.truncated);
}

TEST_F(TextFitterTest, ResultStaysInsideRangeAndBox) {
    const std::string title = "Twenty Seven Small Kitchen Organization Ideas That Actually Work";
    TextLayout layout = fitter_.fit(title, 800, 300, spec_);

    EXPECT_GE(layout.fontSize, spec_.minSize);
    EXPECT_LE(layout.fontSize, spec_.maxSize);
    EXPECT_LE(layout.width, 800);
    EXPECT_LE(layout.height, 300);
    EXPECT_GT(layout.lines.size(), 1u);
    EXPECT_EQ(layout.lineHeight, static_cast<int>(std::lround(layout.fontHeight * 1.2f)));
    EXPECT_EQ(layout.height, TextFitter::blockHeight(layout.lines.size(), layout.lineHeight, layout.fontHeight));
}

TEST_F(TextFitterTest, AppendingWordsNeverGrowsTheFont) {
    const std::vector<std::string> words = {
        "Easy", "Weeknight", "Dinner", "Recipes", "For", "Busy", "Families", "With",
        "Picky", "Eaters", "And", "No", "Time", "To", "Spare"
    };

    std::string title;
    int previous = spec_.maxSize + 1;
    for (const std::string& word : words) {
        title += (title.empty() ? "" : " ") + word;
        TextLayout layout = fitter_.fit(title, 800, 400, spec_);
        EXPECT_LE(layout.fontSize, previous) << "after appending \"" << word << "\"";
        previous = layout.fontSize;
    }
}

TEST_F(TextFitterTest, OverflowAtMinimumSizeTruncatesWithEllipsis) {
    std::string title;
    for (int i = 0; i < 80; ++i) {
        title += "overflowing words ";
    }

    TextLayout layout = fitter_.fit(title, 600, 150, spec_);
    EXPECT_EQ(layout.fontSize, spec_.minSize);
    EXPECT_TRUE(layout.truncated);
    EXPECT_LE(layout.height, 150);
    ASSERT_FALSE(layout.lines.empty());
    const std::string& last = layout.lines.back();
    EXPECT_TRUE(endsWith(last, "\xE2\x80\xA6") || endsWith(last, "...")) << last;
}

TEST_F(TextFitterTest, LoneWideWordKeepsItsOwnLine) {
    const std::string word(250, 'W');
    TextLayout layout = fitter_.fit(word, 900, 220, spec_);
    EXPECT_EQ(layout.fontSize, spec_.minSize);
    ASSERT_EQ(layout.lines.size(), 1u);
    EXPECT_EQ(layout.lines[0], word);
    EXPECT_GT(layout.width, 900);
    EXPECT_FALSE(layout.truncated);
}

TEST_F(TextFitterTest, BlankTextYieldsEmptyLayout) {
    EXPECT_TRUE(fitter_.fit("", 800, 600, spec_).empty());
    EXPECT_TRUE(fitter_.fit(" \t\n ", 800, 600, spec_).empty());
}

TEST_F(TextFitterTest, SameInputSameLayout) {
    const std::string title = "The Ultimate Guide To Cozy Reading Nooks";
    TextLayout a = fitter_.fit(title, 840, 300, spec_);
    TextLayout b = fitter_.fit(title, 840, 300, spec_);
    EXPECT_EQ(a.fontSize, b.fontSize);
    EXPECT_EQ(a.lines, b.lines);
    EXPECT_EQ(a.width, b.width);
}

TEST_F(TextFitterTest, UnknownCandidatesFallBack) {
    FontSpec spec = spec_;
    spec.candidates = { "NoSuchFont-Bold.ttf" };
    TextLayout layout = fitter_.fit("Fallback", 800, 400, spec);
    EXPECT_FALSE(layout.empty());
    EXPECT_FALSE(layout.fontName.empty());
}

TEST_F(TextFitterTest, WrapIsGreedy) {
    std::unique_ptr<Font> font = TestSupport::fonts().resolve({ "DejaVuSans.ttf" }, 40);
    std::vector<std::string> words = { "one", "two", "three", "four" };
    int oneTwo = font->width("one two");
    std::vector<std::string> lines = TextFitter::wrap(*font, words, oneTwo);
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one two");
}
