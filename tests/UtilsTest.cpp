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

#include "Utility/Utils.h"
#include <gtest/gtest.h>

TEST(UtilsTest, TrimAndLower) {
    std::string s = " \t Style3 \n";
    Utils::trim(s);
    EXPECT_EQ(s, "Style3");
    EXPECT_EQ(Utils::toLower(s), "style3");
}

TEST(UtilsTest, FilterCommentsDropsRestOfLine) {
    EXPECT_EQ(Utils::filterComments("key = value # note\r"), "key = value ");
}

TEST(UtilsTest, SplitWordsOnAnyWhitespace) {
    std::vector<std::string> words = Utils::splitWords("  ten\tquick\n tips  for  pins ");
    ASSERT_EQ(words.size(), 5u);
    EXPECT_EQ(words.front(), "ten");
    EXPECT_EQ(words.back(), "pins");
    EXPECT_TRUE(Utils::splitWords(" \t\n").empty());
}

TEST(UtilsTest, JoinWordsRange) {
    std::vector<std::string> words = { "a", "b", "c", "d" };
    EXPECT_EQ(Utils::joinWords(words, 1, 3), "b c");
    EXPECT_EQ(Utils::joinWords(words, 2, 10), "c d");
    EXPECT_EQ(Utils::joinWords(words, 4, 4), "");
}

TEST(UtilsTest, ListToVectorSkipsBlanks) {
    std::vector<std::string> out;
    Utils::listToVector(" a ,, b,c ", out, ',');
    EXPECT_EQ(out, (std::vector<std::string>{ "a", "b", "c" }));
}

TEST(UtilsTest, DecodeUtf8) {
    std::vector<uint32_t> cps = Utils::decodeUtf8("A\xC3\xA9\xE2\x80\xA6\xF0\x9F\x93\x8C");
    EXPECT_EQ(cps, (std::vector<uint32_t>{ 0x41, 0xE9, 0x2026, 0x1F4CC }));
}

TEST(UtilsTest, DecodeUtf8ReplacesInvalidSequences) {
    std::vector<uint32_t> cps = Utils::decodeUtf8("a\xFF" "b\xE2\x80");
    ASSERT_GE(cps.size(), 3u);
    EXPECT_EQ(cps[0], 0x61u);
    EXPECT_EQ(cps[1], 0xFFFDu);
    EXPECT_EQ(cps[2], 0x62u);
    EXPECT_EQ(cps.back(), 0xFFFDu);
}

TEST(UtilsTest, Paths) {
    EXPECT_EQ(Utils::combinePath("/srv", "static", "pin.png"), "/srv/static/pin.png");
    EXPECT_EQ(Utils::getFileName("/srv/static/pin.png"), "pin.png");
    EXPECT_TRUE(Utils::isAbsolutePath("/srv"));
    EXPECT_FALSE(Utils::isAbsolutePath("srv"));
    EXPECT_FALSE(Utils::isAbsolutePath(""));
}

TEST(UtilsTest, ReadMissingFileFails) {
    std::vector<uint8_t> bytes;
    EXPECT_FALSE(Utils::readFile("/nonexistent/pinforge/file.bin", bytes));
}
