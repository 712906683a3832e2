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
#pragma once

#include <string>
#include <vector>

class Font;
class FontCache;

struct FontSpec {
    std::vector<std::string> candidates;
    int minSize = 30;
    int maxSize = 80;
};

struct TextLayout {
    int fontSize = 0;
    std::string fontName;
    std::vector<std::string> lines;
    int width = 0;       // widest line
    int height = 0;      // (lines - 1) * lineHeight + font height
    int lineHeight = 0;
    int fontHeight = 0;
    bool truncated = false;

    bool empty() const { return lines.empty(); }
};

// Picks the largest size in a FontSpec range at which greedily wrapped
// text fits a box. Identical input always yields identical output.
class TextFitter
{
public:
    explicit TextFitter(FontCache& fonts);

    TextLayout fit(const std::string& text, int maxWidth, int maxHeight,
                   const FontSpec& spec, float lineSpacing = 1.2f) const;

    // Greedy wrap at a fixed font; a word wider than maxWidth gets its own line.
    static std::vector<std::string> wrap(const Font& font, const std::vector<std::string>& words, int maxWidth);

    static int lineHeightFor(const Font& font, float lineSpacing);
    static int blockHeight(size_t lineCount, int lineHeight, int fontHeight);

private:
    TextLayout layoutAt(const Font& font, const std::vector<std::string>& words,
                        int maxWidth, float lineSpacing) const;
    void truncate(const Font& font, TextLayout& layout, int maxWidth, int maxHeight) const;

    FontCache& fonts_;
};
