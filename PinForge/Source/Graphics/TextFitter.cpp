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

#include "TextFitter.h"
#include "Font.h"
#include "FontCache.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <cmath>

static const char* const UNICODE_ELLIPSIS = "\xE2\x80\xA6";
static const char* const ASCII_ELLIPSIS = "...";

TextFitter::TextFitter(FontCache& fonts)
    : fonts_(fonts)
{
}

int TextFitter::lineHeightFor(const Font& font, float lineSpacing)
{
    return std::max(1, static_cast<int>(std::lround(font.height() * lineSpacing)));
}

int TextFitter::blockHeight(size_t lineCount, int lineHeight, int fontHeight)
{
    if (lineCount == 0) {
        return 0;
    }
    return static_cast<int>(lineCount - 1) * lineHeight + fontHeight;
}

std::vector<std::string> TextFitter::wrap(const Font& font, const std::vector<std::string>& words, int maxWidth)
{
    std::vector<std::string> lines;
    std::string current;

    for (const std::string& word : words) {
        if (current.empty()) {
            current = word;
            continue;
        }

        std::string candidate = current + " " + word;
        if (font.width(candidate) <= maxWidth) {
            current = std::move(candidate);
        }
        else {
            lines.push_back(std::move(current));
            current = word;
        }
    }
    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

TextLayout TextFitter::layoutAt(const Font& font, const std::vector<std::string>& words,
                                int maxWidth, float lineSpacing) const
{
    TextLayout layout;
    layout.fontSize = font.size();
    layout.fontName = font.name();
    layout.lines = wrap(font, words, maxWidth);
    layout.fontHeight = font.height();
    layout.lineHeight = lineHeightFor(font, lineSpacing);
    layout.height = blockHeight(layout.lines.size(), layout.lineHeight, layout.fontHeight);
    for (const std::string& line : layout.lines) {
        layout.width = std::max(layout.width, font.width(line));
    }
    return layout;
}

void TextFitter::truncate(const Font& font, TextLayout& layout, int maxWidth, int maxHeight) const
{
    size_t keep = 1;
    if (maxHeight > layout.fontHeight) {
        keep += static_cast<size_t>((maxHeight - layout.fontHeight) / layout.lineHeight);
    }
    if (keep >= layout.lines.size()) {
        return;
    }

    layout.lines.resize(keep);
    layout.truncated = true;

    const char* ellipsis = font.hasGlyph(0x2026) ? UNICODE_ELLIPSIS : ASCII_ELLIPSIS;
    std::vector<std::string> words = Utils::splitWords(layout.lines.back());
    std::string last = Utils::joinWords(words, 0, words.size()) + ellipsis;
    while (words.size() > 1 && font.width(last) > maxWidth) {
        words.pop_back();
        last = Utils::joinWords(words, 0, words.size()) + ellipsis;
    }
    layout.lines.back() = last;

    layout.height = blockHeight(layout.lines.size(), layout.lineHeight, layout.fontHeight);
    layout.width = 0;
    for (const std::string& line : layout.lines) {
        layout.width = std::max(layout.width, font.width(line));
    }
}

TextLayout TextFitter::fit(const std::string& text, int maxWidth, int maxHeight,
                           const FontSpec& spec, float lineSpacing) const
{
    std::vector<std::string> words = Utils::splitWords(text);
    if (words.empty()) {
        return TextLayout();
    }

    int minSize = std::max(1, std::min(spec.minSize, spec.maxSize));
    int maxSize = std::max(minSize, spec.maxSize);

    for (int size = maxSize; size > minSize; --size) {
        std::unique_ptr<Font> font = fonts_.resolve(spec.candidates, size);
        TextLayout layout = layoutAt(*font, words, maxWidth, lineSpacing);
        if (layout.width <= maxWidth && layout.height <= maxHeight) {
            LOG_DEBUG("TextFitter", "Fitted " << layout.lines.size() << " lines at size " << size
                << " into " << maxWidth << "x" << maxHeight);
            return layout;
        }
    }

    // minimum size: whatever wraps there is used, truncated if too tall
    std::unique_ptr<Font> font = fonts_.resolve(spec.candidates, minSize);
    TextLayout layout = layoutAt(*font, words, maxWidth, lineSpacing);
    if (layout.height > maxHeight) {
        truncate(*font, layout, maxWidth, maxHeight);
    }
    if (layout.width > maxWidth) {
        LOG_DEBUG("TextFitter", "Line of " << layout.width << "px overflows box width " << maxWidth
            << " at minimum size " << minSize);
    }
    if (layout.truncated) {
        LOG_INFO("TextFitter", "Title truncated to " << layout.lines.size() << " lines at size " << minSize);
    }
    return layout;
}
