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

#include "Surface.h"
#include <SDL2/SDL.h>
#if __has_include(<SDL2/SDL_ttf.h>)
#include <SDL2/SDL_ttf.h>
#elif __has_include(<SDL2_ttf/SDL_ttf.h>)
#include <SDL2_ttf/SDL_ttf.h>
#else
#error "Cannot find SDL_ttf header"
#endif

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using FontBytes = std::shared_ptr<const std::vector<uint8_t>>;

// One opened face at one point size. A Font is owned by a single render
// call; the underlying file bytes are shared with the FontCache.
class Font
{
public:
    struct InkBounds {
        int top = 0;     // highest ink above the baseline
        int bottom = 0;  // lowest ink, negative below the baseline
    };

    // Returns nullptr when SDL_ttf rejects the data.
    static std::unique_ptr<Font> open(const FontBytes& bytes, const std::string& name, int size);
    ~Font();

    Font(const Font&) = delete;
    Font& operator=(const Font&) = delete;

    const std::string& name() const { return name_; }
    int size() const { return size_; }

    int width(const std::string& text) const;
    int height() const;
    int ascent() const;
    int descent() const;
    InkBounds inkBounds(const std::string& text) const;
    bool hasGlyph(uint32_t codepoint) const;

    // Outline thickness in pixels; 0 renders the plain glyphs.
    void setOutline(int px);
    int outline() const { return outline_; }

    // RGBA32 surface of one line. The surface is height() tall (plus twice
    // the outline), even for empty text.
    SurfacePtr render(const std::string& text, Rgba color) const;

private:
    Font(TTF_Font* font, FontBytes bytes, const std::string& name, int size);

    // FT_New_Face and FT_Done_Face share the FreeType library object
    static std::mutex& libraryMutex();

    TTF_Font* font_;
    FontBytes bytes_;
    std::string name_;
    int size_;
    int outline_ = 0;
};
