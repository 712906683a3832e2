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

#include "Font.h"
#include "../PinErrors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <climits>

std::mutex& Font::libraryMutex()
{
    static std::mutex mutex;
    return mutex;
}

Font::Font(TTF_Font* font, FontBytes bytes, const std::string& name, int size)
    : font_(font)
    , bytes_(std::move(bytes))
    , name_(name)
    , size_(size)
{
}

std::unique_ptr<Font> Font::open(const FontBytes& bytes, const std::string& name, int size)
{
    if (!bytes || bytes->empty()) {
        return nullptr;
    }

    TTF_Font* font = nullptr;
    {
        std::scoped_lock lock(libraryMutex());
        SDL_RWops* rw = SDL_RWFromConstMem(bytes->data(), static_cast<int>(bytes->size()));
        if (!rw) {
            LOG_WARNING("Font", "SDL_RWFromConstMem failed for " << name << ": " << SDL_GetError());
            return nullptr;
        }
        font = TTF_OpenFontRW(rw, 1, std::max(size, 1));
        if (!font) {
            LOG_WARNING("Font", "TTF_OpenFontRW failed for " << name << ": " << TTF_GetError());
            return nullptr;
        }
    }

    TTF_SetFontKerning(font, 1);
    TTF_SetFontHinting(font, TTF_HINTING_LIGHT);

    return std::unique_ptr<Font>(new Font(font, bytes, name, std::max(size, 1)));
}

Font::~Font()
{
    if (font_) {
        std::scoped_lock lock(libraryMutex());
        TTF_CloseFont(font_);
        font_ = nullptr;
    }
}

int Font::width(const std::string& text) const
{
    if (text.empty()) {
        return 0;
    }

    int w = 0;
    int h = 0;
    if (TTF_SizeUTF8(font_, text.c_str(), &w, &h) != 0) {
        LOG_WARNING("Font", "TTF_SizeUTF8 failed for " << name_ << ": " << TTF_GetError());
        return 0;
    }
    return w;
}

int Font::height() const
{
    return TTF_FontHeight(font_);
}

int Font::ascent() const
{
    return TTF_FontAscent(font_);
}

int Font::descent() const
{
    return TTF_FontDescent(font_);
}

Font::InkBounds Font::inkBounds(const std::string& text) const
{
    InkBounds bounds;
    int top = INT_MIN;
    int bottom = INT_MAX;

    for (uint32_t cp : Utils::decodeUtf8(text)) {
        int minx = 0;
        int maxx = 0;
        int miny = 0;
        int maxy = 0;
        int advance = 0;
        if (TTF_GlyphMetrics32(font_, cp, &minx, &maxx, &miny, &maxy, &advance) != 0) {
            continue;
        }
        // spaces report an empty box at the baseline
        if (maxy == miny) {
            continue;
        }
        top = std::max(top, maxy);
        bottom = std::min(bottom, miny);
    }

    if (top == INT_MIN) {
        bounds.top = ascent();
        bounds.bottom = descent();
    }
    else {
        bounds.top = top;
        bounds.bottom = bottom;
    }
    return bounds;
}

bool Font::hasGlyph(uint32_t codepoint) const
{
    return TTF_GlyphIsProvided32(font_, codepoint) != 0;
}

void Font::setOutline(int px)
{
    outline_ = std::max(px, 0);
    TTF_SetFontOutline(font_, outline_);
}

SurfacePtr Font::render(const std::string& text, Rgba color) const
{
    if (text.empty()) {
        return SurfaceUtil::create(1 + 2 * outline_, height() + 2 * outline_);
    }

    // coverage is rendered opaque; colour alpha scales it afterwards
    SDL_Color c = { color.r, color.g, color.b, 255 };
    SurfacePtr rendered(TTF_RenderUTF8_Blended(font_, text.c_str(), c));
    if (!rendered) {
        throw RenderError("TTF_RenderUTF8_Blended failed for " + name_ + ": " + TTF_GetError());
    }

    SurfacePtr out = SurfaceUtil::toRgba32(rendered.get());
    if (color.a < 255) {
        for (int y = 0; y < out->h; ++y) {
            uint8_t* row = SurfaceUtil::pixel(out.get(), 0, y);
            for (int x = 0; x < out->w; ++x) {
                row[x * 4 + 3] = static_cast<uint8_t>((row[x * 4 + 3] * color.a + 127) / 255);
            }
        }
    }
    return out;
}
