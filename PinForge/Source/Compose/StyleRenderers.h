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

#include "StyleConfig.h"
#include "../Graphics/Surface.h"
#include <memory>
#include <string>

class Font;
class FontCache;

struct StyleInput {
    const TextLayout& title;
    const std::string& branding;
    const StyleConfig& config;
    FontCache& fonts;
};

// The five layouts. Each draws onto the normalized, enhanced canvas in
// place and reads nothing but its input.
class StyleRenderers
{
public:
    static void render(SDL_Surface* canvas, const StyleInput& input);

    static void renderStyle1(SDL_Surface* canvas, const StyleInput& input);
    static void renderStyle2(SDL_Surface* canvas, const StyleInput& input);
    static void renderStyle3(SDL_Surface* canvas, const StyleInput& input);
    static void renderStyle4(SDL_Surface* canvas, const StyleInput& input);
    static void renderStyle5(SDL_Surface* canvas, const StyleInput& input);

    static void drawButton(SDL_Surface* canvas, const ButtonSpec& button, FontCache& fonts);
    static void drawBrandingBar(SDL_Surface* canvas, const SDL_Rect& bar, const std::string& branding,
                                const BrandingSpec& spec, FontCache& fonts);
    static SDL_Rect drawBrandingBox(SDL_Surface* canvas, const std::string& branding,
                                    const BrandingSpec& spec, FontCache& fonts);

    static std::unique_ptr<Font> titleFont(const StyleInput& input);

    // Largest size in spec whose single line fits maxWidth, else minSize.
    static std::unique_ptr<Font> fitLine(FontCache& fonts, const std::string& text, const FontSpec& spec, int maxWidth);

    // Glyph-box top that puts the ink centre of text at centerY + offset.
    static int inkCenteredTop(const Font& font, const std::string& text, int centerY, int offset);

private:
    StyleRenderers() = delete;
};
