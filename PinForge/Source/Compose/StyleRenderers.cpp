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

#include "StyleRenderers.h"
#include "../Graphics/Font.h"
#include "../Graphics/FontCache.h"
#include "../PinErrors.h"
#include "../Utility/Log.h"
#include <algorithm>

void StyleRenderers::render(SDL_Surface* canvas, const StyleInput& input)
{
    LOG_DEBUG("Style", "Drawing " << toString(input.config.style) << " at title size " << input.title.fontSize);
    switch (input.config.style) {
    case PinStyle::Style1: renderStyle1(canvas, input); break;
    case PinStyle::Style2: renderStyle2(canvas, input); break;
    case PinStyle::Style3: renderStyle3(canvas, input); break;
    case PinStyle::Style4: renderStyle4(canvas, input); break;
    case PinStyle::Style5: renderStyle5(canvas, input); break;
    default:
        throw StyleNotRecognized(std::to_string(static_cast<int>(input.config.style)));
    }
}

std::unique_ptr<Font> StyleRenderers::titleFont(const StyleInput& input)
{
    return input.fonts.resolve(input.config.titleFont.candidates, input.title.fontSize);
}

std::unique_ptr<Font> StyleRenderers::fitLine(FontCache& fonts, const std::string& text, const FontSpec& spec, int maxWidth)
{
    int minSize = std::max(1, std::min(spec.minSize, spec.maxSize));
    for (int size = std::max(minSize, spec.maxSize); size > minSize; --size) {
        std::unique_ptr<Font> font = fonts.resolve(spec.candidates, size);
        if (font->width(text) <= maxWidth) {
            return font;
        }
    }
    return fonts.resolve(spec.candidates, minSize);
}

int StyleRenderers::inkCenteredTop(const Font& font, const std::string& text, int centerY, int offset)
{
    Font::InkBounds ink = font.inkBounds(text);
    return centerY + offset - font.ascent() + (ink.top + ink.bottom) / 2;
}

void StyleRenderers::drawButton(SDL_Surface* canvas, const ButtonSpec& button, FontCache& fonts)
{
    if (!button.enabled) {
        return;
    }

    int x = (canvas->w - button.width) / 2;
    SDL_Rect body = { x, button.y, button.width, button.height };
    SDL_Rect shadow = { x + button.shadowOffset, button.y + button.shadowOffset, button.width, button.height };

    LayerPrimitives::fillRoundedRect(canvas, shadow, button.radius, button.shadowColor);
    LayerPrimitives::fillRoundedRect(canvas, body, button.radius, button.color);

    std::unique_ptr<Font> font = fitLine(fonts, button.label, button.font, button.width - 40);
    int top = inkCenteredTop(*font, button.label, button.y + button.height / 2, 0);
    LayerPrimitives::drawCenteredLine(canvas, *font, button.label, canvas->w / 2, top, TextStyle{ button.textColor, {} });
}

void StyleRenderers::drawBrandingBar(SDL_Surface* canvas, const SDL_Rect& bar, const std::string& branding,
                                     const BrandingSpec& spec, FontCache& fonts)
{
    if (branding.empty()) {
        return;
    }

    std::unique_ptr<Font> font = fitLine(fonts, branding, spec.font, bar.w - 80);
    int top = inkCenteredTop(*font, branding, bar.y + bar.h / 2, spec.opticalOffsetY);
    LayerPrimitives::drawCenteredLine(canvas, *font, branding, bar.x + bar.w / 2, top, spec.text);
}

SDL_Rect StyleRenderers::drawBrandingBox(SDL_Surface* canvas, const std::string& branding,
                                         const BrandingSpec& spec, FontCache& fonts)
{
    std::unique_ptr<Font> font = fitLine(fonts, branding, spec.font, canvas->w - 200 - spec.paddingX);

    int textWidth = branding.empty() ? 0 : font->width(branding);
    int boxWidth = std::max(spec.minBoxWidth, textWidth + spec.paddingX);
    int boxHeight = font->height() + spec.paddingY;
    SDL_Rect box = { (canvas->w - boxWidth) / 2, canvas->h - spec.bottomMargin - boxHeight, boxWidth, boxHeight };

    LayerPrimitives::fillRoundedRect(canvas, box, spec.boxRadius, spec.boxColor);

    if (!branding.empty()) {
        int top = inkCenteredTop(*font, branding, box.y + box.h / 2, spec.opticalOffsetY);
        LayerPrimitives::drawCenteredLine(canvas, *font, branding, canvas->w / 2, top, spec.text);
    }
    return box;
}
