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

// Gold title straight on a vignetted photo; the pin edge gets a soft dark
// band last.
void StyleRenderers::renderStyle2(SDL_Surface* canvas, const StyleInput& input)
{
    const StyleConfig& cfg = input.config;
    std::unique_ptr<Font> font = titleFont(input);

    LayerPrimitives::radialVignette(canvas, Rgba{ 0, 0, 0, 255 }, cfg.vignetteInnerAlpha, cfg.vignetteOuterAlpha,
        cfg.vignetteReach);
    LayerPrimitives::drawCenteredBlock(canvas, *font, input.title, cfg.titleBox, cfg.titleAlign, cfg.titleText);

    SDL_Rect footer = { 0, canvas->h - cfg.bottomBarHeight, canvas->w, cfg.bottomBarHeight };
    LayerPrimitives::fillRect(canvas, footer, cfg.barColor);
    drawBrandingBar(canvas, footer, input.branding, cfg.branding, input.fonts);

    drawButton(canvas, cfg.button, input.fonts);

    LayerPrimitives::innerEdgeShadow(canvas, cfg.edgeShadowAlpha, cfg.edgeShadowBlur);
}
