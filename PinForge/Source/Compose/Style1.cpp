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

// Frosted rounded box behind gold title, black footer bar with branding.
void StyleRenderers::renderStyle1(SDL_Surface* canvas, const StyleInput& input)
{
    const StyleConfig& cfg = input.config;
    const TextLayout& title = input.title;
    std::unique_ptr<Font> font = titleFont(input);

    int textLeft = cfg.titleBox.x + (cfg.titleBox.w - title.width) / 2;
    SDL_Rect panel = {
        textLeft - cfg.panelPaddingX,
        cfg.titleBox.y - cfg.panelPaddingTop,
        title.width + 2 * cfg.panelPaddingX,
        title.height + cfg.panelPaddingTop + cfg.panelPaddingBottom
    };
    SDL_Rect panelShadow = { panel.x + cfg.panelShadow.dx, panel.y + cfg.panelShadow.dy, panel.w, panel.h };

    LayerPrimitives::fillRoundedRect(canvas, panelShadow, cfg.panelRadius, cfg.panelShadow.color);
    LayerPrimitives::blurredPanel(canvas, panel, cfg.panelRadius, cfg.panelBlur, cfg.panelColor);
    LayerPrimitives::drawCenteredBlock(canvas, *font, title, cfg.titleBox, cfg.titleAlign, cfg.titleText);

    SDL_Rect footer = { 0, canvas->h - cfg.bottomBarHeight, canvas->w, cfg.bottomBarHeight };
    LayerPrimitives::fillRect(canvas, footer, cfg.barColor);
    drawBrandingBar(canvas, footer, input.branding, cfg.branding, input.fonts);

    drawButton(canvas, cfg.button, input.fonts);
}
