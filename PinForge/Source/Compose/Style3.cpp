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
#include <algorithm>

void StyleRenderers::renderStyle3(SDL_Surface* canvas, const StyleInput& input)
{
    const StyleConfig& cfg = input.config;
    std::unique_ptr<Font> font = titleFont(input);

    int barHeight = std::clamp(input.title.height + 2 * cfg.topBarPadding, cfg.topBarMinHeight, cfg.topBarMaxHeight);
    SDL_Rect topBar = { 0, 0, canvas->w, barHeight };
    LayerPrimitives::fillRect(canvas, topBar, cfg.barColor);

    SDL_Rect titleBox = { cfg.titleBox.x, 0, cfg.titleBox.w, barHeight };
    LayerPrimitives::drawCenteredBlock(canvas, *font, input.title, titleBox, VerticalAlign::Center, cfg.titleText);

    SDL_Rect bottomBar = { 0, canvas->h - cfg.bottomBarHeight, canvas->w, cfg.bottomBarHeight };
    LayerPrimitives::fillRect(canvas, bottomBar, cfg.barColor);
    drawBrandingBar(canvas, bottomBar, input.branding, cfg.branding, input.fonts);

    drawButton(canvas, cfg.button, input.fonts);
}
