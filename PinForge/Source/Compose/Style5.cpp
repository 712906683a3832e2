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

// Photo on top, dark dome at the bottom holding the title, white branding
// box optically centred on its text.
void StyleRenderers::renderStyle5(SDL_Surface* canvas, const StyleInput& input)
{
    const StyleConfig& cfg = input.config;
    std::unique_ptr<Font> font = titleFont(input);

    LayerPrimitives::fillRoundedRect(canvas, cfg.darkRegion, cfg.darkRegionRadius, cfg.darkRegionColor);
    LayerPrimitives::drawCenteredBlock(canvas, *font, input.title, cfg.titleBox, cfg.titleAlign, cfg.titleText);

    drawBrandingBox(canvas, input.branding, cfg.branding, input.fonts);
}
