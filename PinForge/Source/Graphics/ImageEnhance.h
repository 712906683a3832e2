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

// Photo adjustments applied to the normalized canvas before any style
// draws on it. Alpha is left untouched.
class ImageEnhance
{
public:
    // contrast 1.1, saturation 1.15, brightness 1.05
    static void enhance(SDL_Surface* canvas);

    // Low-contrast, slightly cool, darkening-toward-the-bottom treatment.
    static void backdrop(SDL_Surface* canvas);

    // factor 1 is the identity for all three
    static void contrast(SDL_Surface* canvas, float factor);
    static void color(SDL_Surface* canvas, float factor);
    static void brightness(SDL_Surface* canvas, float factor);

    static int backdropGradientAlpha(int row, int height);

private:
    ImageEnhance() = delete;
};
