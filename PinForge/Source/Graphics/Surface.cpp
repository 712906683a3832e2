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

#include "Surface.h"
#include "../PinErrors.h"
#include <cstring>
#include <string>

SurfacePtr SurfaceUtil::create(int width, int height, Rgba fill)
{
    if (width <= 0 || height <= 0) {
        throw RenderError("invalid surface size " + std::to_string(width) + "x" + std::to_string(height));
    }

    SurfacePtr surface(SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, SDL_PIXELFORMAT_RGBA32));
    if (!surface) {
        throw RenderError("SDL_CreateRGBSurfaceWithFormat failed: " + std::string(SDL_GetError()));
    }
    SDL_SetSurfaceBlendMode(surface.get(), SDL_BLENDMODE_NONE);

    for (int y = 0; y < height; ++y) {
        uint8_t* row = pixel(surface.get(), 0, y);
        for (int x = 0; x < width; ++x) {
            row[x * 4 + 0] = fill.r;
            row[x * 4 + 1] = fill.g;
            row[x * 4 + 2] = fill.b;
            row[x * 4 + 3] = fill.a;
        }
    }
    return surface;
}

SurfacePtr SurfaceUtil::toRgba32(SDL_Surface* source)
{
    if (!source) {
        throw RenderError("null surface");
    }

    SurfacePtr converted(SDL_ConvertSurfaceFormat(source, SDL_PIXELFORMAT_RGBA32, 0));
    if (!converted) {
        throw RenderError("SDL_ConvertSurfaceFormat failed: " + std::string(SDL_GetError()));
    }
    SDL_SetSurfaceBlendMode(converted.get(), SDL_BLENDMODE_NONE);
    return converted;
}

SurfacePtr SurfaceUtil::clone(const SDL_Surface* source)
{
    SurfacePtr copy = create(source->w, source->h);
    for (int y = 0; y < source->h; ++y) {
        std::memcpy(pixel(copy.get(), 0, y), pixel(source, 0, y), static_cast<size_t>(source->w) * 4);
    }
    return copy;
}
