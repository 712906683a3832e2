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

#include <SDL2/SDL.h>
#include <cstdint>
#include <memory>

struct SurfaceDeleter {
    void operator()(SDL_Surface* s) const { if (s) SDL_FreeSurface(s); }
};

// Every surface the engine hands around is SDL_PIXELFORMAT_RGBA32 with
// straight (non-premultiplied) alpha, so byte 0..3 of a pixel is R, G, B, A
// on any host.
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

constexpr Rgba rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
    return Rgba{ r, g, b, a };
}

class SurfaceUtil
{
public:
    // Throws RenderError when SDL cannot allocate.
    static SurfacePtr create(int width, int height, Rgba fill = Rgba{ 0, 0, 0, 0 });
    static SurfacePtr toRgba32(SDL_Surface* source);
    static SurfacePtr clone(const SDL_Surface* source);

    static uint8_t* pixel(SDL_Surface* s, int x, int y)
    {
        return static_cast<uint8_t*>(s->pixels) + y * s->pitch + x * 4;
    }

    static const uint8_t* pixel(const SDL_Surface* s, int x, int y)
    {
        return static_cast<const uint8_t*>(s->pixels) + y * s->pitch + x * 4;
    }

    static Rgba getPixel(const SDL_Surface* s, int x, int y)
    {
        const uint8_t* p = pixel(s, x, y);
        return Rgba{ p[0], p[1], p[2], p[3] };
    }

    static uint8_t clampByte(float v)
    {
        if (v <= 0.0f) return 0;
        if (v >= 255.0f) return 255;
        return static_cast<uint8_t>(v + 0.5f);
    }

private:
    SurfaceUtil() = delete;
};
