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
#include <cstdint>
#include <vector>

// Turns arbitrary source image bytes into the fixed 1000x1500 opaque
// canvas every style draws on.
class CanvasNormalizer
{
public:
    static const int CANVAS_WIDTH = 1000;
    static const int CANVAS_HEIGHT = 1500;
    static const int MAX_SOURCE_DIMENSION = 16384;

    // Throws DecodeError for empty, corrupt, unsupported or oversized input.
    static SurfacePtr normalize(const std::vector<uint8_t>& bytes);

    // Decoded RGBA32 surface at the source's own size. Animated sources
    // yield their first frame.
    static SurfacePtr decode(const std::vector<uint8_t>& bytes);

    // Composites transparent pixels over black and forces alpha to 255.
    static void flattenOverBlack(SDL_Surface* surface);

    // Cover-scales with a separable Lanczos-3 filter and centre-crops to
    // exactly width x height.
    static SurfacePtr coverResize(const SDL_Surface* source, int width, int height);

private:
    CanvasNormalizer() = delete;

    static bool isWebP(const std::vector<uint8_t>& bytes);

    // Width and height from a PNG, GIF, BMP or JPEG header without
    // decoding pixels. False when the format or header is not recognized.
    static bool headerDimensions(const std::vector<uint8_t>& bytes, int& width, int& height);
    static SurfacePtr decodeWebP(const std::vector<uint8_t>& bytes);
};
