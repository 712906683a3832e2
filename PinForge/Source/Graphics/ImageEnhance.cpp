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

#include "ImageEnhance.h"
#include "LayerPrimitives.h"

static int luminance(const uint8_t* p)
{
    return (p[0] * 299 + p[1] * 587 + p[2] * 114) / 1000;
}

void ImageEnhance::contrast(SDL_Surface* canvas, float factor)
{
    const size_t count = static_cast<size_t>(canvas->w) * canvas->h;
    if (count == 0) {
        return;
    }

    // contrast pivots on the mean grey level of the whole image
    uint64_t total = 0;
    for (int y = 0; y < canvas->h; ++y) {
        const uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            total += static_cast<uint64_t>(luminance(p));
        }
    }
    float mean = static_cast<float>(static_cast<int>(static_cast<double>(total) / count + 0.5));

    for (int y = 0; y < canvas->h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            for (int c = 0; c < 3; ++c) {
                p[c] = SurfaceUtil::clampByte(mean + (p[c] - mean) * factor);
            }
        }
    }
}

void ImageEnhance::color(SDL_Surface* canvas, float factor)
{
    for (int y = 0; y < canvas->h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            float grey = static_cast<float>(luminance(p));
            for (int c = 0; c < 3; ++c) {
                p[c] = SurfaceUtil::clampByte(grey + (p[c] - grey) * factor);
            }
        }
    }
}

void ImageEnhance::brightness(SDL_Surface* canvas, float factor)
{
    for (int y = 0; y < canvas->h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            for (int c = 0; c < 3; ++c) {
                p[c] = SurfaceUtil::clampByte(p[c] * factor);
            }
        }
    }
}

void ImageEnhance::enhance(SDL_Surface* canvas)
{
    contrast(canvas, 1.1f);
    color(canvas, 1.15f);
    brightness(canvas, 1.05f);
}

int ImageEnhance::backdropGradientAlpha(int row, int height)
{
    float progress = static_cast<float>(row) / height;
    if (progress < 0.5f) {
        return static_cast<int>(15.0f * progress);
    }
    return static_cast<int>(15.0f * (1.0f + (progress - 0.5f)));
}

void ImageEnhance::backdrop(SDL_Surface* canvas)
{
    contrast(canvas, 0.85f);
    LayerPrimitives::fillRect(canvas, SDL_Rect{ 0, 0, canvas->w, canvas->h }, rgba(66, 66, 77, 25));

    const int height = canvas->h;
    LayerPrimitives::verticalGradient(canvas, rgba(0, 0, 0),
        [height](int row) { return backdropGradientAlpha(row, height); });
}
