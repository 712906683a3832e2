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

#include "LayerPrimitives.h"
#include "Font.h"
#include "TextFitter.h"
#include "../Utility/Log.h"
#include <algorithm>
#include <cmath>

// Separable gaussian over an interleaved float plane, clamping at edges.
static void blurPlane(std::vector<float>& plane, int width, int height, int channels, int radius)
{
    float sigma = radius / 2.0f;
    if (sigma <= 0.01f || width <= 0 || height <= 0) {
        return;
    }

    int half = static_cast<int>(std::ceil(sigma * 3.0f));
    std::vector<float> kernel(static_cast<size_t>(half * 2 + 1));
    float kernelSum = 0.0f;
    for (int k = -half; k <= half; ++k) {
        float value = std::exp(-static_cast<float>(k * k) / (2.0f * sigma * sigma));
        kernel[static_cast<size_t>(k + half)] = value;
        kernelSum += value;
    }
    for (float& w : kernel) {
        w /= kernelSum;
    }

    std::vector<float> temp(plane.size());

    // horizontal
    for (int y = 0; y < height; ++y) {
        const float* row = &plane[static_cast<size_t>(y) * width * channels];
        float* out = &temp[static_cast<size_t>(y) * width * channels];
        for (int x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                float acc = 0.0f;
                for (int k = -half; k <= half; ++k) {
                    int sx = std::clamp(x + k, 0, width - 1);
                    acc += row[sx * channels + c] * kernel[static_cast<size_t>(k + half)];
                }
                out[x * channels + c] = acc;
            }
        }
    }

    // vertical
    for (int y = 0; y < height; ++y) {
        float* out = &plane[static_cast<size_t>(y) * width * channels];
        for (int x = 0; x < width; ++x) {
            for (int c = 0; c < channels; ++c) {
                float acc = 0.0f;
                for (int k = -half; k <= half; ++k) {
                    int sy = std::clamp(y + k, 0, height - 1);
                    acc += temp[(static_cast<size_t>(sy) * width + x) * channels + c] * kernel[static_cast<size_t>(k + half)];
                }
                out[x * channels + c] = acc;
            }
        }
    }
}

static bool clipRect(const SDL_Surface* dst, const SDL_Rect& rect, SDL_Rect& clipped)
{
    SDL_Rect bounds = { 0, 0, dst->w, dst->h };
    return SDL_IntersectRect(&rect, &bounds, &clipped) == SDL_TRUE;
}

void LayerPrimitives::blendPixel(uint8_t* dst, uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    if (a == 0) {
        return;
    }
    if (a == 255 || dst[3] == 0) {
        dst[0] = r;
        dst[1] = g;
        dst[2] = b;
        dst[3] = a;
        return;
    }

    float sa = a / 255.0f;
    float da = dst[3] / 255.0f;
    float outA = sa + da * (1.0f - sa);
    float dstWeight = da * (1.0f - sa);

    dst[0] = SurfaceUtil::clampByte((r * sa + dst[0] * dstWeight) / outA);
    dst[1] = SurfaceUtil::clampByte((g * sa + dst[1] * dstWeight) / outA);
    dst[2] = SurfaceUtil::clampByte((b * sa + dst[2] * dstWeight) / outA);
    dst[3] = SurfaceUtil::clampByte(outA * 255.0f);
}

void LayerPrimitives::composite(SDL_Surface* dst, const Layer& layer)
{
    if (!layer.surface) {
        return;
    }

    const SDL_Surface* src = layer.surface.get();
    SDL_Rect area = { layer.x, layer.y, src->w, src->h };
    SDL_Rect clipped;
    if (!clipRect(dst, area, clipped)) {
        return;
    }

    for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
        const uint8_t* s = SurfaceUtil::pixel(src, clipped.x - layer.x, y - layer.y);
        uint8_t* d = SurfaceUtil::pixel(dst, clipped.x, y);
        if (layer.blend == BlendMode::Normal) {
            std::copy(s, s + clipped.w * 4, d);
            continue;
        }
        for (int x = 0; x < clipped.w; ++x, s += 4, d += 4) {
            blendPixel(d, s[0], s[1], s[2], s[3]);
        }
    }
}

void LayerPrimitives::fillRect(SDL_Surface* dst, const SDL_Rect& rect, Rgba color)
{
    SDL_Rect clipped;
    if (!clipRect(dst, rect, clipped)) {
        return;
    }

    for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
        uint8_t* d = SurfaceUtil::pixel(dst, clipped.x, y);
        for (int x = 0; x < clipped.w; ++x, d += 4) {
            blendPixel(d, color.r, color.g, color.b, color.a);
        }
    }
}

int LayerPrimitives::clampRadius(int width, int height, int radius)
{
    return std::clamp(radius, 0, std::max(0, std::min(width, height) / 2));
}

float LayerPrimitives::roundedRectCoverage(float px, float py, const SDL_Rect& rect, int radius)
{
    float left = static_cast<float>(rect.x);
    float top = static_cast<float>(rect.y);
    float right = static_cast<float>(rect.x + rect.w);
    float bottom = static_cast<float>(rect.y + rect.h);

    if (px < left || px > right || py < top || py > bottom) {
        return 0.0f;
    }

    float r = static_cast<float>(clampRadius(rect.w, rect.h, radius));
    if (r <= 0.0f) {
        return 1.0f;
    }

    float cx;
    float cy;
    if (px < left + r) cx = left + r;
    else if (px > right - r) cx = right - r;
    else return 1.0f;

    if (py < top + r) cy = top + r;
    else if (py > bottom - r) cy = bottom - r;
    else return 1.0f;

    float distance = std::hypot(px - cx, py - cy);
    return std::clamp(r - distance + 0.5f, 0.0f, 1.0f);
}

void LayerPrimitives::fillRoundedRect(SDL_Surface* dst, const SDL_Rect& rect, int radius, Rgba color)
{
    SDL_Rect clipped;
    if (!clipRect(dst, rect, clipped)) {
        return;
    }

    for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
        uint8_t* d = SurfaceUtil::pixel(dst, clipped.x, y);
        for (int x = clipped.x; x < clipped.x + clipped.w; ++x, d += 4) {
            float coverage = roundedRectCoverage(x + 0.5f, y + 0.5f, rect, radius);
            if (coverage <= 0.0f) {
                continue;
            }
            blendPixel(d, color.r, color.g, color.b, SurfaceUtil::clampByte(color.a * coverage));
        }
    }
}

Layer LayerPrimitives::roundedRect(int width, int height, int radius, Rgba color, int x, int y)
{
    Layer layer;
    layer.surface = SurfaceUtil::create(width, height);
    layer.x = x;
    layer.y = y;
    fillRoundedRect(layer.surface.get(), SDL_Rect{ 0, 0, width, height }, radius, color);
    return layer;
}

void LayerPrimitives::gaussianBlur(SDL_Surface* surface, int radius)
{
    if (radius <= 0) {
        return;
    }

    const int w = surface->w;
    const int h = surface->h;
    std::vector<float> plane(static_cast<size_t>(w) * h * 4);

    // blur premultiplied so transparent pixels do not bleed their colour
    for (int y = 0; y < h; ++y) {
        const uint8_t* p = SurfaceUtil::pixel(surface, 0, y);
        float* out = &plane[static_cast<size_t>(y) * w * 4];
        for (int x = 0; x < w; ++x, p += 4, out += 4) {
            float a = p[3] / 255.0f;
            out[0] = p[0] * a;
            out[1] = p[1] * a;
            out[2] = p[2] * a;
            out[3] = p[3];
        }
    }

    blurPlane(plane, w, h, 4, radius);

    for (int y = 0; y < h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(surface, 0, y);
        const float* in = &plane[static_cast<size_t>(y) * w * 4];
        for (int x = 0; x < w; ++x, p += 4, in += 4) {
            float a = in[3];
            if (a < 0.5f) {
                p[0] = p[1] = p[2] = p[3] = 0;
                continue;
            }
            float unpremultiply = 255.0f / a;
            p[0] = SurfaceUtil::clampByte(in[0] * unpremultiply);
            p[1] = SurfaceUtil::clampByte(in[1] * unpremultiply);
            p[2] = SurfaceUtil::clampByte(in[2] * unpremultiply);
            p[3] = SurfaceUtil::clampByte(a);
        }
    }
}

void LayerPrimitives::blurredPanel(SDL_Surface* canvas, const SDL_Rect& rect, int cornerRadius, int blurRadius, Rgba overlay)
{
    SDL_Rect clipped;
    if (!clipRect(canvas, rect, clipped)) {
        return;
    }

    if (blurRadius > 0) {
        // sample a margin around the panel so its edges blur like its middle
        int margin = blurRadius * 2;
        SDL_Rect source = { clipped.x - margin, clipped.y - margin, clipped.w + 2 * margin, clipped.h + 2 * margin };
        SDL_Rect sourceClipped = clipped;
        if (!clipRect(canvas, source, sourceClipped)) {
            sourceClipped = clipped;
        }

        SurfacePtr region = SurfaceUtil::create(sourceClipped.w, sourceClipped.h);
        for (int y = 0; y < sourceClipped.h; ++y) {
            const uint8_t* s = SurfaceUtil::pixel(canvas, sourceClipped.x, sourceClipped.y + y);
            std::copy(s, s + sourceClipped.w * 4, SurfaceUtil::pixel(region.get(), 0, y));
        }
        gaussianBlur(region.get(), blurRadius);

        for (int y = clipped.y; y < clipped.y + clipped.h; ++y) {
            uint8_t* d = SurfaceUtil::pixel(canvas, clipped.x, y);
            for (int x = clipped.x; x < clipped.x + clipped.w; ++x, d += 4) {
                float coverage = roundedRectCoverage(x + 0.5f, y + 0.5f, rect, cornerRadius);
                if (coverage <= 0.0f) {
                    continue;
                }
                const uint8_t* s = SurfaceUtil::pixel(region.get(), x - sourceClipped.x, y - sourceClipped.y);
                blendPixel(d, s[0], s[1], s[2], SurfaceUtil::clampByte(s[3] * coverage));
            }
        }
    }

    fillRoundedRect(canvas, rect, cornerRadius, overlay);
}

Layer LayerPrimitives::shadowedText(Font& font, const std::string& text, int x, int y, const TextStyle& style)
{
    SurfacePtr glyphs = font.render(text, style.color);

    int left = style.outlinePx;
    int top = style.outlinePx;
    int right = style.outlinePx;
    int bottom = style.outlinePx;
    for (const TextShadow& shadow : style.shadows) {
        int pad = shadow.blur > 0 ? static_cast<int>(std::ceil(shadow.blur * 1.5f)) + 1 : 0;
        left = std::max(left, pad - shadow.dx);
        right = std::max(right, pad + shadow.dx);
        top = std::max(top, pad - shadow.dy);
        bottom = std::max(bottom, pad + shadow.dy);
    }

    Layer layer;
    layer.surface = SurfaceUtil::create(glyphs->w + left + right, glyphs->h + top + bottom);
    layer.x = x - left;
    layer.y = y - top;
    layer.blend = BlendMode::AlphaComposite;

    for (const TextShadow& shadow : style.shadows) {
        Layer shadowGlyphs{ font.render(text, shadow.color), left + shadow.dx, top + shadow.dy, BlendMode::AlphaComposite };
        if (shadow.blur <= 0) {
            composite(layer.surface.get(), shadowGlyphs);
            continue;
        }
        Layer blurred{ SurfaceUtil::create(layer.surface->w, layer.surface->h), 0, 0, BlendMode::AlphaComposite };
        composite(blurred.surface.get(), shadowGlyphs);
        gaussianBlur(blurred.surface.get(), shadow.blur);
        composite(layer.surface.get(), blurred);
    }

    if (style.outlinePx > 0) {
        font.setOutline(style.outlinePx);
        Layer outline{ font.render(text, style.outlineColor), left - style.outlinePx, top - style.outlinePx, BlendMode::AlphaComposite };
        font.setOutline(0);
        composite(layer.surface.get(), outline);
    }

    composite(layer.surface.get(), Layer{ std::move(glyphs), left, top, BlendMode::AlphaComposite });
    return layer;
}

void LayerPrimitives::drawCenteredLine(SDL_Surface* canvas, Font& font, const std::string& text,
                                       int centerX, int y, const TextStyle& style)
{
    int width = font.width(text);
    composite(canvas, shadowedText(font, text, centerX - width / 2, y, style));
}

void LayerPrimitives::drawCenteredBlock(SDL_Surface* canvas, Font& font, const TextLayout& layout,
                                        const SDL_Rect& box, VerticalAlign align, const TextStyle& style)
{
    int top = box.y;
    if (align == VerticalAlign::Center) {
        top = box.y + (box.h - layout.height) / 2;
    }

    int centerX = box.x + box.w / 2;
    for (size_t i = 0; i < layout.lines.size(); ++i) {
        drawCenteredLine(canvas, font, layout.lines[i], centerX, top + static_cast<int>(i) * layout.lineHeight, style);
    }
}

void LayerPrimitives::roundedCornerMask(SDL_Surface* canvas, int radius)
{
    const int w = canvas->w;
    const int h = canvas->h;
    int r = clampRadius(w, h, radius);
    if (r <= 0) {
        return;
    }

    SDL_Rect full = { 0, 0, w, h };
    const SDL_Rect corners[4] = {
        { 0, 0, r, r },
        { w - r, 0, r, r },
        { 0, h - r, r, r },
        { w - r, h - r, r, r },
    };

    for (const SDL_Rect& corner : corners) {
        for (int y = corner.y; y < corner.y + corner.h; ++y) {
            uint8_t* p = SurfaceUtil::pixel(canvas, corner.x, y);
            for (int x = corner.x; x < corner.x + corner.w; ++x, p += 4) {
                float coverage = roundedRectCoverage(x + 0.5f, y + 0.5f, full, r);
                p[3] = static_cast<uint8_t>(p[3] * coverage + 0.5f);
            }
        }
    }
}

void LayerPrimitives::verticalGradient(SDL_Surface* canvas, Rgba color, const std::function<int(int row)>& alphaForRow)
{
    for (int y = 0; y < canvas->h; ++y) {
        int alpha = std::clamp(alphaForRow(y), 0, 255);
        if (alpha == 0) {
            continue;
        }
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            blendPixel(p, color.r, color.g, color.b, static_cast<uint8_t>(alpha));
        }
    }
}

void LayerPrimitives::radialVignette(SDL_Surface* canvas, Rgba color, int innerAlpha, int outerAlpha, float reach)
{
    const int centerX = canvas->w / 2;
    const int centerY = canvas->h / 2;

    for (int y = 0; y < canvas->h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        for (int x = 0; x < canvas->w; ++x, p += 4) {
            float distance = std::min(1.0f, std::hypot(static_cast<float>(x - centerX), static_cast<float>(y - centerY)) / reach);
            int alpha = static_cast<int>(innerAlpha + (outerAlpha - innerAlpha) * distance);
            blendPixel(p, color.r, color.g, color.b, static_cast<uint8_t>(std::clamp(alpha, 0, 255)));
        }
    }
}

void LayerPrimitives::innerEdgeShadow(SDL_Surface* canvas, int alpha, int blurRadius)
{
    const int w = canvas->w;
    const int h = canvas->h;
    int band = std::max(1, blurRadius);

    std::vector<float> mask(static_cast<size_t>(w) * h, static_cast<float>(alpha));
    for (int y = band; y < h - band; ++y) {
        std::fill(mask.begin() + static_cast<size_t>(y) * w + band, mask.begin() + static_cast<size_t>(y) * w + (w - band), 0.0f);
    }
    blurPlane(mask, w, h, 1, blurRadius);

    for (int y = 0; y < h; ++y) {
        uint8_t* p = SurfaceUtil::pixel(canvas, 0, y);
        const float* m = &mask[static_cast<size_t>(y) * w];
        for (int x = 0; x < w; ++x, p += 4) {
            blendPixel(p, 0, 0, 0, SurfaceUtil::clampByte(m[x]));
        }
    }
}
