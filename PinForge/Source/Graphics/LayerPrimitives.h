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
#include <functional>
#include <string>
#include <vector>

class Font;
struct TextLayout;

enum class BlendMode
{
    Normal,          // replaces destination pixels
    AlphaComposite   // Porter-Duff "over" with straight alpha
};

struct Layer {
    SurfacePtr surface;
    int x = 0;
    int y = 0;
    BlendMode blend = BlendMode::AlphaComposite;
};

struct TextShadow {
    int dx = 0;
    int dy = 0;
    Rgba color;
    int blur = 0;
};

enum class VerticalAlign
{
    Top,
    Center
};

struct TextStyle {
    Rgba color;
    std::vector<TextShadow> shadows;
    int outlinePx = 0;
    Rgba outlineColor = Rgba{ 0, 0, 0, 255 };
};

// Drawing operations on RGBA32 surfaces. Everything composites with
// straight alpha; geometry outside the destination is clipped.
class LayerPrimitives
{
public:
    static void composite(SDL_Surface* dst, const Layer& layer);
    static void blendPixel(uint8_t* dst, uint8_t r, uint8_t g, uint8_t b, uint8_t a);

    static void fillRect(SDL_Surface* dst, const SDL_Rect& rect, Rgba color);

    // Radius is clamped to half the shorter side; arcs are anti-aliased.
    static int clampRadius(int width, int height, int radius);
    static void fillRoundedRect(SDL_Surface* dst, const SDL_Rect& rect, int radius, Rgba color);
    static Layer roundedRect(int width, int height, int radius, Rgba color, int x = 0, int y = 0);

    // Separable gaussian with sigma = radius / 2 over all four channels.
    static void gaussianBlur(SDL_Surface* surface, int radius);

    // Blurs what lies under a rounded rect, then tints it with overlay.
    static void blurredPanel(SDL_Surface* canvas, const SDL_Rect& rect, int cornerRadius, int blurRadius, Rgba overlay);

    // A text line with its shadows (drawn first, in order), optional
    // outline and foreground. (x, y) is the top-left of the plain glyphs.
    static Layer shadowedText(Font& font, const std::string& text, int x, int y, const TextStyle& style);

    static void drawCenteredLine(SDL_Surface* canvas, Font& font, const std::string& text,
                                 int centerX, int y, const TextStyle& style);

    // Draws every line of layout centred horizontally inside box.
    static void drawCenteredBlock(SDL_Surface* canvas, Font& font, const TextLayout& layout,
                                  const SDL_Rect& box, VerticalAlign align, const TextStyle& style);

    // Fades the four corners to transparent; corner pixels end at alpha 0.
    static void roundedCornerMask(SDL_Surface* canvas, int radius);

    // Composites color with a per-row alpha over the whole surface.
    static void verticalGradient(SDL_Surface* canvas, Rgba color, const std::function<int(int row)>& alphaForRow);

    // Alpha grows linearly from innerAlpha at the centre to outerAlpha at
    // reach pixels and beyond.
    static void radialVignette(SDL_Surface* canvas, Rgba color, int innerAlpha, int outerAlpha, float reach);

    // Dark band along all four edges, softened by blurRadius.
    static void innerEdgeShadow(SDL_Surface* canvas, int alpha, int blurRadius);

    static float roundedRectCoverage(float px, float py, const SDL_Rect& rect, int radius);

private:
    LayerPrimitives() = delete;
};
