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

#include "PinRequest.h"
#include "../Graphics/LayerPrimitives.h"
#include "../Graphics/TextFitter.h"
#include <string>

struct ButtonSpec {
    bool enabled = false;
    std::string label = "Read More";
    FontSpec font;
    int width = 450;
    int height = 70;
    int radius = 25;
    int y = 0;
    Rgba color;
    Rgba textColor;
    int shadowOffset = 4;
    Rgba shadowColor = Rgba{ 0, 0, 0, 90 };
};

struct BrandingSpec {
    FontSpec font;
    TextStyle text;
    bool boxed = false;          // a filled box instead of a full-width bar
    Rgba boxColor;
    int boxRadius = 0;
    int paddingX = 0;
    int paddingY = 0;
    int bottomMargin = 0;
    int minBoxWidth = 200;
    int opticalOffsetY = 0;      // added to the ink centre of the text
};

// Geometry and colour of one style. Instances are built once and only
// ever read.
struct StyleConfig {
    PinStyle style = PinStyle::Style1;

    FontSpec titleFont;
    float lineSpacing = 1.2f;
    SDL_Rect titleBox = { 0, 0, 0, 0 };
    VerticalAlign titleAlign = VerticalAlign::Top;
    TextStyle titleText;

    // Style 1 box around the title
    Rgba panelColor;
    int panelRadius = 0;
    int panelPaddingX = 0;
    int panelPaddingTop = 0;
    int panelPaddingBottom = 0;
    int panelBlur = 0;
    TextShadow panelShadow;

    // full-width bars; a height of zero means no bar
    int topBarMinHeight = 0;
    int topBarMaxHeight = 0;
    int topBarPadding = 0;
    int bottomBarHeight = 0;
    Rgba barColor;

    // Style 4 bottom rectangle and Style 5 dome
    SDL_Rect darkRegion = { 0, 0, 0, 0 };
    int darkRegionRadius = 0;
    Rgba darkRegionColor;

    // Style 2 backdrop
    int vignetteInnerAlpha = 0;
    int vignetteOuterAlpha = 0;
    float vignetteReach = 0.0f;
    int edgeShadowAlpha = 0;
    int edgeShadowBlur = 0;

    BrandingSpec branding;
    ButtonSpec button;
    int cornerRadius = 0;

    // Titles over either limit are fitted with maxSize * longTitleScale.
    int longTitleWords = 0;
    int longTitleChars = 0;
    float longTitleScale = 1.0f;

    // Title FontSpec after any long-title reduction.
    FontSpec titleFontFor(const std::string& title) const;

    static const StyleConfig& forStyle(PinStyle style);
};
