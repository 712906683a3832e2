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

#include "StyleConfig.h"
#include "../PinErrors.h"
#include "../Graphics/CanvasNormalizer.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <array>
#include <cmath>

static const Rgba GOLD = { 215, 189, 69, 255 };
static const Rgba WHITE = { 255, 255, 255, 255 };
static const Rgba BLACK = { 0, 0, 0, 255 };

static const std::vector<std::string> MAIN_FONTS = {
    "PoetsenOne-Regular.ttf", "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf", "Lato-Bold.ttf",
    "OpenSans-Bold.ttf", "Poppins-Bold.ttf", "arialbd.ttf", "Arial-Bold.ttf"
};

static TextShadow shadow(int dx, int dy, uint8_t alpha, int blur = 0)
{
    return TextShadow{ dx, dy, Rgba{ 0, 0, 0, alpha }, blur };
}

static ButtonSpec button(int y, Rgba color, Rgba textColor, const std::vector<std::string>& fonts)
{
    ButtonSpec b;
    b.enabled = true;
    b.y = y;
    b.color = color;
    b.textColor = textColor;
    b.font = FontSpec{ fonts, 24, 33 };
    return b;
}

static StyleConfig makeStyle1()
{
    StyleConfig c;
    c.style = PinStyle::Style1;
    c.titleFont = FontSpec{ { "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf" }, 30, 84 };
    c.titleFont.candidates.insert(c.titleFont.candidates.end(), MAIN_FONTS.begin(), MAIN_FONTS.end());
    c.titleBox = { 100, 80, 800, 640 };
    c.titleAlign = VerticalAlign::Top;
    c.titleText = TextStyle{ GOLD, { shadow(3, 3, 150) } };

    c.panelColor = { 0, 0, 0, 180 };
    c.panelRadius = 25;
    c.panelPaddingX = 50;
    c.panelPaddingTop = 35;
    c.panelPaddingBottom = 35;
    c.panelBlur = 6;
    c.panelShadow = shadow(5, 5, 70);

    c.bottomBarHeight = 60;
    c.barColor = { 0, 0, 0, 200 };

    c.branding.font = FontSpec{ { "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf" }, 20, 36 };
    c.branding.text = TextStyle{ GOLD, { shadow(3, 3, 100), shadow(2, 2, 130), shadow(1, 1, 150) } };

    c.button = button(1320, { 200, 200, 200, 240 }, { 80, 80, 80, 255 }, MAIN_FONTS);
    c.cornerRadius = 60;
    return c;
}

static StyleConfig makeStyle2()
{
    StyleConfig c;
    c.style = PinStyle::Style2;
    c.titleFont = FontSpec{ { "EBGaramond-Bold.ttf", "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf" }, 30, 80 };
    c.titleBox = { 80, 80, 840, 700 };
    c.titleAlign = VerticalAlign::Top;
    c.titleText = TextStyle{ GOLD, { shadow(5, 5, 120), shadow(4, 4, 130), shadow(3, 3, 150) }, 1, BLACK };

    c.vignetteInnerAlpha = 40;
    c.vignetteOuterAlpha = 100;
    c.vignetteReach = CanvasNormalizer::CANVAS_HEIGHT * 0.7f;
    c.edgeShadowAlpha = 180;
    c.edgeShadowBlur = 15;

    c.bottomBarHeight = 60;
    c.barColor = { 0, 0, 0, 200 };

    c.branding.font = FontSpec{ { "EBGaramond-Bold.ttf", "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf" }, 20, 38 };
    c.branding.text = TextStyle{ { 255, 240, 180, 255 }, { shadow(3, 3, 100), shadow(2, 2, 130), shadow(1, 1, 150) } };

    c.button = button(1275, { 230, 220, 180, 240 }, { 90, 80, 50, 255 }, c.titleFont.candidates);
    c.cornerRadius = 40;
    return c;
}

static StyleConfig makeStyle3()
{
    StyleConfig c;
    c.style = PinStyle::Style3;
    c.titleFont = FontSpec{ { "Nunito-ExtraBold.ttf", "Montserrat-ExtraBold.ttf", "OpenSans-ExtraBold.ttf",
        "Lato-Bold.ttf", "Poppins-Bold.ttf" }, 30, 80 };
    // the top bar grows with the title, up to topBarMaxHeight
    c.titleBox = { 50, 0, 900, 220 };
    c.titleAlign = VerticalAlign::Center;
    c.titleText = TextStyle{ WHITE, { shadow(2, 2, 100) } };

    c.topBarMinHeight = 170;
    c.topBarMaxHeight = 320;
    c.topBarPadding = 50;
    c.bottomBarHeight = 180;
    c.barColor = { 33, 33, 35, 240 };

    c.branding.font = FontSpec{ c.titleFont.candidates, 30, 60 };
    c.branding.text = TextStyle{ WHITE, { shadow(3, 3, 150) } };

    c.button = button(CanvasNormalizer::CANVAS_HEIGHT - 180 - 70 - 30, { 220, 220, 220, 240 }, { 50, 50, 50, 255 },
        c.titleFont.candidates);
    c.cornerRadius = 60;
    return c;
}

static StyleConfig makeStyle4()
{
    StyleConfig c;
    c.style = PinStyle::Style4;
    c.titleFont = FontSpec{ { "Vidaloka-Regular.ttf", "Times New Roman Bold.ttf", "Georgia Bold.ttf",
        "PlayfairDisplay-Bold.ttf", "Merriweather-Bold.ttf" }, 33, 88 };
    c.titleBox = { 60, CanvasNormalizer::CANVAS_HEIGHT - 450 + 60, 880, 250 };
    c.titleAlign = VerticalAlign::Center;
    c.titleText = TextStyle{ GOLD, { shadow(2, 2, 150) } };

    c.darkRegion = { 0, CanvasNormalizer::CANVAS_HEIGHT - 450, CanvasNormalizer::CANVAS_WIDTH, 450 };
    c.darkRegionColor = { 30, 30, 30, 245 };

    c.branding.font = FontSpec{ c.titleFont.candidates, 24, 40 };
    c.branding.text = TextStyle{ BLACK, {} };
    c.branding.boxed = true;
    c.branding.boxColor = { 230, 190, 60, 255 };
    c.branding.boxRadius = 5;
    c.branding.paddingX = 60;
    c.branding.paddingY = 20;
    c.branding.bottomMargin = 30;

    c.longTitleWords = 8;
    c.longTitleChars = 60;
    c.longTitleScale = 0.8f;
    c.cornerRadius = 30;
    return c;
}

static StyleConfig makeStyle5()
{
    StyleConfig c;
    c.style = PinStyle::Style5;
    c.titleFont = FontSpec{ { "LeagueSpartan-Bold.ttf", "Montserrat-Bold.ttf", "OpenSans-Bold.ttf",
        "Lato-Bold.ttf", "Arial-Bold.ttf", "arialbd.ttf" }, 36, 96 };
    c.titleBox = { 80, 1030, 840, 300 };
    c.titleAlign = VerticalAlign::Center;
    c.titleText = TextStyle{ WHITE, { shadow(3, 3, 130, 2) } };

    // a rounded rect far wider than the canvas reads as a dome
    c.darkRegion = { -250, 950, 1500, 1200 };
    c.darkRegionRadius = 600;
    c.darkRegionColor = { 30, 30, 35, 245 };

    c.branding.font = FontSpec{ c.titleFont.candidates, 24, 40 };
    c.branding.text = TextStyle{ BLACK, {} };
    c.branding.boxed = true;
    c.branding.boxColor = { 255, 255, 255, 245 };
    c.branding.boxRadius = 8;
    c.branding.paddingX = 60;
    c.branding.paddingY = 20;
    c.branding.bottomMargin = 40;
    c.branding.opticalOffsetY = 2;

    c.cornerRadius = 40;
    return c;
}

FontSpec StyleConfig::titleFontFor(const std::string& title) const
{
    FontSpec spec = titleFont;
    if (longTitleWords <= 0 && longTitleChars <= 0) {
        return spec;
    }

    bool manyWords = longTitleWords > 0 && static_cast<int>(Utils::splitWords(title).size()) > longTitleWords;
    bool manyChars = longTitleChars > 0 && static_cast<int>(Utils::decodeUtf8(title).size()) > longTitleChars;
    if (manyWords || manyChars) {
        int reduced = static_cast<int>(std::lround(spec.maxSize * longTitleScale));
        spec.maxSize = std::max(spec.minSize, reduced);
    }
    return spec;
}

const StyleConfig& StyleConfig::forStyle(PinStyle style)
{
    static const std::array<StyleConfig, 5> configs = {
        makeStyle1(), makeStyle2(), makeStyle3(), makeStyle4(), makeStyle5()
    };

    int index = static_cast<int>(style) - 1;
    if (index < 0 || index >= static_cast<int>(configs.size())) {
        throw StyleNotRecognized(std::to_string(static_cast<int>(style)));
    }
    return configs[static_cast<size_t>(index)];
}
