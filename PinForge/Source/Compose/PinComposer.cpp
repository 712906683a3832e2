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

#include "PinComposer.h"
#include "StyleRenderers.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Graphics/CanvasNormalizer.h"
#include "../Graphics/FontCache.h"
#include "../Graphics/ImageEnhance.h"
#include "../Graphics/LayerPrimitives.h"
#include "../Graphics/PngEncoder.h"
#include "../PinErrors.h"
#include "../SDL.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"

PinComposer::Settings PinComposer::Settings::LoadFrom(const Configuration& cfg)
{
    Settings out;
    cfg.getProperty(OPTION_ENHANCEIMAGE, out.enhanceImage);
    return out;
}

PinComposer::PinComposer(FontCache& fonts, Settings settings)
    : fonts_(fonts)
    , settings_(settings)
    , fitter_(fonts)
{
}

TextLayout PinComposer::layoutTitle(const std::string& title, const StyleConfig& config) const
{
    return fitter_.fit(title, config.titleBox.w, config.titleBox.h, config.titleFontFor(title), config.lineSpacing);
}

SurfacePtr PinComposer::composeSurface(const PinRequest& request) const
{
    std::string title = request.title;
    Utils::trim(title);
    if (Utils::splitWords(title).empty()) {
        throw RenderError("title is empty");
    }

    const StyleConfig& config = StyleConfig::forStyle(request.style);

    if (!SDL::initialize()) {
        throw RenderError("SDL initialization failed: " + SDL::lastError());
    }

    SurfacePtr canvas = CanvasNormalizer::normalize(request.imageBytes);
    if (settings_.enhanceImage) {
        ImageEnhance::enhance(canvas.get());
        ImageEnhance::backdrop(canvas.get());
    }

    TextLayout layout = layoutTitle(title, config);
    LOG_INFO("PinComposer", "Rendering " << toString(config.style) << " with " << layout.fontName
        << " at size " << layout.fontSize << ", " << layout.lines.size() << " lines"
        << (layout.truncated ? " (truncated)" : ""));

    StyleInput input{ layout, request.branding, config, fonts_ };
    StyleRenderers::render(canvas.get(), input);

    LayerPrimitives::roundedCornerMask(canvas.get(), config.cornerRadius);
    return canvas;
}

RenderResult PinComposer::render(const PinRequest& request) const
{
    SurfacePtr canvas = composeSurface(request);

    RenderResult result;
    result.bytes = PngEncoder::encode(canvas.get());
    result.width = canvas->w;
    result.height = canvas->h;
    return result;
}
