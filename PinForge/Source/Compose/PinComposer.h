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
#include "StyleConfig.h"
#include "../Graphics/Surface.h"
#include "../Graphics/TextFitter.h"

class Configuration;
class FontCache;

// Entry point of the engine: bytes, title, branding and style in, PNG out.
// Holds no per-request state, so one instance may serve many threads.
class PinComposer
{
public:
    struct Settings {
        bool enhanceImage = true;

        // Keys: enhanceImage
        static Settings LoadFrom(const Configuration& cfg);
    };

    explicit PinComposer(FontCache& fonts, Settings settings = Settings());

    RenderResult render(const PinRequest& request) const;

    // Everything but the PNG encoding.
    SurfacePtr composeSurface(const PinRequest& request) const;

    TextLayout layoutTitle(const std::string& title, const StyleConfig& config) const;

private:
    FontCache& fonts_;
    Settings settings_;
    TextFitter fitter_;
};
