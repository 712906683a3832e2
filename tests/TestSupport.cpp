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

#include "TestSupport.h"
#include "Graphics/FontCache.h"
#include "Graphics/PngEncoder.h"
#include "PinErrors.h"
#include "SDL.h"
#include "Utility/Utils.h"
#include <gtest/gtest.h>
#include <SDL2/SDL_image.h>
#include <algorithm>
#include <filesystem>
#include <unistd.h>

namespace TestSupport
{

void initializeSdl()
{
    ASSERT_TRUE(SDL::initialize()) << SDL::lastError();
}

FontCache& fonts()
{
    static FontCache cache;
    return cache;
}

SurfacePtr makePicture(int width, int height)
{
    SurfacePtr s = SurfaceUtil::create(width, height);
    for (int y = 0; y < height; ++y) {
        uint8_t* p = SurfaceUtil::pixel(s.get(), 0, y);
        for (int x = 0; x < width; ++x, p += 4) {
            p[0] = static_cast<uint8_t>(255 * x / std::max(1, width - 1));
            p[1] = static_cast<uint8_t>(255 * y / std::max(1, height - 1));
            p[2] = static_cast<uint8_t>(255 - p[0] / 2);
            p[3] = 255;
        }
    }
    return s;
}

std::vector<uint8_t> encodePng(SDL_Surface* surface)
{
    return PngEncoder::encode(surface);
}

std::vector<uint8_t> encodeJpeg(SDL_Surface* surface)
{
    std::string path = Utils::combinePath(scratchDir(), "source_" + std::to_string(::getpid()) + ".jpg");
    if (IMG_SaveJPG(surface, path.c_str(), 90) != 0) {
        throw EncodeError(std::string("IMG_SaveJPG failed: ") + IMG_GetError());
    }
    std::vector<uint8_t> bytes;
    if (!Utils::readFile(path, bytes)) {
        throw EncodeError("cannot read back " + path);
    }
    std::error_code ec;
    std::filesystem::remove(path, ec);
    return bytes;
}

std::string scratchDir()
{
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "pinforge_tests";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir.string();
}

}
