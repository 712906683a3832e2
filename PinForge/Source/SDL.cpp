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

#include "SDL.h"
#include "Utility/Log.h"
#include <SDL2/SDL.h>
#if __has_include(<SDL2/SDL_image.h>)
#include <SDL2/SDL_image.h>
#elif __has_include(<SDL2_image/SDL_image.h>)
#include <SDL2_image/SDL_image.h>
#else
#error "Cannot find SDL_image header"
#endif
#if __has_include(<SDL2/SDL_ttf.h>)
#include <SDL2/SDL_ttf.h>
#elif __has_include(<SDL2_ttf/SDL_ttf.h>)
#include <SDL2_ttf/SDL_ttf.h>
#else
#error "Cannot find SDL_ttf header"
#endif

std::mutex SDL::mutex_;
bool SDL::initialized_ = false;
std::string SDL::lastError_;

bool SDL::initialize()
{
    std::scoped_lock lock(mutex_);
    if (initialized_) {
        return true;
    }
    initialized_ = doInitialize();
    if (initialized_) {
        lastError_.clear();
    }
    return initialized_;
}

bool SDL::doInitialize()
{
    LOG_INFO("SDL", "Initializing SDL, SDL_image and SDL_ttf");

    // surfaces and RWops need no subsystem, but SDL_Init(0) sets up the
    // error and hint machinery the image and font libraries rely on
    if (SDL_Init(0) != 0) {
        lastError_ = SDL_GetError();
        LOG_ERROR("SDL", "SDL_Init failed: " << lastError_);
        return false;
    }

    int imgFlags = IMG_INIT_JPG | IMG_INIT_PNG | IMG_INIT_WEBP;
    int imgInitialized = IMG_Init(imgFlags);
    if ((imgInitialized & (IMG_INIT_JPG | IMG_INIT_PNG)) != (IMG_INIT_JPG | IMG_INIT_PNG)) {
        lastError_ = IMG_GetError();
        LOG_ERROR("SDL", "IMG_Init failed: " << lastError_);
        SDL_Quit();
        return false;
    }
    if (!(imgInitialized & IMG_INIT_WEBP)) {
        LOG_WARNING("SDL", "SDL_image was built without WebP support; WebP sources will be decoded with libwebp only");
    }

    if (TTF_Init() != 0) {
        lastError_ = TTF_GetError();
        LOG_ERROR("SDL", "TTF_Init failed: " << lastError_);
        IMG_Quit();
        SDL_Quit();
        return false;
    }

    SDL_version compiled;
    SDL_VERSION(&compiled);
    LOG_INFO("SDL", "SDL " << static_cast<int>(compiled.major) << "." << static_cast<int>(compiled.minor)
        << "." << static_cast<int>(compiled.patch) << " ready");
    return true;
}

bool SDL::deInitialize()
{
    std::scoped_lock lock(mutex_);
    if (!initialized_) {
        return true;
    }

    LOG_INFO("SDL", "DeInitializing");
    TTF_Quit();
    IMG_Quit();
    SDL_Quit();
    initialized_ = false;
    return true;
}

std::string SDL::lastError()
{
    std::scoped_lock lock(mutex_);
    return lastError_;
}
