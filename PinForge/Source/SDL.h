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

#include <mutex>
#include <string>

// Process-wide bring-up of SDL, SDL_image and SDL_ttf. No window or
// renderer is ever created; all drawing happens on software surfaces.
class SDL
{
public:
    static bool initialize();
    static bool deInitialize();
    // Reason for the most recent failed initialize; empty after a success.
    static std::string lastError();

private:
    static bool doInitialize();

    static std::mutex mutex_;
    static bool initialized_;
    static std::string lastError_;
};
