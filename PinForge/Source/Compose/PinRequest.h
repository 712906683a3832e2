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

#include <cstdint>
#include <string>
#include <vector>

enum class PinStyle
{
    Style1 = 1,
    Style2 = 2,
    Style3 = 3,
    Style4 = 4,
    Style5 = 5
};

// Accepts "style1".."style5" and "1".."5", ignoring case and surrounding
// blanks. Anything else throws StyleNotRecognized.
PinStyle parsePinStyle(const std::string& value);
PinStyle pinStyleFromNumber(int value);
std::string toString(PinStyle style);

struct PinRequest {
    std::string title;
    std::vector<uint8_t> imageBytes;
    std::string branding;
    PinStyle style = PinStyle::Style1;
};

struct RenderResult {
    std::vector<uint8_t> bytes;  // PNG
    int width = 0;
    int height = 0;
};
