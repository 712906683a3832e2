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

#include "PinRequest.h"
#include "../PinErrors.h"
#include "../Utility/Utils.h"

PinStyle pinStyleFromNumber(int value)
{
    if (value < 1 || value > 5) {
        throw StyleNotRecognized(std::to_string(value));
    }
    return static_cast<PinStyle>(value);
}

PinStyle parsePinStyle(const std::string& value)
{
    std::string normalized = value;
    Utils::trim(normalized);
    normalized = Utils::toLower(normalized);

    std::string digits = normalized;
    if (digits.compare(0, 5, "style") == 0) {
        digits = digits.substr(5);
    }

    if (digits.size() == 1 && digits[0] >= '1' && digits[0] <= '5') {
        return static_cast<PinStyle>(digits[0] - '0');
    }
    throw StyleNotRecognized(value);
}

std::string toString(PinStyle style)
{
    return "style" + std::to_string(static_cast<int>(style));
}
