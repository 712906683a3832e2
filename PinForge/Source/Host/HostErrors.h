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

#include "../PinErrors.h"

// Network, HTTP or file read failure while acquiring a source image.
class FetchError : public PinError
{
public:
    explicit FetchError(const std::string& message) : PinError("fetch: " + message) {}
};

// Request JSON that is malformed or misses a required field.
class RequestError : public PinError
{
public:
    explicit RequestError(const std::string& message) : PinError("request: " + message) {}
};
