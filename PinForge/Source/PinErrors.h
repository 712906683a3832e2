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

#include <stdexcept>
#include <string>

class PinError : public std::runtime_error
{
public:
    explicit PinError(const std::string& message) : std::runtime_error(message) {}
};

// Source bytes are empty, corrupt, of an unsupported format or too large.
class DecodeError : public PinError
{
public:
    explicit DecodeError(const std::string& message) : PinError("decode: " + message) {}
};

// Not even the built-in default font could be opened.
class FontLoadError : public PinError
{
public:
    explicit FontLoadError(const std::string& message) : PinError("font: " + message) {}
};

class StyleNotRecognized : public PinError
{
public:
    explicit StyleNotRecognized(const std::string& style)
        : PinError("style not recognized: \"" + style + "\""), style_(style) {}

    const std::string& style() const { return style_; }

private:
    std::string style_;
};

class EncodeError : public PinError
{
public:
    explicit EncodeError(const std::string& message) : PinError("encode: " + message) {}
};

// Surface allocation failures and requests the engine cannot render.
class RenderError : public PinError
{
public:
    explicit RenderError(const std::string& message) : PinError("render: " + message) {}
};
