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

#include "PngEncoder.h"
#include "../PinErrors.h"
#include "../Utility/Log.h"
#if __has_include(<SDL2/SDL_image.h>)
#include <SDL2/SDL_image.h>
#elif __has_include(<SDL2_image/SDL_image.h>)
#include <SDL2_image/SDL_image.h>
#else
#error "Cannot find SDL_image header"
#endif
#include <algorithm>
#include <cstring>
#include <string>

namespace
{
    struct VectorSink {
        std::vector<uint8_t>* out;
        size_t position;
    };

    VectorSink* sinkOf(SDL_RWops* rw)
    {
        return static_cast<VectorSink*>(rw->hidden.unknown.data1);
    }

    Sint64 SDLCALL sinkSize(SDL_RWops* rw)
    {
        return static_cast<Sint64>(sinkOf(rw)->out->size());
    }

    Sint64 SDLCALL sinkSeek(SDL_RWops* rw, Sint64 offset, int whence)
    {
        VectorSink* sink = sinkOf(rw);
        Sint64 base = 0;
        if (whence == RW_SEEK_CUR) base = static_cast<Sint64>(sink->position);
        else if (whence == RW_SEEK_END) base = static_cast<Sint64>(sink->out->size());

        Sint64 target = base + offset;
        if (target < 0) {
            return SDL_SetError("seek before start of PNG buffer");
        }
        sink->position = static_cast<size_t>(target);
        return target;
    }

    size_t SDLCALL sinkRead(SDL_RWops*, void*, size_t, size_t)
    {
        SDL_SetError("PNG buffer is write-only");
        return 0;
    }

    size_t SDLCALL sinkWrite(SDL_RWops* rw, const void* ptr, size_t size, size_t num)
    {
        VectorSink* sink = sinkOf(rw);
        size_t bytes = size * num;
        if (sink->position + bytes > sink->out->size()) {
            sink->out->resize(sink->position + bytes);
        }
        std::memcpy(sink->out->data() + sink->position, ptr, bytes);
        sink->position += bytes;
        return num;
    }

    int SDLCALL sinkClose(SDL_RWops* rw)
    {
        SDL_FreeRW(rw);
        return 0;
    }
}

std::vector<uint8_t> PngEncoder::encode(SDL_Surface* surface)
{
    if (!surface) {
        throw EncodeError("no surface to encode");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<size_t>(surface->w) * surface->h);
    VectorSink sink{ &bytes, 0 };

    SDL_RWops* rw = SDL_AllocRW();
    if (!rw) {
        throw EncodeError("SDL_AllocRW failed: " + std::string(SDL_GetError()));
    }
    rw->type = SDL_RWOPS_UNKNOWN;
    rw->size = sinkSize;
    rw->seek = sinkSeek;
    rw->read = sinkRead;
    rw->write = sinkWrite;
    rw->close = sinkClose;
    rw->hidden.unknown.data1 = &sink;

    int result = IMG_SavePNG_RW(surface, rw, 0);
    SDL_FreeRW(rw);

    if (result != 0) {
        throw EncodeError("IMG_SavePNG_RW failed: " + std::string(IMG_GetError()));
    }
    if (bytes.empty()) {
        throw EncodeError("PNG encoder produced no data");
    }

    LOG_DEBUG("PngEncoder", "Encoded " << surface->w << "x" << surface->h << " into " << bytes.size() << " bytes");
    return bytes;
}
