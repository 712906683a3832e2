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

#include "CanvasNormalizer.h"
#include "../PinErrors.h"
#include "../Utility/Log.h"

#ifdef __APPLE__
#include <SDL2_image/SDL_image.h>
#include <webp/decode.h>
#include <webp/demux.h>
#else
#include <SDL2/SDL_image.h>
#include <webp/decode.h>
#include <webp/demux.h>
#endif

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

static const double LANCZOS_A = 3.0;
static const double PI = 3.14159265358979323846;

static double sinc(double x)
{
    if (x == 0.0) {
        return 1.0;
    }
    x *= PI;
    return std::sin(x) / x;
}

static double lanczos3(double x)
{
    if (x <= -LANCZOS_A || x >= LANCZOS_A) {
        return 0.0;
    }
    return sinc(x) * sinc(x / LANCZOS_A);
}

namespace
{
    // Source taps and normalized weights for each output sample of one axis.
    struct Contributions {
        std::vector<int> first;
        std::vector<int> count;
        std::vector<double> weights;
        int stride = 0;
    };
}

// Output sample i maps to source coordinate (i + 0.5 + offset) / scale - 0.5.
// Downscaling widens the kernel by 1 / scale so every source pixel is seen.
static Contributions buildContributions(int outSize, int inSize, double scale, double offset)
{
    Contributions c;
    double filterScale = std::max(1.0, 1.0 / scale);
    double support = LANCZOS_A * filterScale;
    c.stride = static_cast<int>(std::ceil(support)) * 2 + 1;
    c.first.resize(outSize);
    c.count.resize(outSize);
    c.weights.assign(static_cast<size_t>(outSize) * c.stride, 0.0);

    for (int i = 0; i < outSize; ++i) {
        double center = (i + 0.5 + offset) / scale - 0.5;
        int lo = static_cast<int>(std::floor(center - support)) + 1;
        int hi = static_cast<int>(std::floor(center + support));
        lo = std::max(lo, 0);
        hi = std::min(hi, inSize - 1);
        if (hi < lo) {
            lo = hi = std::clamp(static_cast<int>(std::lround(center)), 0, inSize - 1);
        }
        int n = std::min(hi - lo + 1, c.stride);

        double* w = &c.weights[static_cast<size_t>(i) * c.stride];
        double sum = 0.0;
        for (int k = 0; k < n; ++k) {
            w[k] = lanczos3((lo + k - center) / filterScale);
            sum += w[k];
        }
        if (sum != 0.0) {
            for (int k = 0; k < n; ++k) {
                w[k] /= sum;
            }
        }
        else {
            w[0] = 1.0;
            n = 1;
        }
        c.first[i] = lo;
        c.count[i] = n;
    }
    return c;
}

bool CanvasNormalizer::isWebP(const std::vector<uint8_t>& bytes)
{
    return bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
        std::memcmp(bytes.data() + 8, "WEBP", 4) == 0;
}

static uint32_t readBigEndian32(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
        (static_cast<uint32_t>(p[2]) << 8) | p[3];
}

static uint16_t readBigEndian16(const uint8_t* p)
{
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static uint16_t readLittleEndian16(const uint8_t* p)
{
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static int32_t readLittleEndian32(const uint8_t* p)
{
    return static_cast<int32_t>(static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
        (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24));
}

bool CanvasNormalizer::headerDimensions(const std::vector<uint8_t>& bytes, int& width, int& height)
{
    const uint8_t* d = bytes.data();
    const size_t n = bytes.size();

    static const uint8_t PNG_SIGNATURE[8] = { 0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n' };
    if (n >= 24 && std::memcmp(d, PNG_SIGNATURE, 8) == 0 && std::memcmp(d + 12, "IHDR", 4) == 0) {
        uint32_t w = readBigEndian32(d + 16);
        uint32_t h = readBigEndian32(d + 20);
        width = static_cast<int>(std::min<uint32_t>(w, INT32_MAX));
        height = static_cast<int>(std::min<uint32_t>(h, INT32_MAX));
        return true;
    }

    if (n >= 10 && (std::memcmp(d, "GIF87a", 6) == 0 || std::memcmp(d, "GIF89a", 6) == 0)) {
        width = readLittleEndian16(d + 6);
        height = readLittleEndian16(d + 8);
        return true;
    }

    if (n >= 26 && d[0] == 'B' && d[1] == 'M') {
        int32_t w = readLittleEndian32(d + 18);
        int32_t h = readLittleEndian32(d + 22);
        // a negative height marks a top-down bitmap
        width = w == INT32_MIN ? INT32_MAX : std::abs(w);
        height = h == INT32_MIN ? INT32_MAX : std::abs(h);
        return true;
    }

    if (n >= 4 && d[0] == 0xFF && d[1] == 0xD8) {
        size_t pos = 2;
        while (pos + 4 <= n) {
            if (d[pos] != 0xFF) {
                return false;
            }
            uint8_t marker = d[pos + 1];
            if (marker == 0xFF) {
                ++pos;
                continue;
            }
            // standalone markers carry no length
            if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
                pos += 2;
                continue;
            }
            if (marker == 0xD9 || marker == 0xDA) {
                return false;
            }
            uint16_t length = readBigEndian16(d + pos + 2);
            bool isFrameHeader = marker >= 0xC0 && marker <= 0xCF &&
                marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
            if (isFrameHeader) {
                if (pos + 9 > n) {
                    return false;
                }
                height = readBigEndian16(d + pos + 5);
                width = readBigEndian16(d + pos + 7);
                return true;
            }
            if (length < 2) {
                return false;
            }
            pos += 2 + static_cast<size_t>(length);
        }
    }
    return false;
}

SurfacePtr CanvasNormalizer::decodeWebP(const std::vector<uint8_t>& bytes)
{
    WebPData webpData = { bytes.data(), bytes.size() };
    WebPDemuxer* demux = WebPDemux(&webpData);
    if (!demux) {
        throw DecodeError("invalid WebP container");
    }

    int canvasWidth = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_CANVAS_WIDTH));
    int canvasHeight = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_CANVAS_HEIGHT));
    int frameCount = static_cast<int>(WebPDemuxGetI(demux, WEBP_FF_FRAME_COUNT));
    if (canvasWidth <= 0 || canvasHeight <= 0 ||
        canvasWidth > MAX_SOURCE_DIMENSION || canvasHeight > MAX_SOURCE_DIMENSION) {
        WebPDemuxDelete(demux);
        throw DecodeError("WebP canvas of " + std::to_string(canvasWidth) + "x" + std::to_string(canvasHeight) +
            " is out of range");
    }
    if (frameCount > 1) {
        LOG_DEBUG("CanvasNormalizer", "Animated WebP with " << frameCount << " frames, using the first");
    }

    WebPIterator iter;
    if (!WebPDemuxGetFrame(demux, 1, &iter)) {
        WebPDemuxDelete(demux);
        throw DecodeError("WebP has no frames");
    }

    SurfacePtr canvas;
    SurfacePtr frame;
    try {
        canvas = SurfaceUtil::create(canvasWidth, canvasHeight);
        frame = SurfaceUtil::create(iter.width, iter.height);
    }
    catch (const PinError&) {
        WebPDemuxReleaseIterator(&iter);
        WebPDemuxDelete(demux);
        throw;
    }

    bool decoded = WebPDecodeRGBAInto(iter.fragment.bytes, iter.fragment.size,
        static_cast<uint8_t*>(frame->pixels), static_cast<size_t>(frame->pitch) * frame->h, frame->pitch) != nullptr;
    SDL_Rect frameRect = { iter.x_offset, iter.y_offset, iter.width, iter.height };

    WebPDemuxReleaseIterator(&iter);
    WebPDemuxDelete(demux);

    if (!decoded) {
        throw DecodeError("WebP frame could not be decoded");
    }

    for (int y = 0; y < frameRect.h && frameRect.y + y < canvasHeight; ++y) {
        int span = std::min(frameRect.w, canvasWidth - frameRect.x);
        if (span <= 0) {
            break;
        }
        std::memcpy(SurfaceUtil::pixel(canvas.get(), frameRect.x, frameRect.y + y),
            SurfaceUtil::pixel(frame.get(), 0, y), static_cast<size_t>(span) * 4);
    }
    return canvas;
}

SurfacePtr CanvasNormalizer::decode(const std::vector<uint8_t>& bytes)
{
    if (bytes.empty()) {
        throw DecodeError("image data is empty");
    }

    if (isWebP(bytes)) {
        return decodeWebP(bytes);
    }

    // reject oversized sources before IMG_Load_RW allocates their pixels
    int headerWidth = 0;
    int headerHeight = 0;
    if (headerDimensions(bytes, headerWidth, headerHeight) &&
        (headerWidth > MAX_SOURCE_DIMENSION || headerHeight > MAX_SOURCE_DIMENSION)) {
        throw DecodeError("image of " + std::to_string(headerWidth) + "x" + std::to_string(headerHeight) +
            " is out of range");
    }

    SDL_RWops* rw = SDL_RWFromConstMem(bytes.data(), static_cast<int>(bytes.size()));
    if (!rw) {
        throw DecodeError("SDL_RWFromConstMem failed: " + std::string(SDL_GetError()));
    }

    // IMG_Load_RW takes ownership of rw; GIF and other animations yield frame one
    SurfacePtr loaded(IMG_Load_RW(rw, 1));
    if (!loaded) {
        throw DecodeError("unsupported or corrupt image: " + std::string(IMG_GetError()));
    }
    if (loaded->w <= 0 || loaded->h <= 0 ||
        loaded->w > MAX_SOURCE_DIMENSION || loaded->h > MAX_SOURCE_DIMENSION) {
        throw DecodeError("image of " + std::to_string(loaded->w) + "x" + std::to_string(loaded->h) +
            " is out of range");
    }

    return SurfaceUtil::toRgba32(loaded.get());
}

void CanvasNormalizer::flattenOverBlack(SDL_Surface* surface)
{
    for (int y = 0; y < surface->h; ++y) {
        uint8_t* row = SurfaceUtil::pixel(surface, 0, y);
        for (int x = 0; x < surface->w; ++x) {
            uint8_t* p = row + x * 4;
            unsigned a = p[3];
            if (a != 255) {
                p[0] = static_cast<uint8_t>((p[0] * a + 127) / 255);
                p[1] = static_cast<uint8_t>((p[1] * a + 127) / 255);
                p[2] = static_cast<uint8_t>((p[2] * a + 127) / 255);
                p[3] = 255;
            }
        }
    }
}

SurfacePtr CanvasNormalizer::coverResize(const SDL_Surface* source, int width, int height)
{
    const int srcW = source->w;
    const int srcH = source->h;
    double scale = std::max(static_cast<double>(width) / srcW, static_cast<double>(height) / srcH);

    // centre crop of the virtually scaled image
    double offsetX = (srcW * scale - width) / 2.0;
    double offsetY = (srcH * scale - height) / 2.0;

    Contributions horizontal = buildContributions(width, srcW, scale, offsetX);
    Contributions vertical = buildContributions(height, srcH, scale, offsetY);

    // only the source rows the vertical pass will read
    int rowFirst = srcH;
    int rowLast = -1;
    for (int y = 0; y < height; ++y) {
        rowFirst = std::min(rowFirst, vertical.first[y]);
        rowLast = std::max(rowLast, vertical.first[y] + vertical.count[y] - 1);
    }
    int rows = rowLast - rowFirst + 1;

    // horizontal pass into an 8-bit RGB intermediate
    std::vector<uint8_t> temp(static_cast<size_t>(width) * rows * 3);
    for (int r = 0; r < rows; ++r) {
        const uint8_t* srcRow = SurfaceUtil::pixel(source, 0, rowFirst + r);
        uint8_t* dstRow = &temp[static_cast<size_t>(r) * width * 3];
        for (int x = 0; x < width; ++x) {
            const double* w = &horizontal.weights[static_cast<size_t>(x) * horizontal.stride];
            const uint8_t* p = srcRow + horizontal.first[x] * 4;
            double acc[3] = { 0.0, 0.0, 0.0 };
            for (int k = 0; k < horizontal.count[x]; ++k, p += 4) {
                acc[0] += p[0] * w[k];
                acc[1] += p[1] * w[k];
                acc[2] += p[2] * w[k];
            }
            dstRow[x * 3 + 0] = SurfaceUtil::clampByte(static_cast<float>(acc[0]));
            dstRow[x * 3 + 1] = SurfaceUtil::clampByte(static_cast<float>(acc[1]));
            dstRow[x * 3 + 2] = SurfaceUtil::clampByte(static_cast<float>(acc[2]));
        }
    }

    SurfacePtr out = SurfaceUtil::create(width, height, rgba(0, 0, 0));
    for (int y = 0; y < height; ++y) {
        const double* w = &vertical.weights[static_cast<size_t>(y) * vertical.stride];
        int first = vertical.first[y] - rowFirst;
        uint8_t* dstRow = SurfaceUtil::pixel(out.get(), 0, y);
        for (int x = 0; x < width; ++x) {
            double acc[3] = { 0.0, 0.0, 0.0 };
            for (int k = 0; k < vertical.count[y]; ++k) {
                const uint8_t* p = &temp[(static_cast<size_t>(first + k) * width + x) * 3];
                acc[0] += p[0] * w[k];
                acc[1] += p[1] * w[k];
                acc[2] += p[2] * w[k];
            }
            dstRow[x * 4 + 0] = SurfaceUtil::clampByte(static_cast<float>(acc[0]));
            dstRow[x * 4 + 1] = SurfaceUtil::clampByte(static_cast<float>(acc[1]));
            dstRow[x * 4 + 2] = SurfaceUtil::clampByte(static_cast<float>(acc[2]));
            dstRow[x * 4 + 3] = 255;
        }
    }
    return out;
}

SurfacePtr CanvasNormalizer::normalize(const std::vector<uint8_t>& bytes)
{
    SurfacePtr decoded = decode(bytes);
    flattenOverBlack(decoded.get());

    LOG_DEBUG("CanvasNormalizer", "Scaling " << decoded->w << "x" << decoded->h << " source to "
        << CANVAS_WIDTH << "x" << CANVAS_HEIGHT);
    return coverResize(decoded.get(), CANVAS_WIDTH, CANVAS_HEIGHT);
}
