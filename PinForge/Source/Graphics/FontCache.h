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

#include "Font.h"
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef PINFORGE_DEFAULT_FONT
#define PINFORGE_DEFAULT_FONT "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
#endif

class Configuration;

// Resolves font identifiers (file names or absolute paths) to opened
// faces. File bytes are read once per identifier and shared read-only by
// every Font handed out; misses are remembered too.
class FontCache
{
public:
    struct Settings {
        std::string fontPath;
        std::vector<std::string> systemFontPaths = { "/usr/share/fonts", "/usr/local/share/fonts" };
        std::string defaultFont = PINFORGE_DEFAULT_FONT;

        // Keys: fontPath, systemFontPaths (comma list), defaultFont
        static Settings LoadFrom(const Configuration& cfg);
    };

    // Tried after the caller's candidates, before the default font.
    static const std::vector<std::string>& commonFallbacks();

    FontCache();
    explicit FontCache(Settings settings);
    virtual ~FontCache();

    FontCache(const FontCache&) = delete;
    FontCache& operator=(const FontCache&) = delete;

    // First loadable candidate at the given pixel size, then the common
    // fallbacks, then the default font. Throws FontLoadError when even the
    // default cannot be opened.
    std::unique_ptr<Font> resolve(const std::vector<std::string>& candidates, int size);

    // Absolute path for an identifier, or an empty string.
    std::string locate(const std::string& identifier) const;

    const Settings& settings() const { return settings_; }
    size_t cachedEntries() const;

private:
    struct Entry {
        std::string path;
        FontBytes bytes;  // null for a miss
    };

    std::shared_ptr<const Entry> lookup(const std::string& identifier);
    std::unique_ptr<Font> openEntry(const std::string& identifier, int size);
    void buildSystemIndex() const;

    Settings settings_;

    mutable std::shared_mutex entriesMutex_;
    std::unordered_map<std::string, std::shared_ptr<const Entry>> entries_;

    mutable std::once_flag systemIndexFlag_;
    mutable std::map<std::string, std::string> systemIndex_;  // lower-case file name -> path
};
