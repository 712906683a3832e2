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

#include "FontCache.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../PinErrors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <filesystem>

FontCache::Settings FontCache::Settings::LoadFrom(const Configuration& cfg)
{
    Settings out;
    out.fontPath = Utils::combinePath(Configuration::absolutePath, "fonts");

    std::string fontPath;
    if (cfg.getProperty(OPTION_FONTPATH, fontPath)) {
        out.fontPath = Configuration::convertToAbsolutePath(Configuration::absolutePath, fontPath);
    }

    std::string systemPaths;
    if (cfg.getProperty(OPTION_SYSTEMFONTPATHS, systemPaths)) {
        out.systemFontPaths.clear();
        Utils::listToVector(systemPaths, out.systemFontPaths, ',');
    }

    cfg.getProperty(OPTION_DEFAULTFONT, out.defaultFont);
    return out;
}

const std::vector<std::string>& FontCache::commonFallbacks()
{
    static const std::vector<std::string> fallbacks = { "arial.ttf", "Arial.ttf", "DejaVuSans.ttf", "Verdana.ttf" };
    return fallbacks;
}

FontCache::FontCache() = default;

FontCache::FontCache(Settings settings)
    : settings_(std::move(settings))
{
}

FontCache::~FontCache() = default;

void FontCache::buildSystemIndex() const
{
    namespace fs = std::filesystem;

    for (const std::string& root : settings_.systemFontPaths) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            continue;
        }

        std::vector<fs::path> files;
        for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
             !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) {
                files.push_back(it->path());
            }
        }
        std::sort(files.begin(), files.end());

        // the first root and the first path in sorted order win
        for (const fs::path& file : files) {
            systemIndex_.emplace(Utils::toLower(file.filename().string()), file.string());
        }
    }
    LOG_DEBUG("FontCache", "Indexed " << systemIndex_.size() << " system font files");
}

std::string FontCache::locate(const std::string& identifier) const
{
    namespace fs = std::filesystem;
    std::error_code ec;

    if (identifier.empty()) {
        return {};
    }

    if (Utils::isAbsolutePath(identifier)) {
        return fs::is_regular_file(identifier, ec) ? identifier : std::string();
    }

    std::vector<std::string> names = { identifier };
    if (fs::path(identifier).extension().empty()) {
        names = { identifier + ".ttf", identifier + ".otf" };
    }

    if (!settings_.fontPath.empty()) {
        for (const std::string& name : names) {
            std::string candidate = Utils::combinePath(settings_.fontPath, name);
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }

    std::call_once(systemIndexFlag_, [this] { buildSystemIndex(); });
    for (const std::string& name : names) {
        auto it = systemIndex_.find(Utils::toLower(name));
        if (it != systemIndex_.end()) {
            return it->second;
        }
    }
    return {};
}

std::shared_ptr<const FontCache::Entry> FontCache::lookup(const std::string& identifier)
{
    {
        std::shared_lock<std::shared_mutex> lock(entriesMutex_);
        auto it = entries_.find(identifier);
        if (it != entries_.end()) {
            return it->second;
        }
    }

    auto entry = std::make_shared<Entry>();
    entry->path = locate(identifier);
    if (!entry->path.empty()) {
        auto bytes = std::make_shared<std::vector<uint8_t>>();
        if (Utils::readFile(entry->path, *bytes) && !bytes->empty()) {
            entry->bytes = bytes;
            LOG_DEBUG("FontCache", "Loaded " << identifier << " from " << entry->path);
        }
        else {
            LOG_WARNING("FontCache", "Could not read font file " << entry->path);
        }
    }

    // two threads may race to load the same key; the first insertion wins
    // and both callers see that entry
    std::unique_lock<std::shared_mutex> lock(entriesMutex_);
    auto inserted = entries_.emplace(identifier, std::move(entry));
    return inserted.first->second;
}

std::unique_ptr<Font> FontCache::openEntry(const std::string& identifier, int size)
{
    std::shared_ptr<const Entry> entry = lookup(identifier);
    if (!entry->bytes) {
        return nullptr;
    }
    return Font::open(entry->bytes, identifier, size);
}

std::unique_ptr<Font> FontCache::resolve(const std::vector<std::string>& candidates, int size)
{
    for (const std::string& candidate : candidates) {
        if (auto font = openEntry(candidate, size)) {
            return font;
        }
    }

    for (const std::string& fallback : commonFallbacks()) {
        if (auto font = openEntry(fallback, size)) {
            LOG_DEBUG("FontCache", "Using fallback font " << fallback << " at size " << size);
            return font;
        }
    }

    if (auto font = openEntry(settings_.defaultFont, size)) {
        LOG_WARNING("FontCache", "No candidate font found, using default " << settings_.defaultFont);
        return font;
    }

    throw FontLoadError("default font \"" + settings_.defaultFont + "\" could not be loaded");
}

size_t FontCache::cachedEntries() const
{
    std::shared_lock<std::shared_mutex> lock(entriesMutex_);
    return entries_.size();
}
