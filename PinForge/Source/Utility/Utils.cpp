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

#include "Utils.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

std::string Utils::toLower(const std::string& input)
{
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string Utils::filterComments(const std::string& line)
{
    std::string result = line;

    size_t position = result.find('#');
    if (position != std::string::npos) {
        result.erase(position);
    }
    result.erase(std::remove(result.begin(), result.end(), '\r'), result.end());

    return result;
}

std::string_view Utils::trimEnds(std::string_view view)
{
    size_t trimStart = view.find_first_not_of(" \t");
    if (trimStart == std::string_view::npos) {
        return {};
    }
    size_t trimEnd = view.find_last_not_of(" \t");
    return view.substr(trimStart, trimEnd - trimStart + 1);
}

std::string Utils::trim(std::string& str)
{
    str = std::string(trimEnds(str));
    return str;
}

void Utils::listToVector(const std::string& str, std::vector<std::string>& vec, char delimiter)
{
    std::string_view view(str);
    size_t previous = 0;
    size_t current;

    while ((current = view.find(delimiter, previous)) != std::string_view::npos) {
        auto trimmed = trimEnds(view.substr(previous, current - previous));
        if (!trimmed.empty()) {
            vec.emplace_back(trimmed);
        }
        previous = current + 1;
    }

    auto trimmed = trimEnds(view.substr(previous));
    if (!trimmed.empty()) {
        vec.emplace_back(trimmed);
    }
}

std::vector<std::string> Utils::splitWords(const std::string& text)
{
    std::vector<std::string> words;
    std::string current;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        else {
            current += c;
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::string Utils::joinWords(const std::vector<std::string>& words, size_t first, size_t last)
{
    std::string line;
    for (size_t i = first; i < last && i < words.size(); ++i) {
        if (!line.empty()) {
            line += ' ';
        }
        line += words[i];
    }
    return line;
}

std::vector<uint32_t> Utils::decodeUtf8(const std::string& text)
{
    std::vector<uint32_t> codepoints;
    codepoints.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0;
        size_t extra = 0;

        if (lead < 0x80) {
            cp = lead;
        }
        else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
        }
        else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
        }
        else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
        }
        else {
            codepoints.push_back(0xFFFD);
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            codepoints.push_back(0xFFFD);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            codepoints.push_back(0xFFFD);
            ++i;
            continue;
        }
        codepoints.push_back(cp);
        i += extra + 1;
    }
    return codepoints;
}

std::string Utils::getEnvVar(const std::string& key)
{
    char const* val = std::getenv(key.c_str());
    return val == nullptr ? std::string() : std::string(val);
}

std::string Utils::getFileName(const std::string& filePath)
{
    return std::filesystem::path(filePath).filename().string();
}

bool Utils::isAbsolutePath(const std::string& path)
{
    return !path.empty() && std::filesystem::path(path).is_absolute();
}

bool Utils::readFile(const std::string& filePath, std::vector<uint8_t>& buffer)
{
    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size < 0) {
        return false;
    }
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<size_t>(size));
    if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        buffer.clear();
        return false;
    }
    return true;
}

std::string Utils::combinePathList(const std::list<std::string>& paths)
{
    std::filesystem::path result;
    for (const auto& p : paths) {
        result /= p;
    }
    return result.string();
}
