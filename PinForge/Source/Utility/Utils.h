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
#include <string_view>
#include <vector>
#include <list>

class Utils
{
public:
    static std::string toLower(const std::string& str);
    static std::string filterComments(const std::string& line);
    static std::string_view trimEnds(std::string_view view);
    static std::string trim(std::string& str);
    static void listToVector(const std::string& str, std::vector<std::string>& vec, char delimiter);

    // Splits on any ASCII whitespace, dropping empty tokens.
    static std::vector<std::string> splitWords(const std::string& text);
    static std::string joinWords(const std::vector<std::string>& words, size_t first, size_t last);

    // Invalid sequences decode to U+FFFD.
    static std::vector<uint32_t> decodeUtf8(const std::string& text);

    static std::string getEnvVar(const std::string& key);
    static std::string getFileName(const std::string& filePath);
    static bool isAbsolutePath(const std::string& path);
    static bool readFile(const std::string& filePath, std::vector<uint8_t>& buffer);

    template<typename... Paths>
    static std::string combinePath(Paths... paths) {
        std::list<std::string> pathsList = { paths... };
        return combinePathList(pathsList);
    }

private:
    Utils() = delete;

    static std::string combinePathList(const std::list<std::string>& paths);
};
