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

#include <map>
#include <string>

class Configuration
{
public:
    Configuration();
    virtual ~Configuration();

    static void initialize();
    static std::string convertToAbsolutePath(const std::string& prefix, const std::string& path);

    bool import(const std::string& file);
    bool importText(const std::string& text, const std::string& origin = "inline");

    void setProperty(const std::string& key, const std::string& value);
    bool propertyExists(const std::string& key) const;
    bool propertyPrefixExists(const std::string& key) const;

    // The out-parameter is left untouched when the key is absent or unparsable.
    bool getProperty(const std::string& key, std::string& value) const;
    bool getProperty(const std::string& key, int& value) const;
    bool getProperty(const std::string& key, bool& value) const;
    bool getProperty(const std::string& key, float& value) const;

    static std::string absolutePath;

private:
    bool parseLine(const std::string& line, const std::string& origin, int lineCount);

    std::map<std::string, std::string> properties_;
};
