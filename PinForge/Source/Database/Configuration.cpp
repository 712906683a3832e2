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

#include "Configuration.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

std::string Configuration::absolutePath;

Configuration::Configuration() = default;

Configuration::~Configuration() = default;

void Configuration::initialize()
{
    std::string environment = Utils::getEnvVar("PINFORGE_PATH");

    if (!environment.empty()) {
        absolutePath = environment;
        return;
    }

    std::error_code ec;
    std::filesystem::path exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        absolutePath = exe.parent_path().string();
    }
    else {
        absolutePath = std::filesystem::current_path().string();
    }
}

std::string Configuration::convertToAbsolutePath(const std::string& prefix, const std::string& path)
{
    if (path.empty() || Utils::isAbsolutePath(path)) {
        return path;
    }
    return Utils::combinePath(prefix, path);
}

bool Configuration::import(const std::string& file)
{
    std::ifstream ifs(file.c_str());
    if (!ifs.is_open()) {
        LOG_ERROR("Configuration", "Could not open " << file);
        return false;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    LOG_INFO("Configuration", "Importing \"" << file << "\"");
    return importText(buffer.str(), file);
}

bool Configuration::importText(const std::string& text, const std::string& origin)
{
    bool retVal = true;
    int lineCount = 0;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        ++lineCount;
        retVal = parseLine(line, origin, lineCount) && retVal;
    }
    return retVal;
}

bool Configuration::parseLine(const std::string& line, const std::string& origin, int lineCount)
{
    std::string content = Utils::filterComments(line);
    Utils::trim(content);

    if (content.empty()) {
        return true;
    }

    size_t position = content.find('=');
    if (position == std::string::npos) {
        LOG_WARNING("Configuration", "Missing '=' in " << origin << ":" << lineCount << ": " << content);
        return false;
    }

    std::string key = content.substr(0, position);
    std::string value = content.substr(position + 1);
    Utils::trim(key);
    Utils::trim(value);

    if (key.empty()) {
        LOG_WARNING("Configuration", "Empty key in " << origin << ":" << lineCount);
        return false;
    }

    setProperty(key, value);
    LOG_DEBUG("Configuration", "Setting \"" << key << "\" = \"" << value << "\"");
    return true;
}

void Configuration::setProperty(const std::string& key, const std::string& value)
{
    properties_[key] = value;
}

bool Configuration::propertyExists(const std::string& key) const
{
    return properties_.find(key) != properties_.end();
}

bool Configuration::propertyPrefixExists(const std::string& key) const
{
    auto it = properties_.lower_bound(key + ".");
    return it != properties_.end() && it->first.compare(0, key.size() + 1, key + ".") == 0;
}

bool Configuration::getProperty(const std::string& key, std::string& value) const
{
    auto it = properties_.find(key);
    if (it == properties_.end()) {
        return false;
    }
    value = it->second;
    return true;
}

bool Configuration::getProperty(const std::string& key, int& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }

    try {
        size_t used = 0;
        int parsed = std::stoi(strValue, &used);
        if (used != strValue.size()) {
            LOG_WARNING("Configuration", "\"" << key << "\" is not an integer: " << strValue);
            return false;
        }
        value = parsed;
    }
    catch (const std::exception&) {
        LOG_WARNING("Configuration", "\"" << key << "\" is not an integer: " << strValue);
        return false;
    }
    return true;
}

bool Configuration::getProperty(const std::string& key, bool& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }

    strValue = Utils::toLower(strValue);
    if (strValue == "true" || strValue == "yes" || strValue == "on" || strValue == "1") {
        value = true;
    }
    else if (strValue == "false" || strValue == "no" || strValue == "off" || strValue == "0") {
        value = false;
    }
    else {
        LOG_WARNING("Configuration", "\"" << key << "\" is not a boolean: " << strValue);
        return false;
    }
    return true;
}

bool Configuration::getProperty(const std::string& key, float& value) const
{
    std::string strValue;
    if (!getProperty(key, strValue)) {
        return false;
    }

    try {
        value = std::stof(strValue);
    }
    catch (const std::exception&) {
        LOG_WARNING("Configuration", "\"" << key << "\" is not a number: " << strValue);
        return false;
    }
    return true;
}
