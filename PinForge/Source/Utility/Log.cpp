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

#include "Log.h"
#include "Utils.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include <ctime>
#include <vector>

std::ofstream Logger::writeFileStream_;
std::streambuf* Logger::cerrStream_ = nullptr;
std::streambuf* Logger::coutStream_ = nullptr;
std::mutex Logger::writeMutex_;
Configuration* Logger::config_ = nullptr;

bool Logger::initialize(const std::string& file, Configuration* config)
{
    config_ = config;

    if (file.empty()) {
        return true;
    }

    // truncate first, then keep appending for the rest of the run
    writeFileStream_.open(file.c_str(), std::ios::out | std::ios::trunc);
    if (!writeFileStream_.is_open()) {
        return false;
    }
    writeFileStream_.close();
    writeFileStream_.open(file.c_str(), std::ios::out | std::ios::app);

    cerrStream_ = std::cerr.rdbuf(writeFileStream_.rdbuf());
    coutStream_ = std::cout.rdbuf(writeFileStream_.rdbuf());

    return writeFileStream_.is_open();
}

void Logger::deInitialize()
{
    std::scoped_lock lock(writeMutex_);

    if (cerrStream_) {
        std::cerr.rdbuf(cerrStream_);
        cerrStream_ = nullptr;
    }
    if (coutStream_) {
        std::cout.rdbuf(coutStream_);
        coutStream_ = nullptr;
    }
    if (writeFileStream_.is_open()) {
        writeFileStream_.close();
    }
    config_ = nullptr;
}

void Logger::write(Zone zone, const std::string& component, const std::string& message)
{
    std::scoped_lock lock(writeMutex_);

    std::time_t rawtime = std::time(nullptr);
    struct tm timeinfo {};
    localtime_r(&rawtime, &timeinfo);

    char timeStr[32];
    std::strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &timeinfo);

    std::ostringstream ss;
    ss << "[" << timeStr << "] [" << zoneToString(zone) << "] [" << component << "] " << message << '\n';
    std::cout << ss.str();
    std::cout.flush();
}

void Logger::LevelFilter::parse(const std::string& level)
{
    std::vector<std::string> tokens;
    Utils::listToVector(level, tokens, ',');

    for (const std::string& token : tokens) {
        if (token == "ALL") {
            allowAll = true;
            continue;
        }
        if (token == "NONE") {
            allowNone = true;
            continue;
        }

        bool isExclusion = (token[0] == '-');
        std::vector<std::string> parts;
        Utils::listToVector(isExclusion ? token.substr(1) : token, parts, ':');
        if (parts.empty()) {
            continue;
        }

        if (parts.size() == 1) {
            if (isExclusion) {
                zones.erase(parts[0]);
            }
            else {
                zones.insert(parts[0]);
            }
            continue;
        }

        // ZONE:Component[:Component...]
        auto& target = isExclusion ? excluded[parts[0]] : components[parts[0]];
        for (size_t i = 1; i < parts.size(); ++i) {
            target.insert(parts[i]);
        }
    }
}

bool Logger::LevelFilter::allows(const std::string& zone, const std::string& component) const
{
    auto excludedIt = excluded.find(zone);
    if (excludedIt != excluded.end() && excludedIt->second.count(component)) {
        return false;
    }
    if (allowAll) {
        return true;
    }
    if (allowNone) {
        return false;
    }
    if (zones.count(zone)) {
        return true;
    }
    auto it = components.find(zone);
    return it != components.end() && it->second.count(component);
}

bool Logger::isLevelEnabled(const std::string& zone, const std::string& component)
{
    static std::once_flag initFlag;
    static LevelFilter filter;

    if (!config_) return false;

    std::call_once(initFlag, []() {
        std::string level = "INFO,NOTICE,WARNING,ERROR";
        Logger::config_->getProperty(OPTION_LOG, level);
        filter.parse(level);
    });

    return filter.allows(zone, component);
}

constexpr std::string_view Logger::zoneToString(Zone zone)
{
    switch (zone) {
    case ZONE_DEBUG: return "DEBUG";
    case ZONE_INFO: return "INFO";
    case ZONE_NOTICE: return "NOTICE";
    case ZONE_WARNING: return "WARNING";
    case ZONE_ERROR: return "ERROR";
    default: return "UNKNOWN";
    }
}
