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

#include <string>
#include <string_view>
#include <fstream>
#include <sstream>
#include <streambuf>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

class Configuration;

class Logger
{
public:
    enum Zone
    {
        ZONE_DEBUG,
        ZONE_INFO,
        ZONE_NOTICE,
        ZONE_WARNING,
        ZONE_ERROR
    };

    // An empty file keeps records on stdout; otherwise stdout and stderr
    // are redirected into the (truncated) log file.
    static bool initialize(const std::string& file, Configuration* config);
    static void write(Zone zone, const std::string& component, const std::string& message);
    static bool isLevelEnabled(const std::string& zone, const std::string& component);
    static constexpr std::string_view zoneToString(Zone zone);
    static void deInitialize();

    // Parsed form of the `log` setting: ALL, NONE, zones, ZONE:Comp[:Comp]
    // and -ZONE:Comp exclusions, comma separated.
    struct LevelFilter
    {
        bool allowAll = false;
        bool allowNone = false;
        std::unordered_set<std::string> zones;
        std::unordered_map<std::string, std::unordered_set<std::string>> components;
        std::unordered_map<std::string, std::unordered_set<std::string>> excluded;

        void parse(const std::string& level);
        bool allows(const std::string& zone, const std::string& component) const;
    };

private:
    static std::streambuf* cerrStream_;
    static std::streambuf* coutStream_;
    static std::ofstream writeFileStream_;
    static Configuration* config_;
    static std::mutex writeMutex_;
};

#define LOG_DEBUG(component, message) \
    if (Logger::isLevelEnabled("DEBUG", component)) { \
        std::ostringstream oss; \
        oss << message; \
        Logger::write(Logger::ZONE_DEBUG, component, oss.str()); \
    }

#define LOG_INFO(component, message) \
    if (Logger::isLevelEnabled("INFO", component)) { \
        std::ostringstream oss; \
        oss << message; \
        Logger::write(Logger::ZONE_INFO, component, oss.str()); \
    }

#define LOG_NOTICE(component, message) \
    if (Logger::isLevelEnabled("NOTICE", component)) { \
        std::ostringstream oss; \
        oss << message; \
        Logger::write(Logger::ZONE_NOTICE, component, oss.str()); \
    }

#define LOG_WARNING(component, message) \
    if (Logger::isLevelEnabled("WARNING", component)) { \
        std::ostringstream oss; \
        oss << message; \
        Logger::write(Logger::ZONE_WARNING, component, oss.str()); \
    }

#define LOG_ERROR(component, message) \
    if (Logger::isLevelEnabled("ERROR", component)) { \
        std::ostringstream oss; \
        oss << message; \
        Logger::write(Logger::ZONE_ERROR, component, oss.str()); \
    }
