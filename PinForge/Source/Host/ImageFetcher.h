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
#include <vector>

class Configuration;

// Acquires source image bytes for the host. Every failure is a FetchError.
class ImageFetcher
{
public:
    struct Settings {
        int timeoutSeconds = 30;
        int connectTimeoutSeconds = 6;
        int maxBytes = 32 * 1024 * 1024;
        std::string userAgent = "PinForge/1.0";

        // Keys: fetch.timeoutSeconds, fetch.maxBytes, fetch.userAgent
        static Settings LoadFrom(const Configuration& cfg);
    };

    ImageFetcher();
    explicit ImageFetcher(Settings settings);

    std::vector<uint8_t> fetch(const std::string& url) const;
    std::vector<uint8_t> readFile(const std::string& path) const;

private:
    struct Sink {
        std::vector<uint8_t>* body;
        size_t limit;
        bool overflowed;
    };

    static size_t curlWriteCB_(char* ptr, size_t size, size_t nmemb, void* userdata);
    static void globalInitialize_();

    Settings settings_;
};
