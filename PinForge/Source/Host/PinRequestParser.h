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

#include "../Compose/PinRequest.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ImageSource {
    enum class Kind { Url, Path };

    Kind kind = Kind::Url;
    std::string location;
};

// A parsed request whose image still has to be acquired.
struct PinJob {
    PinRequest request;
    ImageSource source;
};

class PinRequestParser
{
public:
    // Throws RequestError on malformed input and StyleNotRecognized on an
    // unknown Style value.
    static PinJob parse(const nlohmann::json& body);
    static PinJob parseText(const std::string& text);

    // Top-level array of requests. Entries are left unparsed so one bad
    // entry only fails its own job.
    static std::vector<nlohmann::json> parseManifest(const std::string& text);

private:
    PinRequestParser() = delete;

    static PinStyle parseStyle_(const nlohmann::json& value);
    static std::string optionalString_(const nlohmann::json& body, const char* key);
};
