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

#include "PinRequestParser.h"
#include "HostErrors.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"

std::string PinRequestParser::optionalString_(const nlohmann::json& body, const char* key)
{
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw RequestError(std::string("\"") + key + "\" must be a string");
    }
    return it->get<std::string>();
}

PinStyle PinRequestParser::parseStyle_(const nlohmann::json& value)
{
    if (value.is_null()) {
        return PinStyle::Style1;
    }
    if (value.is_number_integer()) {
        return pinStyleFromNumber(value.get<int>());
    }
    if (value.is_string()) {
        return parsePinStyle(value.get<std::string>());
    }
    throw StyleNotRecognized(value.dump());
}

PinJob PinRequestParser::parse(const nlohmann::json& body)
{
    if (!body.is_object()) {
        throw RequestError("request must be a JSON object");
    }

    PinJob job;

    std::string title = optionalString_(body, "title");
    Utils::trim(title);
    if (title.empty()) {
        throw RequestError("title is required");
    }
    job.request.title = title;

    if (body.contains("BrandingURL")) {
        job.request.branding = optionalString_(body, "BrandingURL");
    }
    else {
        job.request.branding = optionalString_(body, "branding");
    }
    Utils::trim(job.request.branding);

    auto style = body.find("Style");
    job.request.style = style == body.end() ? PinStyle::Style1 : parseStyle_(*style);

    std::string url = optionalString_(body, "image_url");
    std::string path = optionalString_(body, "image_path");
    std::string prompt = optionalString_(body, "image_prompt");
    Utils::trim(url);
    Utils::trim(path);
    Utils::trim(prompt);

    int sources = (url.empty() ? 0 : 1) + (path.empty() ? 0 : 1) + (prompt.empty() ? 0 : 1);
    if (sources == 0) {
        throw RequestError("one of image_url, image_path or image_prompt is required");
    }
    if (sources > 1) {
        throw RequestError("image_url, image_path and image_prompt are mutually exclusive");
    }
    if (!prompt.empty()) {
        throw RequestError("image_prompt is not supported by this build");
    }

    if (!url.empty()) {
        job.source.kind = ImageSource::Kind::Url;
        job.source.location = url;
    }
    else {
        job.source.kind = ImageSource::Kind::Path;
        job.source.location = path;
    }

    LOG_DEBUG("PinRequest", "Parsed " << toString(job.request.style) << " request for \"" << job.request.title << "\"");
    return job;
}

PinJob PinRequestParser::parseText(const std::string& text)
{
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw RequestError(std::string("invalid JSON: ") + e.what());
    }
    return parse(body);
}

std::vector<nlohmann::json> PinRequestParser::parseManifest(const std::string& text)
{
    nlohmann::json manifest;
    try {
        manifest = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        throw RequestError(std::string("invalid manifest JSON: ") + e.what());
    }
    if (!manifest.is_array()) {
        throw RequestError("manifest must be a JSON array of requests");
    }
    return manifest.get<std::vector<nlohmann::json>>();
}
