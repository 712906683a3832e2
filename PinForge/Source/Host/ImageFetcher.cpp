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

#include "ImageFetcher.h"
#include "HostErrors.h"
#include "../Database/Configuration.h"
#include "../Database/GlobalOpts.h"
#include "../Utility/Log.h"
#include "../Utility/Utils.h"
#include <algorithm>
#include <curl/curl.h>
#include <filesystem>
#include <mutex>

ImageFetcher::Settings ImageFetcher::Settings::LoadFrom(const Configuration& cfg)
{
    Settings out;
    cfg.getProperty(OPTION_FETCHTIMEOUT, out.timeoutSeconds);
    cfg.getProperty(OPTION_FETCHMAXBYTES, out.maxBytes);
    cfg.getProperty(OPTION_FETCHUSERAGENT, out.userAgent);
    if (out.timeoutSeconds <= 0) out.timeoutSeconds = 30;
    if (out.maxBytes <= 0) out.maxBytes = 32 * 1024 * 1024;
    out.connectTimeoutSeconds = std::min(out.connectTimeoutSeconds, out.timeoutSeconds);
    return out;
}

ImageFetcher::ImageFetcher()
    : ImageFetcher(Settings())
{
}

ImageFetcher::ImageFetcher(Settings settings)
    : settings_(std::move(settings))
{
    globalInitialize_();
}

void ImageFetcher::globalInitialize_()
{
    // curl_global_init is not thread-safe; run it before any easy handle exists
    static std::once_flag once;
    std::call_once(once, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("ImageFetcher", "curl_global_init failed: " << curl_easy_strerror(rc));
        }
    });
}

size_t ImageFetcher::curlWriteCB_(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* sink = static_cast<Sink*>(userdata);
    size_t n = size * nmemb;
    if (sink->body->size() + n > sink->limit) {
        sink->overflowed = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->body->insert(sink->body->end(), ptr, ptr + n);
    return n;
}

std::vector<uint8_t> ImageFetcher::fetch(const std::string& url) const
{
    if (url.empty()) {
        throw FetchError("empty URL");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw FetchError("curl_easy_init failed");
    }

    std::vector<uint8_t> body;
    Sink sink{ &body, static_cast<size_t>(settings_.maxBytes), false };
    char errbuf[CURL_ERROR_SIZE] = { 0 };

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, settings_.userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCB_);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(settings_.timeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings_.connectTimeoutSeconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    LOG_INFO("ImageFetcher", "Fetching " << url);
    CURLcode rc = curl_easy_perform(curl);
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);

    if (sink.overflowed) {
        throw FetchError(url + ": body exceeds " + std::to_string(settings_.maxBytes) + " bytes");
    }
    if (rc != CURLE_OK) {
        std::string err = errbuf[0] ? errbuf : curl_easy_strerror(rc);
        throw FetchError(url + ": " + err);
    }
    if (code < 200 || code >= 300) {
        throw FetchError(url + ": HTTP " + std::to_string(code));
    }
    if (body.empty()) {
        throw FetchError(url + ": empty response body");
    }

    LOG_DEBUG("ImageFetcher", "Fetched " << body.size() << " bytes from " << url);
    return body;
}

std::vector<uint8_t> ImageFetcher::readFile(const std::string& path) const
{
    if (path.empty()) {
        throw FetchError("empty path");
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw FetchError(path + ": " + ec.message());
    }
    if (size > static_cast<uintmax_t>(settings_.maxBytes)) {
        throw FetchError(path + ": file exceeds " + std::to_string(settings_.maxBytes) + " bytes");
    }

    std::vector<uint8_t> bytes;
    if (!Utils::readFile(path, bytes)) {
        throw FetchError(path + ": could not read file");
    }
    return bytes;
}
