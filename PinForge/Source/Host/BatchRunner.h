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

#include <nlohmann/json.hpp>
#include <exception>
#include <string>
#include <vector>

class ImageFetcher;
class PinComposer;
class ThreadPool;

// Runs parsed requests end to end: acquire the image, render, write the PNG.
class BatchRunner
{
public:
    struct Outcome {
        bool success = false;
        bool clientError = false;
        std::string imagePath;
        int width = 0;
        int height = 0;
        std::string error;

        nlohmann::json toJson() const;
    };

    BatchRunner(const PinComposer& composer, const ImageFetcher& fetcher, std::string outputDirectory);

    // Never throws; failures are reported through the Outcome. An empty
    // outPath picks a generated name under the output directory.
    Outcome runOne(const nlohmann::json& body, const std::string& outPath = "") const;

    // One pool task per entry. Outcomes come back in manifest order.
    std::vector<Outcome> runAll(const std::vector<nlohmann::json>& manifest, ThreadPool& pool) const;

    // generated_<unix-time>_<8 hex>.png
    static std::string generatedFileName();
    static bool isClientError(const std::exception& e);

private:
    void writeFile_(const std::string& path, const std::vector<uint8_t>& bytes) const;

    const PinComposer& composer_;
    const ImageFetcher& fetcher_;
    std::string outputDirectory_;
};
