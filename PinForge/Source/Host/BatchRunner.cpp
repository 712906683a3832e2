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

#include "BatchRunner.h"
#include "HostErrors.h"
#include "ImageFetcher.h"
#include "PinRequestParser.h"
#include "../Compose/PinComposer.h"
#include "../Utility/Log.h"
#include "../Utility/ThreadPool.h"
#include "../Utility/Utils.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iomanip>
#include <random>
#include <sstream>

nlohmann::json BatchRunner::Outcome::toJson() const
{
    if (!success) {
        return nlohmann::json{ { "status", "error" }, { "error", error } };
    }
    return nlohmann::json{
        { "status", "success" },
        { "image_path", imagePath },
        { "width", width },
        { "height", height }
    };
}

BatchRunner::BatchRunner(const PinComposer& composer, const ImageFetcher& fetcher, std::string outputDirectory)
    : composer_(composer)
    , fetcher_(fetcher)
    , outputDirectory_(std::move(outputDirectory))
{
}

std::string BatchRunner::generatedFileName()
{
    thread_local std::mt19937 rng{ std::random_device{}() };
    std::uniform_int_distribution<uint32_t> dist;

    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::ostringstream ss;
    ss << "generated_" << seconds << "_" << std::hex << std::setw(8) << std::setfill('0') << dist(rng) << ".png";
    return ss.str();
}

bool BatchRunner::isClientError(const std::exception& e)
{
    return dynamic_cast<const RequestError*>(&e) != nullptr
        || dynamic_cast<const StyleNotRecognized*>(&e) != nullptr
        || dynamic_cast<const DecodeError*>(&e) != nullptr
        || dynamic_cast<const FetchError*>(&e) != nullptr;
}

void BatchRunner::writeFile_(const std::string& path, const std::vector<uint8_t>& bytes) const
{
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw PinError("write: cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PinError("write: cannot open " + path);
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw PinError("write: short write to " + path);
    }
}

BatchRunner::Outcome BatchRunner::runOne(const nlohmann::json& body, const std::string& outPath) const
{
    Outcome outcome;
    try {
        PinJob job = PinRequestParser::parse(body);
        if (job.source.kind == ImageSource::Kind::Url) {
            job.request.imageBytes = fetcher_.fetch(job.source.location);
        }
        else {
            job.request.imageBytes = fetcher_.readFile(job.source.location);
        }

        RenderResult result = composer_.render(job.request);

        std::string path = outPath.empty() ? Utils::combinePath(outputDirectory_, generatedFileName()) : outPath;
        writeFile_(path, result.bytes);

        outcome.success = true;
        outcome.imagePath = path;
        outcome.width = result.width;
        outcome.height = result.height;
        LOG_INFO("Batch", "Wrote " << path << " (" << result.bytes.size() << " bytes)");
    }
    catch (const std::exception& e) {
        outcome.success = false;
        outcome.clientError = isClientError(e);
        outcome.error = e.what();
        if (outcome.clientError) {
            LOG_WARNING("Batch", "Rejected request: " << outcome.error);
        }
        else {
            LOG_ERROR("Batch", "Render failed: " << outcome.error);
        }
    }
    return outcome;
}

std::vector<BatchRunner::Outcome> BatchRunner::runAll(const std::vector<nlohmann::json>& manifest, ThreadPool& pool) const
{
    LOG_INFO("Batch", "Dispatching " << manifest.size() << " jobs to " << pool.size() << " workers");

    std::vector<std::future<Outcome>> pending;
    pending.reserve(manifest.size());
    for (const nlohmann::json& body : manifest) {
        pending.push_back(pool.enqueue([this, &body] { return runOne(body); }));
    }

    std::vector<Outcome> outcomes;
    outcomes.reserve(pending.size());
    for (std::future<Outcome>& f : pending) {
        outcomes.push_back(f.get());
    }
    return outcomes;
}
