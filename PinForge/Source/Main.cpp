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

#include "Compose/PinComposer.h"
#include "Database/Configuration.h"
#include "Database/GlobalOpts.h"
#include "Graphics/FontCache.h"
#include "Host/BatchRunner.h"
#include "Host/HostErrors.h"
#include "Host/ImageFetcher.h"
#include "Host/PinRequestParser.h"
#include "SDL.h"
#include "Utility/Log.h"
#include "Utility/ThreadPool.h"
#include "Utility/Utils.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace
{

struct Options {
    std::string configFile;
    std::string logFile;
    std::string requestFile;
    std::string outFile;
    std::string batchFile;
    std::string outDir;
};

void printUsage()
{
    std::fputs(
        "Usage:\n"
        "  pinforge [--config settings.conf] [--log file] --request req.json [--out file.png]\n"
        "  pinforge [--config settings.conf] [--log file] --batch manifest.json [--out-dir dir]\n",
        stderr);
}

bool parseArgs(int argc, char** argv, Options& opts)
{
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::string* target = nullptr;
        if (!std::strcmp(arg, "--config")) target = &opts.configFile;
        else if (!std::strcmp(arg, "--log")) target = &opts.logFile;
        else if (!std::strcmp(arg, "--request")) target = &opts.requestFile;
        else if (!std::strcmp(arg, "--out")) target = &opts.outFile;
        else if (!std::strcmp(arg, "--batch")) target = &opts.batchFile;
        else if (!std::strcmp(arg, "--out-dir")) target = &opts.outDir;
        else {
            std::fprintf(stderr, "Unknown argument: %s\n", arg);
            return false;
        }

        if (i + 1 >= argc) {
            std::fprintf(stderr, "Missing value for %s\n", arg);
            return false;
        }
        *target = argv[++i];
    }

    if (opts.requestFile.empty() == opts.batchFile.empty()) {
        std::fputs("Exactly one of --request or --batch is required\n", stderr);
        return false;
    }
    return true;
}

// Results go to the real stdout; std::cout may be redirected into the log.
void printJson(const nlohmann::json& j)
{
    std::string text = j.dump(2);
    std::fputs(text.c_str(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

int exitCodeFor(const std::vector<BatchRunner::Outcome>& outcomes)
{
    bool anyFailed = false;
    bool serverError = false;
    for (const BatchRunner::Outcome& o : outcomes) {
        if (!o.success) {
            anyFailed = true;
            serverError = serverError || !o.clientError;
        }
    }
    if (!anyFailed) return 0;
    return serverError ? 1 : 2;
}

std::string readText(const std::string& path)
{
    std::vector<uint8_t> bytes;
    if (!Utils::readFile(path, bytes)) {
        throw RequestError("cannot read " + path);
    }
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

int main(int argc, char** argv)
{
    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage();
        return 1;
    }

    Configuration::initialize();
    Configuration config;

    if (!opts.configFile.empty()) {
        if (!config.import(opts.configFile)) {
            printJson({ { "status", "error" }, { "error", "cannot load configuration " + opts.configFile } });
            return 1;
        }
    }
    else {
        std::string defaultConfig = Utils::combinePath(Configuration::absolutePath, "settings.conf");
        if (std::filesystem::exists(defaultConfig)) {
            config.import(defaultConfig);
        }
    }

    std::string logFile = opts.logFile.empty() ? Utils::combinePath(Configuration::absolutePath, "log.txt") : opts.logFile;
    if (!Logger::initialize(logFile, &config)) {
        std::fprintf(stderr, "Cannot open log file %s, logging disabled\n", logFile.c_str());
        Logger::initialize("", nullptr);
    }
    LOG_INFO("Main", "PinForge starting from " << Configuration::absolutePath);

    std::string outputDirectory = Utils::combinePath(Configuration::absolutePath, "static");
    std::string configuredOutput;
    if (config.getProperty(OPTION_OUTPUTDIRECTORY, configuredOutput)) {
        outputDirectory = Configuration::convertToAbsolutePath(Configuration::absolutePath, configuredOutput);
    }
    if (!opts.outDir.empty()) {
        outputDirectory = opts.outDir;
    }

    FontCache fonts(FontCache::Settings::LoadFrom(config));
    PinComposer composer(fonts, PinComposer::Settings::LoadFrom(config));
    ImageFetcher fetcher(ImageFetcher::Settings::LoadFrom(config));
    BatchRunner runner(composer, fetcher, outputDirectory);

    int exitCode = 0;
    try {
        if (!opts.requestFile.empty()) {
            nlohmann::json body;
            try {
                body = nlohmann::json::parse(readText(opts.requestFile));
            }
            catch (const nlohmann::json::parse_error& e) {
                throw RequestError(std::string("invalid JSON: ") + e.what());
            }

            BatchRunner::Outcome outcome = runner.runOne(body, opts.outFile);
            printJson(outcome.toJson());
            exitCode = exitCodeFor({ outcome });
        }
        else {
            std::vector<nlohmann::json> manifest = PinRequestParser::parseManifest(readText(opts.batchFile));

            int poolSize = static_cast<int>(ThreadPool::defaultSize());
            config.getProperty(OPTION_THREADPOOLSIZE, poolSize);
            ThreadPool pool(static_cast<size_t>(std::max(poolSize, 1)));

            std::vector<BatchRunner::Outcome> outcomes = runner.runAll(manifest, pool);
            nlohmann::json results = nlohmann::json::array();
            for (const BatchRunner::Outcome& o : outcomes) {
                results.push_back(o.toJson());
            }
            printJson(results);
            exitCode = exitCodeFor(outcomes);
        }
    }
    catch (const PinError& e) {
        LOG_ERROR("Main", e.what());
        printJson({ { "status", "error" }, { "error", e.what() } });
        exitCode = BatchRunner::isClientError(e) ? 2 : 1;
    }

    LOG_INFO("Main", "Exiting with code " << exitCode);
    SDL::deInitialize();
    Logger::deInitialize();
    return exitCode;
}
