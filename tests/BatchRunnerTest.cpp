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

#include "TestSupport.h"
#include "Compose/PinComposer.h"
#include "Host/BatchRunner.h"
#include "Host/HostErrors.h"
#include "Host/ImageFetcher.h"
#include "Utility/ThreadPool.h"
#include "Utility/Utils.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <regex>

using nlohmann::json;

namespace
{

class BatchRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestSupport::initializeSdl();
        outDir_ = Utils::combinePath(TestSupport::scratchDir(), "out");
        sourcePath_ = Utils::combinePath(TestSupport::scratchDir(), "batch_source.png");

        SurfacePtr picture = TestSupport::makePicture(320, 480);
        std::vector<uint8_t> png = TestSupport::encodePng(picture.get());
        std::ofstream out(sourcePath_, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(png.data()), static_cast<std::streamsize>(png.size()));
    }

    json requestFor(const std::string& title, int style) const {
        return json{ { "title", title }, { "BrandingURL", "batch.example" }, { "Style", style }, { "image_path", sourcePath_ } };
    }

    PinComposer composer_{ TestSupport::fonts() };
    ImageFetcher fetcher_;
    std::string outDir_;
    std::string sourcePath_;
};

}

TEST_F(BatchRunnerTest, RunOneWritesThePng) {
    BatchRunner runner(composer_, fetcher_, outDir_);
    std::string target = Utils::combinePath(outDir_, "explicit.png");
    BatchRunner::Outcome outcome = runner.runOne(requestFor("Explicit Output Path", 2), target);

    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.imagePath, target);
    EXPECT_EQ(outcome.width, 1000);
    EXPECT_EQ(outcome.height, 1500);
    EXPECT_TRUE(std::filesystem::exists(target));
    EXPECT_GT(std::filesystem::file_size(target), 0u);

    json j = outcome.toJson();
    EXPECT_EQ(j["status"], "success");
    EXPECT_EQ(j["image_path"], target);
    EXPECT_EQ(j["width"], 1000);
    EXPECT_EQ(j["height"], 1500);
}

TEST_F(BatchRunnerTest, GeneratedNamesLandInOutputDirectory) {
    BatchRunner runner(composer_, fetcher_, outDir_);
    BatchRunner::Outcome outcome = runner.runOne(requestFor("Generated Name", 1));
    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(std::filesystem::path(outcome.imagePath).parent_path(), std::filesystem::path(outDir_));
    EXPECT_TRUE(std::filesystem::exists(outcome.imagePath));

    std::regex pattern("generated_[0-9]+_[0-9a-f]{8}\\.png");
    EXPECT_TRUE(std::regex_match(Utils::getFileName(outcome.imagePath), pattern)) << outcome.imagePath;
    EXPECT_TRUE(std::regex_match(BatchRunner::generatedFileName(), pattern));
}

TEST_F(BatchRunnerTest, FailuresAreClassified) {
    BatchRunner runner(composer_, fetcher_, outDir_);

    BatchRunner::Outcome missingTitle = runner.runOne(json{ { "image_path", sourcePath_ } });
    EXPECT_FALSE(missingTitle.success);
    EXPECT_TRUE(missingTitle.clientError);

    BatchRunner::Outcome missingFile = runner.runOne(json{ { "title", "t" }, { "image_path", "/nonexistent/x.png" } });
    EXPECT_FALSE(missingFile.success);
    EXPECT_TRUE(missingFile.clientError);

    json badStyle = requestFor("t", 1);
    badStyle["Style"] = "style8";
    BatchRunner::Outcome style = runner.runOne(badStyle);
    EXPECT_FALSE(style.success);
    EXPECT_TRUE(style.clientError);

    json j = style.toJson();
    EXPECT_EQ(j["status"], "error");
    EXPECT_FALSE(j["error"].get<std::string>().empty());

    EXPECT_FALSE(BatchRunner::isClientError(EncodeError("x")));
    EXPECT_FALSE(BatchRunner::isClientError(RenderError("x")));
    EXPECT_TRUE(BatchRunner::isClientError(DecodeError("x")));
    EXPECT_TRUE(BatchRunner::isClientError(FetchError("x")));
}

TEST_F(BatchRunnerTest, RunAllKeepsManifestOrder) {
    BatchRunner runner(composer_, fetcher_, outDir_);
    std::vector<json> manifest = {
        requestFor("First Pin", 1),
        json{ { "title", "" }, { "image_path", sourcePath_ } },
        requestFor("Third Pin", 4),
        json(3),
        requestFor("Fifth Pin", 5)
    };

    ThreadPool pool(3);
    std::vector<BatchRunner::Outcome> outcomes = runner.runAll(manifest, pool);
    ASSERT_EQ(outcomes.size(), manifest.size());
    EXPECT_TRUE(outcomes[0].success) << outcomes[0].error;
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_TRUE(outcomes[2].success) << outcomes[2].error;
    EXPECT_FALSE(outcomes[3].success);
    EXPECT_TRUE(outcomes[4].success) << outcomes[4].error;

    EXPECT_NE(outcomes[0].imagePath, outcomes[2].imagePath);
    EXPECT_NE(outcomes[2].imagePath, outcomes[4].imagePath);
}
