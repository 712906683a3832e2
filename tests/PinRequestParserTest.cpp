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

#include "Host/HostErrors.h"
#include "Host/PinRequestParser.h"
#include <gtest/gtest.h>

using nlohmann::json;

TEST(PinRequestParserTest, AcceptsServiceFieldNames) {
    PinJob job = PinRequestParser::parse(json{
        { "title", "  Fall Wreath DIY  " },
        { "BrandingURL", "crafts.example" },
        { "Style", "style3" },
        { "image_url", "https://img.example/wreath.jpg" }
    });

    EXPECT_EQ(job.request.title, "Fall Wreath DIY");
    EXPECT_EQ(job.request.branding, "crafts.example");
    EXPECT_EQ(job.request.style, PinStyle::Style3);
    EXPECT_EQ(job.source.kind, ImageSource::Kind::Url);
    EXPECT_EQ(job.source.location, "https://img.example/wreath.jpg");
    EXPECT_TRUE(job.request.imageBytes.empty());
}

TEST(PinRequestParserTest, DefaultsAndAliases) {
    PinJob job = PinRequestParser::parse(json{
        { "title", "Pantry Labels" },
        { "branding", "organize.example" },
        { "image_path", "/tmp/pantry.png" }
    });
    EXPECT_EQ(job.request.style, PinStyle::Style1);
    EXPECT_EQ(job.request.branding, "organize.example");
    EXPECT_EQ(job.source.kind, ImageSource::Kind::Path);
    EXPECT_EQ(job.source.location, "/tmp/pantry.png");
}

TEST(PinRequestParserTest, StyleAsIntegerOrDigitString) {
    json body = { { "title", "t" }, { "image_path", "a.png" } };

    body["Style"] = 4;
    EXPECT_EQ(PinRequestParser::parse(body).request.style, PinStyle::Style4);

    body["Style"] = "5";
    EXPECT_EQ(PinRequestParser::parse(body).request.style, PinStyle::Style5);

    body["Style"] = nullptr;
    EXPECT_EQ(PinRequestParser::parse(body).request.style, PinStyle::Style1);
}

TEST(PinRequestParserTest, UnknownStyleIsNotARequestError) {
    json body = { { "title", "t" }, { "image_path", "a.png" }, { "Style", "style9" } };
    EXPECT_THROW(PinRequestParser::parse(body), StyleNotRecognized);

    body["Style"] = 0;
    EXPECT_THROW(PinRequestParser::parse(body), StyleNotRecognized);

    body["Style"] = json::array({ 1 });
    EXPECT_THROW(PinRequestParser::parse(body), StyleNotRecognized);
}

TEST(PinRequestParserTest, TitleIsRequired) {
    EXPECT_THROW(PinRequestParser::parse(json{ { "image_path", "a.png" } }), RequestError);
    EXPECT_THROW(PinRequestParser::parse(json{ { "title", "   " }, { "image_path", "a.png" } }), RequestError);
    EXPECT_THROW(PinRequestParser::parse(json{ { "title", 42 }, { "image_path", "a.png" } }), RequestError);
}

TEST(PinRequestParserTest, ExactlyOneImageSource) {
    EXPECT_THROW(PinRequestParser::parse(json{ { "title", "t" } }), RequestError);
    EXPECT_THROW(PinRequestParser::parse(json{
        { "title", "t" }, { "image_path", "a.png" }, { "image_url", "https://x/y.png" } }), RequestError);
}

TEST(PinRequestParserTest, PromptGenerationIsUnavailable) {
    EXPECT_THROW(PinRequestParser::parse(json{ { "title", "t" }, { "image_prompt", "a sunny porch" } }), RequestError);
}

TEST(PinRequestParserTest, MalformedText) {
    EXPECT_THROW(PinRequestParser::parseText("{ not json"), RequestError);
    EXPECT_THROW(PinRequestParser::parseText("[1, 2]"), RequestError);
    EXPECT_NO_THROW(PinRequestParser::parseText(R"({"title":"t","image_path":"p.png"})"));
}

TEST(PinRequestParserTest, ManifestMustBeAnArray) {
    std::vector<json> entries = PinRequestParser::parseManifest(R"([{"title":"a"}, 3, {"title":"b"}])");
    EXPECT_EQ(entries.size(), 3u);
    EXPECT_THROW(PinRequestParser::parseManifest(R"({"title":"a"})"), RequestError);
    EXPECT_THROW(PinRequestParser::parseManifest("["), RequestError);
}
