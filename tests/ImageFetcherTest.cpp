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
#include "Host/HostErrors.h"
#include "Host/ImageFetcher.h"
#include "Utility/Utils.h"
#include <gtest/gtest.h>
#include <fstream>

namespace
{

std::string writeScratch(const std::string& name, size_t size)
{
    std::string path = Utils::combinePath(TestSupport::scratchDir(), name);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (size_t i = 0; i < size; ++i) {
        out.put(static_cast<char>(i & 0xFF));
    }
    return path;
}

}

TEST(ImageFetcherTest, ReadsLocalFiles) {
    std::string path = writeScratch("fetch_small.bin", 300);
    ImageFetcher fetcher;
    std::vector<uint8_t> bytes = fetcher.readFile(path);
    ASSERT_EQ(bytes.size(), 300u);
    EXPECT_EQ(bytes[0], 0);
    EXPECT_EQ(bytes[299], 299 & 0xFF);
}

TEST(ImageFetcherTest, MissingFileIsAFetchError) {
    ImageFetcher fetcher;
    EXPECT_THROW(fetcher.readFile("/nonexistent/pinforge/source.png"), FetchError);
    EXPECT_THROW(fetcher.readFile(""), FetchError);
}

TEST(ImageFetcherTest, OversizedFileIsRejected) {
    std::string path = writeScratch("fetch_large.bin", 4096);
    ImageFetcher::Settings settings;
    settings.maxBytes = 1024;
    ImageFetcher fetcher(settings);
    EXPECT_THROW(fetcher.readFile(path), FetchError);
}

TEST(ImageFetcherTest, UnusableUrlsAreFetchErrors) {
    ImageFetcher::Settings settings;
    settings.timeoutSeconds = 2;
    settings.connectTimeoutSeconds = 1;
    ImageFetcher fetcher(settings);

    EXPECT_THROW(fetcher.fetch(""), FetchError);
    EXPECT_THROW(fetcher.fetch("notaprotocol://nowhere/image.png"), FetchError);
    EXPECT_THROW(fetcher.fetch("http://127.0.0.1:1/image.png"), FetchError);
}
