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
#include "Host/ImageFetcher.h"
#include <gtest/gtest.h>

TEST(ConfigurationTest, ParsesKeyValueLines) {
    Configuration config;
    EXPECT_TRUE(config.importText(
        "# fonts\n"
        "fontPath = /opt/fonts\n"
        "\n"
        "  enhanceImage=false   # trailing comment\n"
        "fetch.timeoutSeconds = 12\r\n"));

    std::string fontPath;
    EXPECT_TRUE(config.getProperty(OPTION_FONTPATH, fontPath));
    EXPECT_EQ(fontPath, "/opt/fonts");

    bool enhance = true;
    EXPECT_TRUE(config.getProperty(OPTION_ENHANCEIMAGE, enhance));
    EXPECT_FALSE(enhance);

    int timeout = 0;
    EXPECT_TRUE(config.getProperty(OPTION_FETCHTIMEOUT, timeout));
    EXPECT_EQ(timeout, 12);
}

TEST(ConfigurationTest, MalformedLineIsReportedButOthersLoad) {
    Configuration config;
    EXPECT_FALSE(config.importText("no equals sign here\nlog = ERROR\n"));
    EXPECT_TRUE(config.propertyExists(OPTION_LOG));
}

TEST(ConfigurationTest, MissingKeyLeavesValueUntouched) {
    Configuration config;
    int size = 7;
    EXPECT_FALSE(config.getProperty(OPTION_THREADPOOLSIZE, size));
    EXPECT_EQ(size, 7);

    std::string dir = "unchanged";
    EXPECT_FALSE(config.getProperty(OPTION_OUTPUTDIRECTORY, dir));
    EXPECT_EQ(dir, "unchanged");
}

TEST(ConfigurationTest, StrictNumberAndBooleanParsing) {
    Configuration config;
    config.setProperty("a", "12abc");
    config.setProperty("b", "maybe");
    config.setProperty("c", "Yes");
    config.setProperty("d", "0.75");

    int a = 3;
    EXPECT_FALSE(config.getProperty("a", a));
    EXPECT_EQ(a, 3);

    bool b = true;
    EXPECT_FALSE(config.getProperty("b", b));
    EXPECT_TRUE(b);

    bool c = false;
    EXPECT_TRUE(config.getProperty("c", c));
    EXPECT_TRUE(c);

    float d = 0.0f;
    EXPECT_TRUE(config.getProperty("d", d));
    EXPECT_FLOAT_EQ(d, 0.75f);
}

TEST(ConfigurationTest, PrefixLookup) {
    Configuration config;
    config.setProperty("fetch.userAgent", "x");
    EXPECT_TRUE(config.propertyPrefixExists("fetch"));
    EXPECT_FALSE(config.propertyPrefixExists("fetc"));
}

TEST(ConfigurationTest, RelativePathsResolveAgainstPrefix) {
    EXPECT_EQ(Configuration::convertToAbsolutePath("/srv/pinforge", "fonts"), "/srv/pinforge/fonts");
    EXPECT_EQ(Configuration::convertToAbsolutePath("/srv/pinforge", "/usr/share/fonts"), "/usr/share/fonts");
}

TEST(SettingsTest, ConsumersReadTheirKeys) {
    Configuration config;
    config.importText(
        "enhanceImage = off\n"
        "systemFontPaths = /a, /b ,\n"
        "defaultFont = /fonts/Default.ttf\n"
        "fetch.maxBytes = 1024\n"
        "fetch.userAgent = Tester/2\n");

    EXPECT_FALSE(PinComposer::Settings::LoadFrom(config).enhanceImage);

    FontCache::Settings fonts = FontCache::Settings::LoadFrom(config);
    ASSERT_EQ(fonts.systemFontPaths.size(), 2u);
    EXPECT_EQ(fonts.systemFontPaths[0], "/a");
    EXPECT_EQ(fonts.systemFontPaths[1], "/b");
    EXPECT_EQ(fonts.defaultFont, "/fonts/Default.ttf");

    ImageFetcher::Settings fetch = ImageFetcher::Settings::LoadFrom(config);
    EXPECT_EQ(fetch.maxBytes, 1024);
    EXPECT_EQ(fetch.userAgent, "Tester/2");
    EXPECT_EQ(fetch.timeoutSeconds, 30);
}

TEST(SettingsTest, DefaultsWithoutConfiguration) {
    Configuration config;
    EXPECT_TRUE(PinComposer::Settings::LoadFrom(config).enhanceImage);
    EXPECT_EQ(FontCache::Settings::LoadFrom(config).defaultFont, PINFORGE_DEFAULT_FONT);
}
