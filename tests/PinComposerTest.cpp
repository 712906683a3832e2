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
#include "Graphics/FontCache.h"
#include "PinErrors.h"
#include "SDL.h"
#include "Utility/ThreadPool.h"
#include <gtest/gtest.h>
#include <SDL2/SDL_image.h>
#include <cstring>
#include <future>

namespace
{

class PinComposerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestSupport::initializeSdl();
        if (sourcePng_.empty()) {
            SurfacePtr picture = TestSupport::makePicture(400, 300);
            sourcePng_ = TestSupport::encodePng(picture.get());
        }
    }

    PinRequest request(PinStyle style, const std::string& title, const std::string& branding) const {
        PinRequest r;
        r.title = title;
        r.branding = branding;
        r.style = style;
        r.imageBytes = sourcePng_;
        return r;
    }

    static void expectPinShape(const SDL_Surface* pin) {
        ASSERT_NE(pin, nullptr);
        ASSERT_EQ(pin->w, 1000);
        ASSERT_EQ(pin->h, 1500);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 0, 0).a, 0);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 999, 0).a, 0);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 0, 1499).a, 0);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 999, 1499).a, 0);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 500, 750).a, 255);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 500, 0).a, 255);
        EXPECT_EQ(SurfaceUtil::getPixel(pin, 0, 750).a, 255);
    }

    static bool samePixels(const SDL_Surface* a, const SDL_Surface* b) {
        if (a->w != b->w || a->h != b->h) {
            return false;
        }
        for (int y = 0; y < a->h; ++y) {
            if (std::memcmp(SurfaceUtil::pixel(a, 0, y), SurfaceUtil::pixel(b, 0, y), static_cast<size_t>(a->w) * 4) != 0) {
                return false;
            }
        }
        return true;
    }

    PinComposer composer_{ TestSupport::fonts() };
    static std::vector<uint8_t> sourcePng_;
};

std::vector<uint8_t> PinComposerTest::sourcePng_;

class PinComposerStyleTest : public PinComposerTest, public ::testing::WithParamInterface<int> {
};

}

TEST_P(PinComposerStyleTest, RendersEveryStyleAtPinSize) {
    PinStyle style = pinStyleFromNumber(GetParam());
    SurfacePtr pin = composer_.composeSurface(request(style, "10 Cozy Fall Porch Ideas You Will Love", "cozyhome.example"));
    expectPinShape(pin.get());
}

TEST_P(PinComposerStyleTest, EmptyBrandingStillRenders) {
    PinStyle style = pinStyleFromNumber(GetParam());
    SurfacePtr pin = composer_.composeSurface(request(style, "Minimal Desk Setup", ""));
    expectPinShape(pin.get());
}

TEST_P(PinComposerStyleTest, EncodedResultIsAPng) {
    PinStyle style = pinStyleFromNumber(GetParam());
    RenderResult result = composer_.render(request(style, "Weekend Sourdough Schedule", "bakery.example"));
    EXPECT_EQ(result.width, 1000);
    EXPECT_EQ(result.height, 1500);
    ASSERT_GT(result.bytes.size(), 8u);
    EXPECT_EQ(result.bytes[0], 0x89);
    EXPECT_EQ(result.bytes[1], 'P');
    EXPECT_EQ(result.bytes[2], 'N');
    EXPECT_EQ(result.bytes[3], 'G');

    SDL_RWops* rw = SDL_RWFromConstMem(result.bytes.data(), static_cast<int>(result.bytes.size()));
    ASSERT_NE(rw, nullptr);
    SurfacePtr decoded(IMG_Load_RW(rw, 1));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->w, 1000);
    EXPECT_EQ(decoded->h, 1500);
}

INSTANTIATE_TEST_SUITE_P(AllStyles, PinComposerStyleTest, ::testing::Values(1, 2, 3, 4, 5));

TEST_F(PinComposerTest, SameRequestSameBytes) {
    PinRequest r = request(PinStyle::Style2, "Garden Planning Checklist For Spring", "greenthumb.example");
    RenderResult first = composer_.render(r);
    RenderResult second = composer_.render(r);
    EXPECT_EQ(first.bytes, second.bytes);
}

TEST_F(PinComposerTest, ConcurrentRendersMatchSequentialOutput) {
    PinRequest r = request(PinStyle::Style5, "Budget Friendly Bathroom Refresh", "homeedit.example");
    RenderResult expected = composer_.render(r);

    ThreadPool pool(4);
    std::vector<std::future<RenderResult>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.enqueue([this, &r] { return composer_.render(r); }));
    }
    for (std::future<RenderResult>& f : futures) {
        RenderResult got = f.get();
        EXPECT_EQ(got.bytes, expected.bytes);
    }
}

TEST_F(PinComposerTest, MixedStylesInParallel) {
    ThreadPool pool(3);
    std::vector<std::future<SurfacePtr>> futures;
    for (int n = 1; n <= 5; ++n) {
        PinRequest r = request(pinStyleFromNumber(n), "Parallel Title Number " + std::to_string(n), "brand.example");
        futures.push_back(pool.enqueue([this, r] { return composer_.composeSurface(r); }));
    }
    for (std::future<SurfacePtr>& f : futures) {
        SurfacePtr pin = f.get();
        expectPinShape(pin.get());
    }
}

TEST_F(PinComposerTest, HugeSingleWordInStyle3) {
    SurfacePtr pin = composer_.composeSurface(request(PinStyle::Style3, std::string(250, 'A'), "wide.example"));
    expectPinShape(pin.get());
}

TEST_F(PinComposerTest, VeryLongTitleIsTruncatedNotRejected) {
    std::string title;
    for (int i = 0; i < 60; ++i) {
        title += "endless ";
    }
    const StyleConfig& cfg = StyleConfig::forStyle(PinStyle::Style4);
    TextLayout layout = composer_.layoutTitle(title, cfg);
    EXPECT_EQ(layout.fontSize, cfg.titleFont.minSize);
    EXPECT_TRUE(layout.truncated);
    EXPECT_LE(layout.height, cfg.titleBox.h);

    SurfacePtr pin = composer_.composeSurface(request(PinStyle::Style4, title, "long.example"));
    expectPinShape(pin.get());
}

TEST_F(PinComposerTest, LongTitleUsesReducedCeilingInStyle4) {
    const StyleConfig& cfg = StyleConfig::forStyle(PinStyle::Style4);
    TextLayout layout = composer_.layoutTitle("a b c d e f g h i", cfg);
    EXPECT_LE(layout.fontSize, 70);
}

TEST_F(PinComposerTest, EnhancementCanBeDisabled) {
    PinComposer::Settings plain;
    plain.enhanceImage = false;
    PinComposer raw(TestSupport::fonts(), plain);

    PinRequest r = request(PinStyle::Style1, "Same Title", "");
    SurfacePtr enhanced = composer_.composeSurface(r);
    SurfacePtr untouched = raw.composeSurface(r);
    expectPinShape(untouched.get());
    EXPECT_FALSE(samePixels(enhanced.get(), untouched.get()));
}

TEST_F(PinComposerTest, RejectsBlankTitle) {
    EXPECT_THROW(composer_.render(request(PinStyle::Style1, "   \t ", "brand")), RenderError);
}

TEST_F(PinComposerTest, RejectsUndecodableImage) {
    PinRequest r = request(PinStyle::Style1, "Title", "brand");
    r.imageBytes = { 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };
    EXPECT_THROW(composer_.render(r), DecodeError);
}

TEST_F(PinComposerTest, RejectsUnknownStyleValue) {
    PinRequest r = request(PinStyle::Style1, "Title", "brand");
    r.style = static_cast<PinStyle>(9);
    EXPECT_THROW(composer_.render(r), StyleNotRecognized);
}

TEST_F(PinComposerTest, FontFilesAreLoadedOnce) {
    composer_.composeSurface(request(PinStyle::Style1, "Warm Up", "brand"));
    size_t entries = TestSupport::fonts().cachedEntries();
    composer_.composeSurface(request(PinStyle::Style1, "Warm Up Again", "brand"));
    EXPECT_EQ(TestSupport::fonts().cachedEntries(), entries);
}

TEST_F(PinComposerTest, SdlReportsNoErrorOnceInitialized) {
    ASSERT_TRUE(SDL::initialize());
    EXPECT_TRUE(SDL::initialize());
    EXPECT_TRUE(SDL::lastError().empty());
}
