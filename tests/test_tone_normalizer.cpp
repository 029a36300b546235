#include "thermo/render/ToneNormalizer.hpp"

#include "support/TestMacros.hpp"

using namespace thermo;

static core::RgbBuffer solid(int w, int h, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
    core::RgbBuffer rgb(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            rgb.at(x, y, 0) = r;
            rgb.at(x, y, 1) = g;
            rgb.at(x, y, 2) = b;
        }
    }
    return rgb;
}

static void testLumaWeights() {
    auto red = render::toGrayscale(solid(2, 2, 255, 0, 0));
    ASSERT_NEAR(red.at(1, 1), 0.299 * 255.0, 0.01, "red luma");

    auto green = render::toGrayscale(solid(2, 2, 0, 255, 0));
    ASSERT_NEAR(green.at(0, 0), 0.587 * 255.0, 0.01, "green luma");

    auto blue = render::toGrayscale(solid(2, 2, 0, 0, 255));
    ASSERT_NEAR(blue.at(0, 1), 0.114 * 255.0, 0.01, "blue luma");

    auto black = render::toGrayscale(solid(3, 1, 0, 0, 0));
    ASSERT_NEAR(black.at(2, 0), 0.0, 0.0001, "black stays 0");
}

static void testAllWhite() {
    auto gray = render::toGrayscale(solid(100, 50, 255, 255, 255));
    ASSERT_EQ(gray.width(), 100, "width preserved");
    ASSERT_EQ(gray.height(), 50, "height preserved");

    bool allWhite = true;
    for (std::size_t i = 0; i < gray.size(); ++i) {
        if (gray[i] < 254.99f || gray[i] > 255.01f) allWhite = false;
    }
    ASSERT_TRUE(allWhite, "white rgb converts to 255");

    auto adjusted = render::adjustContrastBrightness(gray.clone(), 1.0f, 0.0f);
    bool unchanged = true;
    for (std::size_t i = 0; i < gray.size(); ++i) {
        if (adjusted[i] != gray[i]) unchanged = false;
    }
    ASSERT_TRUE(unchanged, "identity adjustment leaves samples untouched");
}

static void testContrastAndBrightness() {
    core::GrayBuffer gray(4, 1);
    gray[0] = 0.0f;
    gray[1] = 50.0f;
    gray[2] = 100.0f;
    gray[3] = 200.0f;

    auto doubled = render::adjustContrastBrightness(gray.clone(), 2.0f, 0.0f);
    ASSERT_NEAR(doubled[1], 100.0, 0.001, "contrast scales");
    ASSERT_NEAR(doubled[2], 200.0, 0.001, "contrast scales mid");
    ASSERT_NEAR(doubled[3], 255.0, 0.001, "contrast clamps high");

    auto darker = render::adjustContrastBrightness(gray.clone(), 1.0f, -128.0f);
    ASSERT_NEAR(darker[0], 0.0, 0.001, "brightness clamps low");
    ASSERT_NEAR(darker[3], 72.0, 0.001, "brightness shifts");

    // Brightness applies after contrast, clamped once at the end.
    auto both = render::adjustContrastBrightness(gray.clone(), 0.5f, 64.0f);
    ASSERT_NEAR(both[2], 114.0, 0.001, "contrast then brightness");
}

int main() {
    testLumaWeights();
    testAllWhite();
    testContrastAndBrightness();
    return testing::report("ToneNormalizer");
}
