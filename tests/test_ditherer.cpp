#include "thermo/render/Ditherer.hpp"
#include "thermo/render/ToneNormalizer.hpp"

#include "support/TestMacros.hpp"

#include <array>
#include <initializer_list>
#include <string>

using namespace thermo;

static const std::array<core::DitherMode, 4> ALL_MODES = {
    core::DitherMode::Threshold,
    core::DitherMode::FloydSteinberg,
    core::DitherMode::Atkinson,
    core::DitherMode::OrderedBayer
};

static core::GrayBuffer flat(int w, int h, float level) {
    return core::GrayBuffer(w, h, level);
}

static core::GrayBuffer checkerboard(int w, int h) {
    core::GrayBuffer gray(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            gray.at(x, y) = ((x + y) % 2 == 0) ? 0.0f : 255.0f;
        }
    }
    return gray;
}

static double mean(const core::BinaryBuffer& bin) {
    double sum = 0.0;
    for (std::size_t i = 0; i < bin.size(); ++i) sum += bin[i];
    return bin.size() ? sum / static_cast<double>(bin.size()) : 0.0;
}

static core::GrayBuffer grid(int w, int h, std::initializer_list<float> samples) {
    core::GrayBuffer gray(w, h);
    std::size_t i = 0;
    for (float v : samples) gray[i++] = v;
    return gray;
}

// Compares row by row against 0/255 values and names the first mismatch.
static void expectGrid(const core::BinaryBuffer& out, std::initializer_list<int> expected,
                       const std::string& label) {
    ASSERT_EQ(out.size(), expected.size(), label + " size");
    std::size_t i = 0;
    for (int v : expected) {
        if (i >= out.size()) break;
        if (static_cast<int>(out[i]) != v) {
            const int x = static_cast<int>(i) % out.width();
            const int y = static_cast<int>(i) / out.width();
            ASSERT_EQ(static_cast<int>(out[i]), v,
                      label + " at (" + std::to_string(x) + "," + std::to_string(y) + ")");
            return;
        }
        ++i;
    }
}

static bool onlyBinary(const core::BinaryBuffer& bin) {
    for (std::size_t i = 0; i < bin.size(); ++i) {
        if (bin[i] != core::BINARY_BLACK && bin[i] != core::BINARY_WHITE) return false;
    }
    return true;
}

static void testThresholdIdempotent() {
    render::ThresholdDitherer ditherer;
    auto first = ditherer.dither(checkerboard(16, 9), 128);

    core::GrayBuffer again(first.width(), first.height());
    for (std::size_t i = 0; i < first.size(); ++i) again[i] = first[i];
    auto second = ditherer.dither(std::move(again), 128);

    bool same = true;
    for (std::size_t i = 0; i < first.size(); ++i) {
        if (first[i] != second[i]) same = false;
    }
    ASSERT_TRUE(same, "threshold dither of a binary image is unchanged");
}

static void testThresholdBoundary() {
    render::ThresholdDitherer ditherer;
    core::GrayBuffer gray(3, 1);
    gray[0] = 127.0f;
    gray[1] = 128.0f;
    gray[2] = 129.0f;
    auto out = ditherer.dither(std::move(gray), 128);
    ASSERT_EQ(out[0], core::BINARY_BLACK, "below threshold is black");
    ASSERT_EQ(out[1], core::BINARY_WHITE, "at threshold is white");
    ASSERT_EQ(out[2], core::BINARY_WHITE, "above threshold is white");
}

static void testCheckerboard() {
    render::ThresholdDitherer ditherer;
    auto out = ditherer.dither(checkerboard(10, 10), 128);
    bool exact = true;
    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            const auto expected = ((x + y) % 2 == 0) ? core::BINARY_BLACK : core::BINARY_WHITE;
            if (out.at(x, y) != expected) exact = false;
        }
    }
    ASSERT_TRUE(exact, "threshold reproduces checkerboard");
}

static void testDiffusionPreservesMean() {
    render::FloydSteinbergDitherer fs;
    auto fsOut = fs.dither(flat(128, 128, 128.0f), 128);
    ASSERT_TRUE(onlyBinary(fsOut), "floyd-steinberg output is binary");
    ASSERT_NEAR(mean(fsOut), 128.0, 2.0, "floyd-steinberg mean tracks flat gray");

    auto fsDark = fs.dither(flat(128, 128, 64.0f), 128);
    ASSERT_NEAR(mean(fsDark), 64.0, 2.0, "floyd-steinberg mean tracks dark gray");

    render::AtkinsonDitherer atkinson;
    auto atkOut = atkinson.dither(flat(128, 128, 128.0f), 128);
    ASSERT_TRUE(onlyBinary(atkOut), "atkinson output is binary");
    ASSERT_NEAR(mean(atkOut), 128.0, 2.0, "atkinson mean tracks flat gray");
}

static void testFloydSteinbergGolden() {
    render::FloydSteinbergDitherer fs;

    // Single row: nothing below, so only the 7/16 share travels.
    auto row = fs.dither(grid(4, 1, {100, 100, 100, 100}), 128);
    expectGrid(row, {0, 255, 0, 0}, "fs single row");

    // Negative accumulated error at (2,0) is read clamped to 0.
    auto out = fs.dither(grid(4, 3, {
        176, 176,  16, 240,
        160, 176, 160,  96,
        128, 160,  16, 176}), 128);
    expectGrid(out, {
        255, 255,   0, 255,
          0, 255,   0, 255,
        255,   0,   0, 255}, "fs 4x3");
}

static void testAtkinsonGolden() {
    render::AtkinsonDitherer atkinson;

    // Single row: only the two right-hand eighths land.
    auto row = atkinson.dither(grid(4, 1, {100, 100, 100, 100}), 128);
    expectGrid(row, {0, 0, 0, 255}, "atkinson single row");

    // Three rows so the (0,+2) neighbour is exercised.
    auto out = atkinson.dither(grid(4, 3, {
        208, 144,  80, 160,
        224, 224, 192, 128,
          0, 208, 144, 160}), 128);
    expectGrid(out, {
        255, 255,   0, 255,
        255, 255, 255,   0,
          0, 255, 255,   0}, "atkinson 4x3");
}

static void testOrderedGolden() {
    render::OrderedBayerDitherer ordered;

    // Mid gray: black exactly where the matrix entry is below 8.
    auto half = ordered.dither(flat(4, 4, 128.0f), 128);
    expectGrid(half, {
          0, 255,   0, 255,
        255,   0, 255,   0,
          0, 255,   0, 255,
        255,   0, 255,   0}, "ordered mid gray");

    // Per cell: gray + m*16 == threshold + 128 is white, one level lower is black.
    const auto& m = render::OrderedBayerDitherer::BAYER_4X4;
    core::GrayBuffer atCut(4, 4);
    core::GrayBuffer belowCut(4, 4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            const int cell = m[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
            atCut.at(x, y) = static_cast<float>(255 - cell * 16);
            belowCut.at(x, y) = static_cast<float>(254 - cell * 16);
        }
    }
    auto white = ordered.dither(std::move(atCut), 127);
    auto black = ordered.dither(std::move(belowCut), 127);
    bool allWhite = true;
    bool allBlack = true;
    for (std::size_t i = 0; i < 16; ++i) {
        if (white[i] != core::BINARY_WHITE) allWhite = false;
        if (black[i] != core::BINARY_BLACK) allBlack = false;
    }
    ASSERT_TRUE(allWhite, "ordered cut-off is inclusive of white");
    ASSERT_TRUE(allBlack, "ordered one level under the cut-off is black");
}

static void testOrderedHistoryFree() {
    render::OrderedBayerDitherer ordered;

    // A pixel's output must not depend on what came before it in scan order.
    core::GrayBuffer left(8, 8, 100.0f);
    core::GrayBuffer right(8, 8, 100.0f);
    for (int y = 0; y < 8; ++y) {
        for (int x = 0; x < 4; ++x) right.at(x, y) = 250.0f;
    }
    auto a = ordered.dither(std::move(left), 128);
    auto b = ordered.dither(std::move(right), 128);

    bool same = true;
    for (int y = 0; y < 8; ++y) {
        for (int x = 4; x < 8; ++x) {
            if (a.at(x, y) != b.at(x, y)) same = false;
        }
    }
    ASSERT_TRUE(same, "ordered output ignores preceding pixels");

    // And it repeats with period 4 on a flat field.
    bool periodic = true;
    for (int y = 0; y < 4; ++y) {
        for (int x = 0; x < 4; ++x) {
            if (a.at(x, y) != a.at(x + 4, y + 4)) periodic = false;
        }
    }
    ASSERT_TRUE(periodic, "ordered output tiles every 4 pixels");

    auto half = ordered.dither(flat(64, 64, 128.0f), 128);
    ASSERT_NEAR(mean(half), 127.5, 0.5, "ordered mid gray is half black");
}

static void testAllWhitePipeline() {
    core::RgbBuffer rgb(100, 50, 0xFF);
    auto gray = render::adjustContrastBrightness(render::toGrayscale(std::move(rgb)), 1.0f, 0.0f);

    for (auto mode : ALL_MODES) {
        auto ditherer = render::makeDitherer(mode);
        ASSERT_TRUE(ditherer->mode() == mode, "factory returns requested mode");
        auto out = ditherer->dither(gray.clone(), 128);
        ASSERT_EQ(out.width(), 100, "width preserved");
        ASSERT_EQ(out.height(), 50, "height preserved");

        // Ordered mode: 255 + 0 < 256 at matrix-0 cells, one dot per 4x4 tile.
        bool matches = true;
        for (int y = 0; y < out.height(); ++y) {
            for (int x = 0; x < out.width(); ++x) {
                const bool dot = mode == core::DitherMode::OrderedBayer && x % 4 == 0 && y % 4 == 0;
                const auto expected = dot ? core::BINARY_BLACK : core::BINARY_WHITE;
                if (out.at(x, y) != expected) matches = false;
            }
        }
        ASSERT_TRUE(matches, core::toString(mode));
    }
}

static void testDeterministic() {
    for (auto mode : ALL_MODES) {
        auto ditherer = render::makeDitherer(mode);
        core::GrayBuffer gradient(32, 8);
        for (int y = 0; y < 8; ++y) {
            for (int x = 0; x < 32; ++x) gradient.at(x, y) = static_cast<float>(x * 8);
        }
        auto a = ditherer->dither(gradient.clone(), 128);
        auto b = ditherer->dither(std::move(gradient), 128);
        bool same = true;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) same = false;
        }
        ASSERT_TRUE(same, core::toString(mode));
    }
}

int main() {
    testThresholdIdempotent();
    testThresholdBoundary();
    testCheckerboard();
    testDiffusionPreservesMean();
    testFloydSteinbergGolden();
    testAtkinsonGolden();
    testOrderedGolden();
    testOrderedHistoryFree();
    testAllWhitePipeline();
    testDeterministic();
    return testing::report("Ditherer");
}
