#include "thermo/render/Ditherer.hpp"

#include <algorithm>
#include <cmath>

namespace thermo::render {

using core::BINARY_BLACK;
using core::BINARY_WHITE;

namespace {

inline int clampThreshold(int threshold) {
    return std::clamp(threshold, 0, 255);
}

// Accumulated error can push a sample outside 0..255; the quantizer reads
// the clamped value and the error is measured from that.
inline float readSample(const core::GrayBuffer& gray, std::size_t idx) {
    return std::clamp(gray[idx], 0.0f, 255.0f);
}

inline float quantize(float value, int threshold) {
    return value < static_cast<float>(threshold) ? 0.0f : 255.0f;
}

inline std::uint8_t toBinary(float quantized) {
    return quantized == 0.0f ? BINARY_BLACK : BINARY_WHITE;
}

} // namespace

core::BinaryBuffer ThresholdDitherer::dither(core::GrayBuffer gray, int threshold) const {
    const int t = clampThreshold(threshold);
    core::BinaryBuffer out(gray.width(), gray.height());
    const std::size_t count = gray.size();
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = gray[i] < static_cast<float>(t) ? BINARY_BLACK : BINARY_WHITE;
    }
    return out;
}

core::BinaryBuffer FloydSteinbergDitherer::dither(core::GrayBuffer gray, int threshold) const {
    const int t = clampThreshold(threshold);
    const int w = gray.width();
    const int h = gray.height();
    const auto stride = static_cast<std::size_t>(w);
    core::BinaryBuffer out(w, h);

    for (int y = 0; y < h; ++y) {
        const bool hasBelow = y + 1 < h;
        for (int x = 0; x < w; ++x) {
            const std::size_t idx = gray.offset(x, y);
            const float oldVal = readSample(gray, idx);
            const float newVal = quantize(oldVal, t);
            const float err = oldVal - newVal;
            gray[idx] = newVal;
            out[idx] = toBinary(newVal);

            if (x + 1 < w)               gray[idx + 1]          += err * 7.0f / 16.0f;
            if (hasBelow && x - 1 >= 0)  gray[idx + stride - 1] += err * 3.0f / 16.0f;
            if (hasBelow)                gray[idx + stride]     += err * 5.0f / 16.0f;
            if (hasBelow && x + 1 < w)   gray[idx + stride + 1] += err * 1.0f / 16.0f;
        }
    }
    return out;
}

core::BinaryBuffer AtkinsonDitherer::dither(core::GrayBuffer gray, int threshold) const {
    const int t = clampThreshold(threshold);
    const int w = gray.width();
    const int h = gray.height();
    const auto stride = static_cast<std::size_t>(w);
    core::BinaryBuffer out(w, h);

    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const std::size_t idx = gray.offset(x, y);
            const float oldVal = readSample(gray, idx);
            const float newVal = quantize(oldVal, t);
            const float err = (oldVal - newVal) / 8.0f;
            out[idx] = toBinary(newVal);

            if (x + 1 < w)                gray[idx + 1]              += err;
            if (x + 2 < w)                gray[idx + 2]              += err;
            if (y + 1 < h && x - 1 >= 0)  gray[idx + stride - 1]     += err;
            if (y + 1 < h)                gray[idx + stride]         += err;
            if (y + 1 < h && x + 1 < w)   gray[idx + stride + 1]     += err;
            if (y + 2 < h)                gray[idx + stride * 2]     += err;
        }
    }
    return out;
}

core::BinaryBuffer OrderedBayerDitherer::dither(core::GrayBuffer gray, int threshold) const {
    const int cutoff = clampThreshold(threshold) + 128;
    const int w = gray.width();
    const int h = gray.height();
    core::BinaryBuffer out(w, h);

    for (int y = 0; y < h; ++y) {
        const auto& row = BAYER_4X4[static_cast<std::size_t>(y % 4)];
        for (int x = 0; x < w; ++x) {
            const std::size_t idx = gray.offset(x, y);
            const int g = static_cast<int>(std::lround(gray[idx]));
            const int bayer = row[static_cast<std::size_t>(x % 4)] * 16;
            out[idx] = (g + bayer) < cutoff ? BINARY_BLACK : BINARY_WHITE;
        }
    }
    return out;
}

std::unique_ptr<Ditherer> makeDitherer(core::DitherMode mode) {
    switch (mode) {
        case core::DitherMode::Threshold:      return std::make_unique<ThresholdDitherer>();
        case core::DitherMode::FloydSteinberg: return std::make_unique<FloydSteinbergDitherer>();
        case core::DitherMode::Atkinson:       return std::make_unique<AtkinsonDitherer>();
        case core::DitherMode::OrderedBayer:   return std::make_unique<OrderedBayerDitherer>();
    }
    return std::make_unique<ThresholdDitherer>();
}

} // namespace thermo::render
