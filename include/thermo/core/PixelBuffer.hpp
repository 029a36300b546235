#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace thermo::core {

/**
 * @brief Row-major width x height grid of interleaved samples.
 *
 * Buffers are move-only: each pipeline stage takes its input by value and
 * hands back a freshly owned output, so a buffer is never visible to two
 * stages at once. `clone()` exists for the few places (tests, diagnostics)
 * that genuinely need a second copy.
 */
template <typename Sample, std::size_t Channels>
class PixelBuffer {
public:
    using sample_type = Sample;
    static constexpr std::size_t channels = Channels;

    PixelBuffer() = default;

    PixelBuffer(int width, int height, Sample fill = Sample{})
    : w(width > 0 ? width : 0)
    , h(height > 0 ? height : 0)
    , samples(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * Channels, fill) {}

    PixelBuffer(const PixelBuffer&) = delete;
    PixelBuffer& operator=(const PixelBuffer&) = delete;
    PixelBuffer(PixelBuffer&&) noexcept = default;
    PixelBuffer& operator=(PixelBuffer&&) noexcept = default;

    PixelBuffer clone() const {
        PixelBuffer copy;
        copy.w = w;
        copy.h = h;
        copy.samples = samples;
        return copy;
    }

    int width() const { return w; }
    int height() const { return h; }
    bool empty() const { return samples.empty(); }
    std::size_t pixelCount() const { return static_cast<std::size_t>(w) * static_cast<std::size_t>(h); }

    std::size_t offset(int x, int y) const {
        return (static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x)) * Channels;
    }

    Sample& at(int x, int y, std::size_t channel = 0) { return samples[offset(x, y) + channel]; }
    const Sample& at(int x, int y, std::size_t channel = 0) const { return samples[offset(x, y) + channel]; }

    Sample* data() { return samples.data(); }
    const Sample* data() const { return samples.data(); }
    std::size_t size() const { return samples.size(); }

    Sample& operator[](std::size_t i) { return samples[i]; }
    const Sample& operator[](std::size_t i) const { return samples[i]; }

    void fill(Sample value) { samples.assign(samples.size(), value); }

private:
    int w = 0;
    int h = 0;
    std::vector<Sample> samples;
};

/// Post-raster: 8-bit R, G, B.
using RgbBuffer = PixelBuffer<std::uint8_t, 3>;

/// Post-normalize: float luminance, may leave [0,255] during error diffusion.
using GrayBuffer = PixelBuffer<float, 1>;

/// Post-dither: every sample is exactly 0 (black) or 255 (white).
using BinaryBuffer = PixelBuffer<std::uint8_t, 1>;

constexpr std::uint8_t BINARY_BLACK = 0;
constexpr std::uint8_t BINARY_WHITE = 255;

} // namespace thermo::core
