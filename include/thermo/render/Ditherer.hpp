#pragma once

#include "thermo/core/PixelBuffer.hpp"
#include "thermo/core/PrintSettings.hpp"

#include <array>
#include <memory>

namespace thermo::render {

/**
 * @brief Reduces a grayscale page to black and white.
 *
 * Implementations consume the grayscale buffer (the error-diffusion variants
 * accumulate error into it in place) and return a buffer whose samples are
 * exactly `BINARY_BLACK` or `BINARY_WHITE`. Output is fully determined by the
 * input samples and the threshold.
 */
class Ditherer {
public:
    virtual ~Ditherer() = default;

    virtual core::BinaryBuffer dither(core::GrayBuffer gray, int threshold) const = 0;
    virtual core::DitherMode mode() const = 0;
};

/// Plain cut-off, no error propagation.
class ThresholdDitherer : public Ditherer {
public:
    core::BinaryBuffer dither(core::GrayBuffer gray, int threshold) const override;
    core::DitherMode mode() const override { return core::DitherMode::Threshold; }
};

/// Floyd-Steinberg error diffusion (7/16, 3/16, 5/16, 1/16). Conserves error.
class FloydSteinbergDitherer : public Ditherer {
public:
    core::BinaryBuffer dither(core::GrayBuffer gray, int threshold) const override;
    core::DitherMode mode() const override { return core::DitherMode::FloydSteinberg; }
};

/**
 * @brief Atkinson error diffusion.
 *
 * One eighth of the error goes to each of six neighbours; the remaining
 * quarter is dropped, which keeps highlights open on thermal paper.
 */
class AtkinsonDitherer : public Ditherer {
public:
    core::BinaryBuffer dither(core::GrayBuffer gray, int threshold) const override;
    core::DitherMode mode() const override { return core::DitherMode::Atkinson; }
};

/// Ordered dithering with the 4x4 Bayer matrix. Each pixel is decided from
/// its own value and (x mod 4, y mod 4) only.
class OrderedBayerDitherer : public Ditherer {
public:
    static constexpr std::array<std::array<int, 4>, 4> BAYER_4X4 = {{
        {{ 0,  8,  2, 10}},
        {{12,  4, 14,  6}},
        {{ 3, 11,  1,  9}},
        {{15,  7, 13,  5}}
    }};

    core::BinaryBuffer dither(core::GrayBuffer gray, int threshold) const override;
    core::DitherMode mode() const override { return core::DitherMode::OrderedBayer; }
};

std::unique_ptr<Ditherer> makeDitherer(core::DitherMode mode);

} // namespace thermo::render
