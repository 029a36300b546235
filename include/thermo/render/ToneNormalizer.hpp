#pragma once

#include "thermo/core/PixelBuffer.hpp"

namespace thermo::render {

/// ITU-R BT.601 luma weights.
constexpr float LUMA_RED = 0.299f;
constexpr float LUMA_GREEN = 0.587f;
constexpr float LUMA_BLUE = 0.114f;

/**
 * @brief Converts an RGB page to float luminance.
 *
 * Consumes @p rgb; the returned buffer has the same dimensions. Inputs are
 * already 0..255 so no clamping is applied.
 */
core::GrayBuffer toGrayscale(core::RgbBuffer rgb);

/**
 * @brief Applies `out = clamp(in * contrast + brightness, 0, 255)`.
 *
 * The transform is applied to the grayscale samples in place and clamped
 * exactly once, after the transform. contrast = 1 and brightness = 0 leave
 * the buffer untouched.
 */
core::GrayBuffer adjustContrastBrightness(core::GrayBuffer gray, float contrast, float brightness);

} // namespace thermo::render
