#include "thermo/render/ToneNormalizer.hpp"

#include <algorithm>

namespace thermo::render {

core::GrayBuffer toGrayscale(core::RgbBuffer rgb) {
    core::GrayBuffer gray(rgb.width(), rgb.height());
    const std::size_t count = rgb.pixelCount();
    const std::uint8_t* src = rgb.data();
    float* dst = gray.data();

    for (std::size_t i = 0; i < count; ++i, src += 3) {
        dst[i] = LUMA_RED * static_cast<float>(src[0])
               + LUMA_GREEN * static_cast<float>(src[1])
               + LUMA_BLUE * static_cast<float>(src[2]);
    }
    return gray;
}

core::GrayBuffer adjustContrastBrightness(core::GrayBuffer gray, float contrast, float brightness) {
    if (contrast == 1.0f && brightness == 0.0f) {
        return gray;
    }

    float* samples = gray.data();
    const std::size_t count = gray.size();
    for (std::size_t i = 0; i < count; ++i) {
        samples[i] = std::clamp(samples[i] * contrast + brightness, 0.0f, 255.0f);
    }
    return gray;
}

} // namespace thermo::render
