#pragma once

#include <cstdint>

namespace thermo::core {

enum class MediaSensing : std::uint8_t {
    Gap = 0,
    BlackMark = 1,
    Continuous = 2
};

enum class DitherMode : std::uint8_t {
    Threshold = 0,
    FloydSteinberg = 1,
    Atkinson = 2,
    OrderedBayer = 3
};

const char* toString(MediaSensing mode);
const char* toString(DitherMode mode);

/**
 * @brief Snapshot of the user's print configuration for one job.
 *
 * Resolved once when the job is submitted and never re-read mid-job. Levels
 * are user-facing ordinals; the encoder maps them onto device values.
 */
struct PrintSettings {
    int paperWidthMm = 78;
    MediaSensing media = MediaSensing::Gap;
    int darknessLevel = 5;  // 0..8 -> device density 1..15
    int speedLevel = 2;     // 0..4 -> device speed 1..5
    DitherMode dither = DitherMode::FloydSteinberg;
    int threshold = 128;    // 0..255
    float contrast = 1.0f;  // 0.0..2.0, 1.0 = identity
    float brightness = 0.0f; // -128..+128

    int targetPixelWidth(int dotsPerMm) const { return paperWidthMm * dotsPerMm; }
};

} // namespace thermo::core
