#pragma once

#include <array>
#include <chrono>
#include <cstddef>

namespace thermo::config {

/**
 * @brief Constants that define the label printer and the print pipeline.
 *
 * Keeping the values here prevents magic numbers from drifting across
 * translation units and makes it easy to tune the integration in one place.
 */

// Print head ------------------------------------------------------------------
constexpr int DOTS_PER_MM = 8;            // 203 DPI
constexpr int DEFAULT_PAPER_WIDTH_MM = 78;
constexpr int MIN_PAPER_WIDTH_MM = 1;
constexpr int MAX_PAPER_WIDTH_MM = 120;

// Rendering -------------------------------------------------------------------
constexpr int DEFAULT_SUPERSAMPLE = 2;
constexpr int MAX_SUPERSAMPLE = 4;
constexpr int DEFAULT_THRESHOLD = 128;

// Device parameter tables (ordinal -> device value) ---------------------------
constexpr std::array<int, 5> SPEED_VALUES = {1, 2, 3, 4, 5};
constexpr std::array<int, 9> DENSITY_VALUES = {1, 3, 5, 7, 8, 10, 12, 14, 15};
constexpr int DENSITY_FALLBACK = 10;      // used when the darkness ordinal is out of range
constexpr int MIN_DEVICE_DENSITY = 1;
constexpr int MAX_DEVICE_DENSITY = 15;

// Media sensing ---------------------------------------------------------------
constexpr int LABEL_GAP_MM = 2;
constexpr int BLACK_MARK_HEIGHT_MM = 2;
constexpr int BLACK_MARK_OFFSET_MM = 0;

// Job pacing ------------------------------------------------------------------
constexpr std::chrono::milliseconds DEFAULT_SETTLE_DELAY{500};
constexpr int COPIES_PER_PAGE = 1;

// Serial link -----------------------------------------------------------------
constexpr unsigned int DEFAULT_BAUD_RATE = 115200;
constexpr std::chrono::milliseconds DEFAULT_WRITE_TIMEOUT{30000};

} // namespace thermo::config
