#pragma once

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/core/JobError.hpp"
#include "thermo/core/PixelBuffer.hpp"
#include "thermo/document/PageRenderer.hpp"

namespace thermo::render {

struct RasterTarget {
    int width = 0;
    int height = 0;
    double scale = 0.0;
};

/**
 * @brief Renders document pages at the print head's resolution.
 *
 * Pages are drawn at `supersample` times the target size onto a white canvas
 * and then box-filtered down to the exact target, which keeps thin strokes
 * from banding once the page is dithered.
 */
class Rasterizer {
public:
    explicit Rasterizer(int supersample = config::DEFAULT_SUPERSAMPLE);

    /// target height = round(native height * targetWidth / native width).
    static JobResult<RasterTarget> computeTarget(const document::PageSize& native, int targetWidth);

    JobResult<core::RgbBuffer> rasterize(document::PageRenderer& renderer,
                                         int pageIndex,
                                         int targetWidth) const;

    int supersample() const { return factor; }

private:
    int factor;
};

/// Area-average @p src down by an integer @p factor in both directions.
core::RgbBuffer downsampleBox(const core::RgbBuffer& src, int factor);

} // namespace thermo::render
