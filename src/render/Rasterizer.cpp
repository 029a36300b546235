#include "thermo/render/Rasterizer.hpp"

#include "thermo/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace thermo::render {

namespace {
const log::Channel LOG{"Rasterizer"};
}

Rasterizer::Rasterizer(int supersample)
: factor(std::clamp(supersample, 1, config::MAX_SUPERSAMPLE)) {}

JobResult<RasterTarget> Rasterizer::computeTarget(const document::PageSize& native, int targetWidth) {
    if (native.width <= 0 || native.height <= 0) {
        return unexpected(JobError::render("page has no area (" + std::to_string(native.width) +
                                           "x" + std::to_string(native.height) + ")"));
    }
    if (targetWidth <= 0) {
        return unexpected(JobError::render("target width must be positive"));
    }

    RasterTarget target;
    target.width = targetWidth;
    target.scale = static_cast<double>(targetWidth) / static_cast<double>(native.width);
    target.height = static_cast<int>(std::lround(static_cast<double>(native.height) * target.scale));
    if (target.height <= 0) {
        return unexpected(JobError::render("page scales to zero height"));
    }
    return target;
}

JobResult<core::RgbBuffer> Rasterizer::rasterize(document::PageRenderer& renderer,
                                                 int pageIndex,
                                                 int targetWidth) const {
    auto native = renderer.pageDimensions(pageIndex);
    if (!native) {
        return unexpected(native.error());
    }

    auto target = computeTarget(*native, targetWidth);
    if (!target) {
        return unexpected(JobError::render("page " + std::to_string(pageIndex + 1) + ": " +
                                           target.error().message));
    }

    core::RgbBuffer canvas(target->width * factor, target->height * factor, 0xFF);
    if (auto rendered = renderer.renderPage(pageIndex, canvas); !rendered) {
        LOG.error("page ", pageIndex + 1, " failed: ", rendered.error().message);
        return unexpected(rendered.error());
    }

    LOG.info("page ", pageIndex + 1, " ", native->width, "x", native->height,
             " -> ", target->width, "x", target->height, " (x", factor, ")");

    if (factor == 1) {
        return std::move(canvas);
    }
    return downsampleBox(canvas, factor);
}

core::RgbBuffer downsampleBox(const core::RgbBuffer& src, int factor) {
    if (factor <= 1) {
        return src.clone();
    }

    const int outW = src.width() / factor;
    const int outH = src.height() / factor;
    core::RgbBuffer out(outW, outH);
    const unsigned area = static_cast<unsigned>(factor * factor);

    for (int y = 0; y < outH; ++y) {
        for (int x = 0; x < outW; ++x) {
            unsigned sum[3] = {0, 0, 0};
            for (int dy = 0; dy < factor; ++dy) {
                for (int dx = 0; dx < factor; ++dx) {
                    const std::size_t base = src.offset(x * factor + dx, y * factor + dy);
                    sum[0] += src[base];
                    sum[1] += src[base + 1];
                    sum[2] += src[base + 2];
                }
            }
            const std::size_t dst = out.offset(x, y);
            for (int c = 0; c < 3; ++c) {
                out[dst + static_cast<std::size_t>(c)] =
                    static_cast<std::uint8_t>((sum[c] + area / 2) / area);
            }
        }
    }
    return out;
}

} // namespace thermo::render
