#pragma once

#include "thermo/core/JobError.hpp"
#include "thermo/core/PixelBuffer.hpp"

#include <functional>
#include <memory>
#include <string>

namespace thermo::document {

struct PageSize {
    int width = 0;
    int height = 0;
};

/**
 * @brief Random-access page renderer over a seekable local copy of a document.
 *
 * Owned exclusively by the job orchestrator for the duration of one job.
 * `close()` releases the underlying file and must be safe to call twice.
 */
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    virtual int pageCount() const = 0;
    virtual JobResult<PageSize> pageDimensions(int index) const = 0;

    /**
     * @brief Draw page @p index scaled to fill @p canvas.
     *
     * The canvas arrives pre-filled with opaque white; its dimensions are the
     * requested output size. Undecodable pages yield `ErrorKind::Render`.
     */
    virtual JobResult<void> renderPage(int index, core::RgbBuffer& canvas) = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

/// Opens a renderer over the seekable file at the given path.
using RendererFactory =
    std::function<JobResult<std::unique_ptr<PageRenderer>>(const std::string& path)>;

} // namespace thermo::document
