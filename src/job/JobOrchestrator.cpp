#include "thermo/job/JobOrchestrator.hpp"

#include "thermo/log/Log.hpp"
#include "thermo/render/Ditherer.hpp"
#include "thermo/render/Rasterizer.hpp"
#include "thermo/render/ToneNormalizer.hpp"
#include "thermo/tspl/TsplEncoder.hpp"

#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace thermo::job {

namespace {
const log::Channel LOG{"JobOrchestrator"};
}

JobOrchestrator::JobOrchestrator(PrintJob job,
                                 document::RendererFactory rendererFactory,
                                 transport::TransportFactory transportFactory,
                                 OrchestratorConfig config)
: printJob(std::move(job))
, rendererFactory(std::move(rendererFactory))
, transportFactory(std::move(transportFactory))
, config(std::move(config)) {}

JobOrchestrator::~JobOrchestrator() {
    releaseResources();
}

JobState JobOrchestrator::run() {
    if (current.phase != JobPhase::Queued) {
        LOG.error("job ", printJob.id, " already ran; state is ", current.describe());
        return current;
    }

    transition(JobState::started());
    LOG.info("job ", printJob.id, " started for printer ", printJob.printerId);

    try {
        if (auto acquired = acquireResources(); !acquired) {
            return fail(acquired.error());
        }
        return printPages();
    } catch (const std::exception& e) {
        return fail(JobError{stage, std::string("Unexpected failure: ") + e.what()});
    }
}

void JobOrchestrator::transition(JobState next) {
    if (!isValidTransition(current, next)) {
        LOG.error("job ", printJob.id, ": rejected transition ",
                  current.describe(), " -> ", next.describe());
        return;
    }
    current = std::move(next);
    if (stateObserver) {
        stateObserver(current);
    }
}

JobState JobOrchestrator::finish(JobState terminal) {
    releaseResources();
    transition(std::move(terminal));
    return current;
}

JobState JobOrchestrator::fail(const JobError& error) {
    LOG.error("job ", printJob.id, " failed: ", error.describe());
    lastError = error;
    return finish(JobState::failed(error.message));
}

JobResult<void> JobOrchestrator::acquireResources() {
    stage = ErrorKind::Document;
    if (!printJob.document) {
        return unexpected(JobError::document("Document is empty"));
    }

    std::filesystem::path scratch = config.scratchDir;
    if (scratch.empty()) {
        std::error_code ec;
        scratch = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return unexpected(JobError::fromErrorCode(
                ErrorKind::Document, "No scratch directory for document copy", ec));
        }
    }

    auto copy = document::SeekableCopy::create(*printJob.document, scratch);
    if (!copy) {
        return unexpected(copy.error());
    }
    seekable = std::move(*copy);
    // The caller's source has been fully drained; nothing reads it again.
    printJob.document.reset();

    if (!rendererFactory) {
        return unexpected(JobError::document("No page renderer configured"));
    }
    auto opened = rendererFactory(seekable.path().string());
    if (!opened) {
        return unexpected(opened.error());
    }
    renderer = std::move(*opened);
    if (!renderer) {
        return unexpected(JobError::document("Cannot open document: " + seekable.path().string()));
    }

    stage = ErrorKind::Transport;
    link = transportFactory ? transportFactory() : nullptr;
    if (!link) {
        return unexpected(JobError::transport("Cannot connect to printer: " + printJob.printerId));
    }
    if (auto ok = link->open(printJob.printerId); !ok) {
        return unexpected(JobError::fromErrorCode(
            ErrorKind::Transport, "Cannot connect to printer: " + printJob.printerId, ok.error()));
    }
    return {};
}

JobState JobOrchestrator::printPages() {
    stage = ErrorKind::Document;
    const int pageCount = renderer->pageCount();
    if (pageCount <= 0) {
        return fail(JobError::document("Document has no pages"));
    }

    const auto ditherer = render::makeDitherer(printJob.settings.dither);
    render::Rasterizer rasterizer(config.supersample);
    const tspl::TsplEncoder encoder(printJob.settings, link->capabilities(), config.dotsPerMm);

    LOG.info("job ", printJob.id, ": ", pageCount, " page(s), dither ",
             core::toString(printJob.settings.dither), ", media ",
             core::toString(printJob.settings.media));

    for (int page = 0; page < pageCount; ++page) {
        if (cancelRequested()) {
            LOG.info("job ", printJob.id, " cancelled after ", transmitted, " page(s)");
            return finish(JobState::cancelled());
        }

        transition(JobState::rendering(page));
        if (auto printed = printPage(page, rasterizer, *ditherer, encoder); !printed) {
            return fail(printed.error());
        }

        ++transmitted;
        if (progressObserver) {
            progressObserver(page + 1, pageCount);
        }

        // The printer needs time to feed and cut before the next label.
        if (config.settleDelay.count() > 0) {
            std::this_thread::sleep_for(config.settleDelay);
        }
    }

    LOG.info("job ", printJob.id, " completed, ", transmitted, " page(s)");
    return finish(JobState::completed());
}

JobResult<void> JobOrchestrator::printPage(int index,
                                           render::Rasterizer& rasterizer,
                                           const render::Ditherer& ditherer,
                                           const tspl::TsplEncoder& encoder) {
    const auto& settings = printJob.settings;

    stage = ErrorKind::Render;
    auto raster = rasterizer.rasterize(*renderer, index, settings.targetPixelWidth(config.dotsPerMm));
    if (!raster) {
        return unexpected(raster.error());
    }

    auto gray = render::adjustContrastBrightness(render::toGrayscale(std::move(*raster)),
                                                 settings.contrast, settings.brightness);
    auto binary = ditherer.dither(std::move(gray), settings.threshold);

    stage = ErrorKind::Encode;
    auto program = encoder.encode(std::move(binary));
    if (!program) {
        return unexpected(program.error());
    }

    transition(JobState::transmitting(index));
    stage = ErrorKind::Transport;
    if (auto written = link->write(program->data(), program->size()); !written) {
        return unexpected(JobError::fromErrorCode(
            ErrorKind::Transport,
            "Write to printer " + printJob.printerId + " failed on page " + std::to_string(index + 1),
            written.error()));
    }
    return {};
}

void JobOrchestrator::releaseResources() {
    if (link) {
        link->close();
        link.reset();
    }
    if (renderer) {
        renderer->close();
        renderer.reset();
    }
    seekable.release();
}

} // namespace thermo::job
