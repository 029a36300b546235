#pragma once

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/core/JobError.hpp"
#include "thermo/core/PrintSettings.hpp"
#include "thermo/document/DocumentSource.hpp"
#include "thermo/document/PageRenderer.hpp"
#include "thermo/document/SeekableCopy.hpp"
#include "thermo/job/JobState.hpp"
#include "thermo/transport/Transport.hpp"

#include <atomic>
#include <optional>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace thermo::render {
class Ditherer;
class Rasterizer;
} // namespace thermo::render

namespace thermo::tspl {
class TsplEncoder;
} // namespace thermo::tspl

namespace thermo::job {

using JobId = std::uint64_t;

/// Everything one job needs; settings are already a frozen snapshot.
struct PrintJob {
    JobId id = 0;
    std::string printerId;
    std::string printerName;
    std::shared_ptr<document::DocumentSource> document;
    core::PrintSettings settings;
};

struct OrchestratorConfig {
    std::chrono::milliseconds settleDelay = config::DEFAULT_SETTLE_DELAY;
    int supersample = config::DEFAULT_SUPERSAMPLE;
    int dotsPerMm = config::DOTS_PER_MM;
    std::filesystem::path scratchDir; // empty = system temp directory
};

/// Invoked synchronously on every state change, from the job's thread.
using StateObserver = std::function<void(const JobState& state)>;

/// Invoked after a page has been handed to the transport.
using ProgressObserver = std::function<void(int pagesDone, int pageCount)>;

/**
 * @brief Drives one print job from Queued to a terminal state.
 *
 * Resources are acquired in the order seekable copy, page renderer,
 * transport, and released in the reverse order on every exit path. Each
 * orchestrator owns its own cancel flag, so a cancel aimed at one job never
 * leaks into the next.
 *
 * Cancellation is cooperative and page-granular: the flag is sampled at the
 * top of each Rendering step, so a page already being transmitted completes.
 */
class JobOrchestrator {
public:
    JobOrchestrator(PrintJob job,
                    document::RendererFactory rendererFactory,
                    transport::TransportFactory transportFactory,
                    OrchestratorConfig config = {});
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    void setStateObserver(StateObserver observer) { stateObserver = std::move(observer); }
    void setProgressObserver(ProgressObserver observer) { progressObserver = std::move(observer); }

    /// Runs the job to completion on the calling thread. Call once.
    JobState run();

    /// Safe from any thread.
    void requestCancel() { cancelFlag.store(true, std::memory_order_release); }
    bool cancelRequested() const { return cancelFlag.load(std::memory_order_acquire); }

    const PrintJob& job() const { return printJob; }
    const JobState& state() const { return current; }
    std::size_t pagesTransmitted() const { return transmitted; }

    /// The error behind a Failed state; empty otherwise.
    const std::optional<JobError>& failure() const { return lastError; }

private:
    void transition(JobState next);
    JobState finish(JobState terminal);
    JobState fail(const JobError& error);

    JobResult<void> acquireResources();
    JobState printPages();
    JobResult<void> printPage(int index,
                              render::Rasterizer& rasterizer,
                              const render::Ditherer& ditherer,
                              const tspl::TsplEncoder& encoder);

    /// Transport, renderer, then temp file. Idempotent.
    void releaseResources();

    PrintJob printJob;
    document::RendererFactory rendererFactory;
    transport::TransportFactory transportFactory;
    OrchestratorConfig config;

    StateObserver stateObserver;
    ProgressObserver progressObserver;

    std::atomic<bool> cancelFlag{false};
    JobState current;
    std::size_t transmitted = 0;
    ErrorKind stage = ErrorKind::Document; // kind given to an exception escaping the current step
    std::optional<JobError> lastError;

    document::SeekableCopy seekable;
    std::unique_ptr<document::PageRenderer> renderer;
    std::unique_ptr<transport::Transport> link;
};

} // namespace thermo::job
