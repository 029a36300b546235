#pragma once

#include "thermo/core/JobError.hpp"
#include "thermo/core/PrintSettings.hpp"
#include "thermo/core/WorkerBase.hpp"
#include "thermo/io/IoConfig.hpp"
#include "thermo/job/JobOrchestrator.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace thermo::job {

enum class JobStatusKind : std::uint8_t {
    Started,
    PageProgress,
    Completed,
    Cancelled,
    Failed
};

const char* toString(JobStatusKind kind);

/// User-facing notification; `page`/`pageCount` are only set for PageProgress.
struct JobStatus {
    JobId jobId = 0;
    JobStatusKind kind = JobStatusKind::Started;
    int page = 0;
    int pageCount = 0;
    std::string message;

    bool isTerminal() const {
        return kind == JobStatusKind::Completed || kind == JobStatusKind::Cancelled
            || kind == JobStatusKind::Failed;
    }
};

using StatusCallback = std::function<void(const JobStatus&)>;

/// Yields the current user preferences; read once per job, at submission.
using SettingsProvider = std::function<core::PrintSettings()>;

struct JobRequest {
    std::string printerId;
    std::string printerName;
    std::shared_ptr<document::DocumentSource> document;
    std::optional<core::PrintSettings> settings; // unset = ask the provider
};

struct PrintServiceConfig {
    OrchestratorConfig orchestrator;
    document::RendererFactory rendererFactory;
    transport::TransportFactory transportFactory;
    SettingsProvider settingsProvider;
};

/**
 * @brief Accepts print jobs and runs them one at a time on a worker thread.
 *
 * Jobs are executed strictly in submission order. Status notifications are
 * posted to the status executor, never invoked on the worker itself, so a
 * slow or re-entrant callback cannot stall a print.
 *
 * Call `start()` before submitting; `stop()` (or destruction) cancels the
 * running job, drops anything still queued and joins the worker.
 */
class PrintService : public core::WorkerBase {
public:
    PrintService(PrintServiceConfig config, StatusCallback callback,
                 io::asio::any_io_executor statusExecutor);

    /// Delivers status on the shared I/O thread.
    PrintService(PrintServiceConfig config, StatusCallback callback);

    ~PrintService() override;

    /**
     * @brief Queue a job.
     *
     * Fails with `ErrorKind::Rejected` when no printer is selected, when no
     * document is given, when the resolved paper width is outside
     * `config::MIN_PAPER_WIDTH_MM..MAX_PAPER_WIDTH_MM`, or when the service
     * is not running. Nothing is queued and no status is emitted on rejection.
     */
    JobResult<JobId> submit(JobRequest request);

    /**
     * @brief Cancel a queued or running job.
     *
     * A queued job is removed and reported Cancelled straight away. A running
     * job stops at its next page boundary. Returns false for unknown or
     * already finished jobs.
     */
    bool cancel(JobId id);

    std::size_t pendingJobs() const;

protected:
    void run() override;
    void wakeWorker() override;

private:
    void execute(PrintJob job);
    void notify(JobStatus status);

    PrintServiceConfig config;
    StatusCallback callback;
    io::asio::any_io_executor statusExecutor;

    mutable std::mutex mutex;
    std::condition_variable wake;
    std::deque<PrintJob> queue;
    JobOrchestrator* active = nullptr; // guarded by mutex
    JobId nextId = 1;
};

} // namespace thermo::job
