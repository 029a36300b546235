#include "thermo/job/PrintService.hpp"

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/io/IoService.hpp"
#include "thermo/log/Log.hpp"

#include <algorithm>
#include <utility>

namespace thermo::job {

namespace {
const log::Channel LOG{"PrintService"};
}

const char* toString(JobStatusKind kind) {
    switch (kind) {
        case JobStatusKind::Started:      return "started";
        case JobStatusKind::PageProgress: return "page-progress";
        case JobStatusKind::Completed:    return "completed";
        case JobStatusKind::Cancelled:    return "cancelled";
        case JobStatusKind::Failed:       return "failed";
    }
    return "unknown";
}

PrintService::PrintService(PrintServiceConfig config, StatusCallback callback,
                           io::asio::any_io_executor statusExecutor)
: config(std::move(config))
, callback(std::move(callback))
, statusExecutor(std::move(statusExecutor)) {}

PrintService::PrintService(PrintServiceConfig config, StatusCallback callback)
: PrintService(std::move(config), std::move(callback), io::ensureIoService().executor()) {}

PrintService::~PrintService() {
    stop();
}

JobResult<JobId> PrintService::submit(JobRequest request) {
    if (request.printerId.empty()) {
        LOG.error("rejected job: no printer selected");
        return unexpected(JobError::rejected("No printer selected"));
    }
    if (!request.document) {
        LOG.error("rejected job for ", request.printerId, ": no document");
        return unexpected(JobError::rejected("Document is empty"));
    }
    PrintJob job;
    job.printerId = std::move(request.printerId);
    job.printerName = std::move(request.printerName);
    job.document = std::move(request.document);
    if (request.settings) {
        job.settings = *request.settings;
    } else if (config.settingsProvider) {
        job.settings = config.settingsProvider();
    }
    if (job.settings.paperWidthMm < config::MIN_PAPER_WIDTH_MM
        || job.settings.paperWidthMm > config::MAX_PAPER_WIDTH_MM) {
        LOG.error("rejected job for ", job.printerId, ": paper width ", job.settings.paperWidthMm, " mm");
        return unexpected(JobError::rejected("Paper width out of range"));
    }

    JobId id = 0;
    {
        // Checked under the queue lock so a concurrent stop() either rejects
        // this job or drains it with a Cancelled status.
        std::lock_guard<std::mutex> lock(mutex);
        if (!running.load(std::memory_order_acquire)) {
            return unexpected(JobError::rejected("Print service is not running"));
        }
        id = nextId++;
        job.id = id;
        LOG.info("queued job ", id, " (", job.document->name(), ") for ",
                 job.printerName.empty() ? job.printerId : job.printerName);
        queue.push_back(std::move(job));
    }
    wake.notify_one();
    return id;
}

bool PrintService::cancel(JobId id) {
    std::unique_lock<std::mutex> lock(mutex);

    auto it = std::find_if(queue.begin(), queue.end(),
                           [id](const PrintJob& job) { return job.id == id; });
    if (it != queue.end()) {
        queue.erase(it);
        lock.unlock();
        LOG.info("job ", id, " cancelled before it started");
        notify({id, JobStatusKind::Cancelled, 0, 0, {}});
        return true;
    }

    if (active && active->job().id == id) {
        active->requestCancel();
        LOG.info("cancel requested for running job ", id);
        return true;
    }
    return false;
}

std::size_t PrintService::pendingJobs() const {
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

void PrintService::wakeWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (active) {
            active->requestCancel();
        }
    }
    wake.notify_all();
}

void PrintService::run() {
    while (running.load(std::memory_order_acquire)) {
        PrintJob job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            wake.wait(lock, [this] {
                return !running.load(std::memory_order_acquire) || !queue.empty();
            });
            if (!running.load(std::memory_order_acquire)) {
                break;
            }
            job = std::move(queue.front());
            queue.pop_front();
        }
        execute(std::move(job));
    }

    std::deque<PrintJob> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex);
        dropped.swap(queue);
    }
    for (const auto& job : dropped) {
        notify({job.id, JobStatusKind::Cancelled, 0, 0, {}});
    }
}

void PrintService::execute(PrintJob job) {
    const JobId id = job.id;
    JobOrchestrator orchestrator(std::move(job), config.rendererFactory,
                                 config.transportFactory, config.orchestrator);

    orchestrator.setStateObserver([this, id](const JobState& state) {
        switch (state.phase) {
            case JobPhase::Started:
                notify({id, JobStatusKind::Started, 0, 0, {}});
                break;
            case JobPhase::Completed:
                notify({id, JobStatusKind::Completed, 0, 0, {}});
                break;
            case JobPhase::Cancelled:
                notify({id, JobStatusKind::Cancelled, 0, 0, {}});
                break;
            case JobPhase::Failed:
                notify({id, JobStatusKind::Failed, 0, 0, state.reason});
                break;
            default:
                break;
        }
    });
    orchestrator.setProgressObserver([this, id](int pagesDone, int pageCount) {
        notify({id, JobStatusKind::PageProgress, pagesDone, pageCount, {}});
    });

    {
        std::lock_guard<std::mutex> lock(mutex);
        active = &orchestrator;
        if (!running.load(std::memory_order_acquire)) {
            orchestrator.requestCancel();
        }
    }

    const JobState result = orchestrator.run();

    {
        std::lock_guard<std::mutex> lock(mutex);
        active = nullptr;
    }
    LOG.info("job ", id, " finished: ", result.describe());
}

void PrintService::notify(JobStatus status) {
    if (!callback) {
        return;
    }
    io::asio::post(statusExecutor, [cb = callback, status = std::move(status)]() {
        cb(status);
    });
}

} // namespace thermo::job
