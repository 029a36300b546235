#pragma once

#include <atomic>
#include <thread>

namespace thermo::core {

/**
 * @brief Owns one background thread that runs a virtual `run()` loop.
 *
 * Threading model:
 * - `start()` launches the worker, which calls `run()` until it returns.
 * - `stop()` clears `running`, calls `wakeWorker()` so a loop blocked on a
 *   condition can notice, and joins.
 * - Derived classes must call `stop()` in their own destructor; by the time
 *   the base destructor runs, the derived `run()` is already gone.
 */
class WorkerBase {
public:
    WorkerBase() = default;
    virtual ~WorkerBase();

    WorkerBase(const WorkerBase&) = delete;
    WorkerBase& operator=(const WorkerBase&) = delete;

    /// Start the worker thread. No-op when already running.
    void start();

    /// Request the thread to stop and wait for it to finish.
    void stop();

    bool isRunning() const { return running.load(std::memory_order_acquire); }

protected:
    virtual void run() = 0; // the worker loop

    /// Unblock `run()` after `running` has been cleared.
    virtual void wakeWorker() {}

    std::thread worker;
    std::atomic<bool> running{false};
};

} // namespace thermo::core
