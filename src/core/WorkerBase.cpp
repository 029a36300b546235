#include "thermo/core/WorkerBase.hpp"

namespace thermo::core {

WorkerBase::~WorkerBase() {
    stop();
}

void WorkerBase::start() {
    if (running.exchange(true)) return; // Already running.
    worker = std::thread([this] {
        this->run(); // Calls the virtual run(), so subclass overrides execute.
    });
}

void WorkerBase::stop() {
    running.store(false, std::memory_order_release);
    wakeWorker();
    if (worker.joinable()) {
        worker.join();
    }
}

} // namespace thermo::core
