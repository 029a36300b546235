#pragma once
#include "thermo/io/IoConfig.hpp"
#include <thread>
#include <memory>

namespace thermo::io {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Two kinds of work run on this loop:
 * - serial port writes issued by `SerialTransport` (with deadlines), and
 * - job status notifications posted by `PrintService` when the caller did
 *   not supply an executor of its own.
 *
 * Lifetime notes:
 * - Destroy transports and services before the `IoService` so their handlers
 *   complete while the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 *
 * `shared_io_context()` returns the process-wide instance.
 */
class IoService {
public:
    IoService();
    ~IoService();

    IoService(const IoService&) = delete;
    IoService& operator=(const IoService&) = delete;
    IoService(IoService&&) = delete;
    IoService& operator=(IoService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }
    asio::any_io_executor executor() { return io_->get_executor(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

IoService& ensureIoService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace thermo::io
