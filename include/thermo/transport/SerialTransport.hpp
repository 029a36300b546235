#pragma once

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/io/IoConfig.hpp"
#include "thermo/io/IoService.hpp"
#include "thermo/io/TimeoutConfig.hpp"
#include "thermo/transport/Transport.hpp"

#include <chrono>
#include <memory>

namespace thermo::transport {

struct SerialOptions {
    unsigned int baudRate = config::DEFAULT_BAUD_RATE;
    /// Zero disables the write deadline.
    std::chrono::milliseconds writeTimeout = io::TimeoutConfig::defaultTimeout();
    TransportCapabilities capabilities = TransportCapabilities::full();
};

/**
 * @brief Serial link to a printer (a tty, or an RFCOMM node for Bluetooth SPP).
 *
 * Writes run on the shared I/O service through a strand and are bounded by
 * `SerialOptions::writeTimeout`, so a printer that stops draining its buffer
 * surfaces as `asio::error::timed_out` instead of hanging the worker.
 */
class SerialTransport : public Transport {
public:
    explicit SerialTransport(SerialOptions options = {});
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    expected<void> open(const std::string& devicePath) override;
    expected<void> write(const std::uint8_t* data, std::size_t size) override;
    void close() override;
    bool isOpen() const override { return port_.is_open(); }
    TransportCapabilities capabilities() const override { return options_.capabilities; }

    const SerialOptions& options() const { return options_; }

private:
    std::error_code configurePort();

    SerialOptions options_;
    std::shared_ptr<io::asio::io_context> io_;
    io::asio::strand<io::asio::io_context::executor_type> strand_;
    io::serial_port port_;
    std::string devicePath_;
};

} // namespace thermo::transport
