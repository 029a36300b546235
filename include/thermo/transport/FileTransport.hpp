#pragma once

#include "thermo/transport/Transport.hpp"

#include <fstream>
#include <string>

namespace thermo::transport {

/**
 * @brief Writes printer programs to a file instead of a device.
 *
 * Used for dry runs and for spooling to a path the printer reads from
 * (e.g. `/dev/usb/lp0`). Reports whatever capabilities it was given.
 */
class FileTransport : public Transport {
public:
    explicit FileTransport(TransportCapabilities caps = TransportCapabilities::full());
    ~FileTransport() override;

    expected<void> open(const std::string& path) override;
    expected<void> write(const std::uint8_t* data, std::size_t size) override;
    void close() override;
    bool isOpen() const override { return out.is_open(); }
    TransportCapabilities capabilities() const override { return caps; }

private:
    TransportCapabilities caps;
    std::ofstream out;
    std::string path;
};

} // namespace thermo::transport
