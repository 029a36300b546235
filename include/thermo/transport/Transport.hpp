#pragma once

#include "thermo/core/Expected.hpp"
#include "thermo/transport/TransportCapabilities.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace thermo::transport {

using thermo::expected;

/**
 * @brief Byte pipe to one printer.
 *
 * Implementations own the link for as long as they are open. `close()` is
 * idempotent and never fails; `write()` blocks until the bytes are handed to
 * the operating system or the link reports an error.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual expected<void> open(const std::string& address) = 0;
    virtual expected<void> write(const std::uint8_t* data, std::size_t size) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /// What the printer on the other end accepts; stable while open.
    virtual TransportCapabilities capabilities() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;

} // namespace thermo::transport
