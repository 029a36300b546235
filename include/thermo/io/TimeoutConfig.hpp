#pragma once

#include "thermo/config/PrinterConfig.hpp"

#include <chrono>

namespace thermo::io {

/**
 * @brief Process-wide default for blocking transport writes.
 *
 * A stalled printer otherwise blocks the print worker forever. Transports
 * read this when they are constructed; zero disables the deadline.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /** Set the process-wide default timeout (clamped to >= 0). */
    static void setDefault(duration timeout) {
        storage() = sanitize(timeout);
    }

    /** Access the current process-wide default timeout. */
    static duration defaultTimeout() {
        return storage();
    }

    /** RAII helper that temporarily overrides the default timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(storage()) {
            storage() = sanitize(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            storage() = previous_;
        }

    private:
        duration previous_;
    };

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    static duration& storage() {
        static duration timeout{config::DEFAULT_WRITE_TIMEOUT};
        return timeout;
    }
};

} // namespace thermo::io
