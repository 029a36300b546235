#pragma once

#include "thermo/core/JobError.hpp"
#include "thermo/core/PrintSettings.hpp"
#include "thermo/transport/TransportCapabilities.hpp"

#include <string>
#include <utility>

namespace thermo::tspl {

/**
 * @brief Outcome of probing one optional device feature.
 *
 * Holds the device value when supported, or a `CapabilityUnsupported` error
 * describing what is missing. Never escapes the encoder as a job failure.
 */
template <typename T>
using Capability = expected<T, JobError>;

template <typename T>
Capability<T> supported(T value) {
    return Capability<T>(std::move(value));
}

inline unexpected_t<JobError> unsupported(std::string what) {
    return unexpected(JobError{ErrorKind::CapabilityUnsupported, std::move(what)});
}

enum class MediaDirective {
    Gap,       // GAP m mm,n mm
    BlackMark, // BLINE m mm,n mm
    Reference  // REFERENCE x,y (continuous stock)
};

struct MediaStrategy {
    MediaDirective directive = MediaDirective::Gap;
    int first = 0;  // gap / mark height in mm, or reference x
    int second = 0; // offset in mm, or reference y
};

/**
 * @brief Directive choices resolved once per encoder against the link.
 */
struct NegotiatedCapabilities {
    Capability<int> speed = unsupported("not negotiated");
    Capability<int> density = unsupported("not negotiated");
    MediaStrategy media{};
    Capability<transport::BitmapSignature> bitmap = unsupported("not negotiated");
};

/// Speed ordinal 0..4 -> device speed 1..5, clamped.
int deviceSpeedForLevel(int level);

/// Darkness ordinal 0..8 -> device density; out-of-range ordinals map to the mid value.
int deviceDensityForLevel(int level);

NegotiatedCapabilities negotiate(const core::PrintSettings& settings,
                                 const transport::TransportCapabilities& caps);

} // namespace thermo::tspl
