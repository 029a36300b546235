#pragma once

#include <cstdint>
#include <vector>

namespace thermo::transport {

/// Shape of the bitmap-transfer command the link can carry.
enum class BitmapSignature : std::uint8_t {
    Extended = 0, // declared width + compositing mode
    Legacy = 1,   // width taken from the bitmap, overwrite only
    None = 2
};

const char* toString(BitmapSignature signature);

/**
 * @brief What the printer behind a transport accepts.
 *
 * Filled in by the transport (from its model profile or options) and
 * consumed once per job when the encoder negotiates its directives.
 */
struct TransportCapabilities {
    std::vector<int> speeds;    // accepted SPEED values
    std::vector<int> densities; // accepted DENSITY values
    bool blackMarkSensing = true;
    BitmapSignature bitmap = BitmapSignature::Extended;

    bool supportsSpeed(int value) const;
    bool supportsDensity(int value) const;

    /// Every speed 1-5, every density 1-15, black-mark sensing, extended bitmap.
    static TransportCapabilities full();
};

} // namespace thermo::transport
