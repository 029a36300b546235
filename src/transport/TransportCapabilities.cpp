#include "thermo/transport/TransportCapabilities.hpp"

#include "thermo/config/PrinterConfig.hpp"

#include <algorithm>

namespace thermo::transport {

const char* toString(BitmapSignature signature) {
    switch (signature) {
        case BitmapSignature::Extended: return "extended";
        case BitmapSignature::Legacy:   return "legacy";
        case BitmapSignature::None:     return "none";
    }
    return "unknown";
}

bool TransportCapabilities::supportsSpeed(int value) const {
    return std::find(speeds.begin(), speeds.end(), value) != speeds.end();
}

bool TransportCapabilities::supportsDensity(int value) const {
    return std::find(densities.begin(), densities.end(), value) != densities.end();
}

TransportCapabilities TransportCapabilities::full() {
    TransportCapabilities caps;
    caps.speeds.assign(config::SPEED_VALUES.begin(), config::SPEED_VALUES.end());
    for (int d = config::MIN_DEVICE_DENSITY; d <= config::MAX_DEVICE_DENSITY; ++d) {
        caps.densities.push_back(d);
    }
    caps.blackMarkSensing = true;
    caps.bitmap = BitmapSignature::Extended;
    return caps;
}

} // namespace thermo::transport
