#include "thermo/core/PrintSettings.hpp"

namespace thermo::core {

const char* toString(MediaSensing mode) {
    switch (mode) {
        case MediaSensing::Gap:        return "gap";
        case MediaSensing::BlackMark:  return "black-mark";
        case MediaSensing::Continuous: return "continuous";
    }
    return "unknown";
}

const char* toString(DitherMode mode) {
    switch (mode) {
        case DitherMode::Threshold:      return "threshold";
        case DitherMode::FloydSteinberg: return "floyd-steinberg";
        case DitherMode::Atkinson:       return "atkinson";
        case DitherMode::OrderedBayer:   return "ordered-bayer";
    }
    return "unknown";
}

} // namespace thermo::core
