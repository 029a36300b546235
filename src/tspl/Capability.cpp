#include "thermo/tspl/Capability.hpp"

#include "thermo/config/PrinterConfig.hpp"
#include "thermo/log/Log.hpp"

#include <algorithm>

namespace thermo::tspl {

namespace {
const log::Channel LOG{"TsplEncoder"};
}

int deviceSpeedForLevel(int level) {
    const int last = static_cast<int>(config::SPEED_VALUES.size()) - 1;
    return config::SPEED_VALUES[static_cast<std::size_t>(std::clamp(level, 0, last))];
}

int deviceDensityForLevel(int level) {
    if (level < 0 || level >= static_cast<int>(config::DENSITY_VALUES.size())) {
        return config::DENSITY_FALLBACK;
    }
    return config::DENSITY_VALUES[static_cast<std::size_t>(level)];
}

NegotiatedCapabilities negotiate(const core::PrintSettings& settings,
                                 const transport::TransportCapabilities& caps) {
    NegotiatedCapabilities out;

    const int speed = deviceSpeedForLevel(settings.speedLevel);
    if (caps.supportsSpeed(speed)) {
        out.speed = supported(speed);
    } else {
        out.speed = unsupported("speed " + std::to_string(speed));
        LOG.error("speed ", speed, " not supported by printer, keeping device default");
    }

    const int density = deviceDensityForLevel(settings.darknessLevel);
    if (caps.supportsDensity(density)) {
        out.density = supported(density);
    } else {
        out.density = unsupported("density " + std::to_string(density));
        LOG.error("density ", density, " not supported by printer, keeping device default");
    }

    switch (settings.media) {
        case core::MediaSensing::Continuous:
            out.media = {MediaDirective::Reference, 0, 0};
            break;
        case core::MediaSensing::BlackMark:
            if (caps.blackMarkSensing) {
                out.media = {MediaDirective::BlackMark,
                             config::BLACK_MARK_HEIGHT_MM,
                             config::BLACK_MARK_OFFSET_MM};
            } else {
                out.media = {MediaDirective::Gap, 0, 0};
                LOG.error("black-mark sensing not supported by printer, falling back to zero gap");
            }
            break;
        case core::MediaSensing::Gap:
        default:
            out.media = {MediaDirective::Gap, config::LABEL_GAP_MM, 0};
            break;
    }

    switch (caps.bitmap) {
        case transport::BitmapSignature::Extended:
            out.bitmap = supported(transport::BitmapSignature::Extended);
            break;
        case transport::BitmapSignature::Legacy:
            out.bitmap = supported(transport::BitmapSignature::Legacy);
            LOG.info("extended bitmap transfer unavailable, using legacy signature");
            break;
        case transport::BitmapSignature::None:
            out.bitmap = unsupported("printer accepts no bitmap transfer");
            LOG.error("printer accepts no bitmap transfer");
            break;
    }

    LOG.info("negotiated speed=", out.speed ? std::to_string(*out.speed) : std::string("default"),
             " density=", out.density ? std::to_string(*out.density) : std::string("default"),
             " media=", core::toString(settings.media),
             " bitmap=", out.bitmap ? transport::toString(*out.bitmap) : "none");
    return out;
}

} // namespace thermo::tspl
